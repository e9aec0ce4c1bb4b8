#include <sstream>

#include <gtest/gtest.h>
#include <wary.hpp>

using namespace wary;

class RetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!config::retry) {
            GTEST_SKIP() << "retry capability disabled";
        }
    }
};

// ==============================================================================
// Factories
// ==============================================================================

TEST_F(RetryTest, DefaultIsFatal) {
    RetryRequirement r;
    EXPECT_TRUE(r.is_fatal());
    EXPECT_FALSE(r.is_retryable());
    EXPECT_EQ(r, RetryRequirement::none());
    EXPECT_EQ(r.continue_after(), 0u);
}

TEST_F(RetryTest, ExactZeroCollapsesToNone) {
    EXPECT_EQ(RetryRequirement::exact(0), RetryRequirement::none());
}

TEST_F(RetryTest, ExactCarriesShortfall) {
    auto r = RetryRequirement::exact(5);
    EXPECT_TRUE(r.is_retryable());
    EXPECT_TRUE(r.is_exact());
    EXPECT_EQ(r.additional(), 5u);
    EXPECT_EQ(r.continue_after(), 5u);
}

TEST_F(RetryTest, UnknownNeedsAtLeastOneByte) {
    auto r = RetryRequirement::unknown();
    EXPECT_TRUE(r.is_unknown());
    EXPECT_TRUE(r.is_retryable());
    EXPECT_EQ(r.continue_after(), 1u);
}

TEST_F(RetryTest, FromHadAndNeeded) {
    EXPECT_EQ(RetryRequirement::from_had_and_needed(1, 4), RetryRequirement::exact(3));
    EXPECT_EQ(RetryRequirement::from_had_and_needed(4, 4), RetryRequirement::none());
    EXPECT_EQ(RetryRequirement::from_had_and_needed(9, 4), RetryRequirement::none());
}

// ==============================================================================
// combine()
// ==============================================================================

TEST_F(RetryTest, CombineWithNoneIsNone) {
    auto none = RetryRequirement::none();
    EXPECT_EQ(combine(none, none), none);
    EXPECT_EQ(combine(none, RetryRequirement::exact(3)), none);
    EXPECT_EQ(combine(RetryRequirement::exact(3), none), none);
    EXPECT_EQ(combine(none, RetryRequirement::unknown()), none);
    EXPECT_EQ(combine(RetryRequirement::unknown(), none), none);
}

TEST_F(RetryTest, CombineExactKeepsLarger) {
    EXPECT_EQ(combine(RetryRequirement::exact(2), RetryRequirement::exact(7)),
              RetryRequirement::exact(7));
    EXPECT_EQ(combine(RetryRequirement::exact(7), RetryRequirement::exact(2)),
              RetryRequirement::exact(7));
}

TEST_F(RetryTest, CombineUnknownAbsorbsExact) {
    EXPECT_EQ(combine(RetryRequirement::exact(2), RetryRequirement::unknown()),
              RetryRequirement::unknown());
    EXPECT_EQ(combine(RetryRequirement::unknown(), RetryRequirement::exact(2)),
              RetryRequirement::unknown());
    EXPECT_EQ(combine(RetryRequirement::unknown(), RetryRequirement::unknown()),
              RetryRequirement::unknown());
}

TEST_F(RetryTest, StreamOutput) {
    std::ostringstream os;
    os << RetryRequirement::exact(3) << " " << RetryRequirement::unknown() << " "
       << RetryRequirement::none();
    EXPECT_EQ(os.str(), "exact(3) unknown none");
}

// ==============================================================================
// Retry capability disabled
// ==============================================================================

TEST(RetryDisabledTest, EveryFactoryIsFatal) {
    if (config::retry) {
        GTEST_SKIP() << "retry capability enabled";
    }
    EXPECT_EQ(RetryRequirement::exact(5), RetryRequirement::none());
    EXPECT_EQ(RetryRequirement::unknown(), RetryRequirement::none());
    EXPECT_EQ(RetryRequirement::from_had_and_needed(1, 4), RetryRequirement::none());

    auto short_read = input("a").read_all([](auto& r) { return r.read_u16_be(); });
    ASSERT_FALSE(short_read.has_value());
    EXPECT_TRUE(short_read.error().is_fatal());
    EXPECT_EQ(short_read.error().classify(), ErrorClass::expected);
}
