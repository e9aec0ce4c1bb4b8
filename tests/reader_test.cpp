#include <array>
#include <optional>
#include <stdexcept>
#include <string_view>

#include <cstdint>
#include <gtest/gtest.h>
#include <wary.hpp>

using namespace wary;

class ReaderTest : public ::testing::Test {
protected:
    static Reader<Bytes> reader_over(std::string_view s, Bound bound = Bound::start) {
        return Reader<Bytes>(input(s, bound));
    }

    static RetryRequirement exact(std::size_t n) { return RetryRequirement::exact(n); }
};

// ==============================================================================
// Length-based Primitives
// ==============================================================================

TEST_F(ReaderTest, TakeAdvances) {
    auto r = reader_over("abcdef");
    auto head = r.take(2);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->to_string(), "ab");
    EXPECT_EQ(head->span(), (Span{0, 2}));
    EXPECT_EQ(r.position(), 2u);
    EXPECT_EQ(r.remaining(), 4u);
}

TEST_F(ReaderTest, PeekDoesNotAdvance) {
    auto r = reader_over("abc");
    auto p = r.peek(3);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->to_string(), "abc");
    EXPECT_EQ(r.position(), 0u);
}

TEST_F(ReaderTest, ShortTakeIsRetryableAndLeavesCursor) {
    auto r = reader_over("abc");
    ASSERT_TRUE(r.skip(1).has_value());
    auto result = r.take(5);
    ASSERT_FALSE(result.has_value());
    const auto& err = result.error();
    EXPECT_EQ(err.kind(), ErrorKind::expected_length);
    EXPECT_EQ(err.min_length(), 5u);
    EXPECT_EQ(err.span(), (Span{1, 3}));
    EXPECT_EQ(r.position(), 1u);
    if (config::retry) {
        EXPECT_EQ(err.retry_requirement(), exact(3));
    }
}

TEST_F(ReaderTest, ShortTakeOnBoundInputIsFatal) {
    auto r = reader_over("abc", Bound::both);
    auto result = r.take(5);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_fatal());
}

TEST_F(ReaderTest, TakeRemainingConsumesAll) {
    auto r = reader_over("xyz");
    ASSERT_TRUE(r.skip(1).has_value());
    EXPECT_EQ(r.take_remaining().to_string(), "yz");
    EXPECT_TRUE(r.at_end());
    EXPECT_TRUE(r.take_remaining().empty());
}

TEST_F(ReaderTest, ZeroLengthTakeAtEndSucceeds) {
    auto r = reader_over("");
    auto result = r.take(0);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

// ==============================================================================
// Integers
// ==============================================================================

TEST_F(ReaderTest, ReadsBigAndLittleEndian) {
    const std::array<uint8_t, 14> buffer{0x12, 0x34, 0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF,
                                         0x01, 0x02, 0x03, 0x04, 0x05, 0x06};
    Reader<Bytes> r(input(buffer));
    EXPECT_EQ(r.read_u16_be(), uint16_t{0x1234});
    EXPECT_EQ(r.read_u16_le(), uint16_t{0x3412});
    EXPECT_EQ(r.read_u32_be(), uint32_t{0xDEADBEEF});
    EXPECT_EQ(r.read_u8(), uint8_t{0x01});
    EXPECT_EQ(r.peek_u8(), uint8_t{0x02});
    EXPECT_EQ(r.read_u32_le(), uint32_t{0x05040302});
    EXPECT_EQ(r.remaining(), 1u);
}

TEST_F(ReaderTest, Reads64Bit) {
    const std::array<uint8_t, 8> buffer{1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(Reader<Bytes>(input(buffer)).read_u64_be(), uint64_t{0x0102030405060708});
    EXPECT_EQ(Reader<Bytes>(input(buffer)).read_u64_le(), uint64_t{0x0807060504030201});
}

TEST_F(ReaderTest, ShortIntegerIsRetryableExact) {
    const std::array<uint8_t, 3> buffer{1, 2, 3};
    Reader<Bytes> r(input(buffer));
    auto result = r.read_u32_be();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(r.position(), 0u);
    if (config::retry) {
        EXPECT_EQ(result.error().retry_requirement(), exact(1));
    }
}

TEST_F(ReaderTest, ReadU8AtEnd) {
    auto r = reader_over("");
    auto result = r.read_u8();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().span(), Span::at(0));
}

// ==============================================================================
// Predicates and Scans
// ==============================================================================

TEST_F(ReaderTest, TakeWhileStopsAtFirstMismatch) {
    auto r = reader_over("2024-01");
    auto digits = r.take_while(ByteSet::range('0', '9'));
    EXPECT_EQ(digits.to_string(), "2024");
    EXPECT_EQ(r.position(), 4u);
    EXPECT_EQ(r.skip_while([](uint8_t b) { return b == '-'; }), 1u);
    EXPECT_EQ(r.take_while([](uint8_t) { return false; }).size(), 0u);
}

TEST_F(ReaderTest, TakeWhileToEndOfUnboundInputStaysUnbound) {
    auto r = reader_over("123");
    auto digits = r.take_while(ByteSet::range('0', '9'));
    EXPECT_EQ(digits.size(), 3u);
    EXPECT_FALSE(digits.is_bound());
}

TEST_F(ReaderTest, ByteSetOnTextNeverMatchesNonAscii) {
    // U+0130 has low byte 0x30 ('0'), which must not count as a digit
    auto t = text("\xC4\xB0" "1");
    ASSERT_TRUE(t.has_value());
    Reader<Text> r(*t);
    EXPECT_EQ(r.take_while(ByteSet::range('0', '9')).size(), 0u);
    EXPECT_EQ(r.position(), 0u);

    auto ascii = text("42\xC4\xB0");
    ASSERT_TRUE(ascii.has_value());
    Reader<Text> digits(*ascii);
    EXPECT_EQ(digits.take_while(ByteSet::range('0', '9')).to_string(), "42");
}

TEST_F(ReaderTest, TakeUntilLeavesNeedle) {
    auto r = reader_over("name: value\r\n");
    auto key = r.take_until(": ");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->to_string(), "name");
    EXPECT_TRUE(r.peek_eq(": "));

    ASSERT_TRUE(r.skip(2).has_value());
    auto value = r.take_until_consume("\r\n");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->to_string(), "value");
    EXPECT_TRUE(r.at_end());
}

TEST_F(ReaderTest, TakeUntilByte) {
    auto r = reader_over("a,b");
    auto first = r.take_until(uint8_t{','});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->to_string(), "a");
    ASSERT_TRUE(r.skip_until(uint8_t{'b'}).has_value());
    EXPECT_EQ(r.position(), 2u);
}

TEST_F(ReaderTest, TakeUntilMissingIsRetryableUnknown) {
    auto r = reader_over("no terminator");
    auto result = r.take_until("\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(r.position(), 0u);
    EXPECT_EQ(result.error().span(), (Span{0, 13}));
    if (config::retry) {
        EXPECT_TRUE(result.error().retry_requirement().is_unknown());
    }

    auto bound = reader_over("no terminator", Bound::both);
    EXPECT_TRUE(bound.take_until("\n").error().is_fatal());
}

// ==============================================================================
// Exact Values
// ==============================================================================

TEST_F(ReaderTest, ConsumeMatchingLiteral) {
    auto r = reader_over("GET /");
    ASSERT_TRUE(r.consume("GET").has_value());
    ASSERT_TRUE(r.consume(uint8_t{' '}).has_value());
    EXPECT_EQ(r.position(), 4u);
}

TEST_F(ReaderTest, ConsumeMismatchIsFatal) {
    auto r = reader_over("ax");
    auto result = r.consume("abc");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), ErrorKind::expected_value);
    EXPECT_TRUE(result.error().is_fatal());
    EXPECT_EQ(result.error().expected_literal().size(), 3u);
    EXPECT_EQ(r.position(), 0u);
}

TEST_F(ReaderTest, ConsumeOnStrictPrefixIsRetryable) {
    auto r = reader_over("ab");
    auto result = r.consume("abc");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().span(), (Span{0, 2}));
    if (config::retry) {
        EXPECT_EQ(result.error().retry_requirement(), exact(1));
    }
}

TEST_F(ReaderTest, ConsumeByteMismatch) {
    auto r = reader_over("x");
    auto result = r.consume(uint8_t{'y'});
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(result.error().expected_literal().size(), 1u);
    EXPECT_EQ(result.error().expected_literal()[0], uint8_t{'y'});
}

// ==============================================================================
// Expectations
// ==============================================================================

TEST_F(ReaderTest, ExpectConvertsNulloptToExpectedValid) {
    auto r = reader_over("ab");
    auto result = r.expect("digit", [](Reader<Bytes>& br) -> std::optional<int> {
        auto b = br.read_u8();
        if (!b || *b < '0' || *b > '9') {
            return std::nullopt;
        }
        return *b - '0';
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), ErrorKind::expected_valid);
    EXPECT_STREQ(result.error().expected(), "digit");
    EXPECT_EQ(result.error().span(), (Span{0, 1}));
    EXPECT_EQ(r.position(), 0u);
}

TEST_F(ReaderTest, ExpectErasedKeepsRetry) {
    auto r = reader_over("1");
    auto result = r.expect_erased("pair of digits", [](Reader<Bytes>& br) { return br.take(2); });
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().expected(), "pair of digits");
    if (config::retry) {
        EXPECT_EQ(result.error().retry_requirement(), exact(1));
    }
}

// ==============================================================================
// Fallible Scans and Consumed Input
// ==============================================================================

TEST_F(ReaderTest, TryTakeWhileStopsOnFalse) {
    auto r = reader_over("abc;d");
    auto word = r.try_take_while([](uint8_t b) -> ParseResult<bool> { return b != ';'; });
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(word->to_string(), "abc");
    EXPECT_EQ(r.position(), 3u);
}

TEST_F(ReaderTest, TryTakeWhileErrorKeepsCursor) {
    auto r = reader_over("ab\x01" "cd");
    auto result = r.try_take_while([](uint8_t b) -> ParseResult<bool> {
        if (b < 0x20) {
            return fail(Error::invalid(Span{}, "control byte", "check byte"));
        }
        return true;
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().message(), "control byte");
    EXPECT_EQ(r.position(), 0u);
    if (config::full_context) {
        EXPECT_STREQ(result.error().frames().outermost().operation, "try take while");
        EXPECT_EQ(result.error().frames().outermost().span, (Span{0, 3}));
    }
}

TEST_F(ReaderTest, TryTakeWhileOnText) {
    auto t = text("\xC3\xA9\xC3\xA9x");
    ASSERT_TRUE(t.has_value());
    Reader<Text> r(*t);
    auto run = r.try_take_while([](char32_t c) -> ParseResult<bool> { return c == U'\u00E9'; });
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->size(), 4u);
    EXPECT_EQ(run->char_count(), 2u);
}

TEST_F(ReaderTest, TakeConsumedReturnsWhatFRead) {
    auto r = reader_over("key=value;");
    auto key = r.take_consumed([](Reader<Bytes>& br) -> ParseResult<void> {
        br.skip_while([](uint8_t b) { return b != '='; });
        return br.consume("=");
    });
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->to_string(), "key=");
    EXPECT_EQ(key->span(), (Span{0, 4}));
    EXPECT_TRUE(key->is_bound());

    auto value = r.take_consumed(
        [](Reader<Bytes>& br) { br.skip_while([](uint8_t b) { return b != ';'; }); });
    EXPECT_EQ(value.to_string(), "value");
    EXPECT_EQ(r.position(), 9u);
}

TEST_F(ReaderTest, TakeConsumedFailureKeepsCursor) {
    auto r = reader_over("ab");
    auto result = r.take_consumed([](Reader<Bytes>& br) -> ParseResult<void> {
        if (auto a = br.consume("a"); !a) {
            return a;
        }
        return br.consume("x");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().span(), (Span{1, 2}));
    EXPECT_EQ(r.position(), 0u);
}

// ==============================================================================
// Checkpoints
// ==============================================================================

TEST_F(ReaderTest, CheckpointRestore) {
    auto r = reader_over("abcdef");
    auto cp = r.checkpoint();
    ASSERT_TRUE(r.skip(4).has_value());
    EXPECT_EQ(r.span_since(cp), (Span{0, 4}));
    r.restore(cp);
    EXPECT_EQ(r.position(), 0u);
    EXPECT_EQ(r.here(), Span::at(0));
}

TEST_F(ReaderTest, RestoreBeyondInputThrows) {
    auto r = reader_over("ab");
    EXPECT_THROW(r.restore(Reader<Bytes>::Checkpoint{3}), std::out_of_range);
}

// ==============================================================================
// Text Readers
// ==============================================================================

TEST_F(ReaderTest, TextTakeChar) {
    auto t = text("\xC3\xA9t\xC3\xA9");
    ASSERT_TRUE(t.has_value());
    Reader<Text> r(*t);
    EXPECT_EQ(r.peek_char(), U'é');
    EXPECT_EQ(r.take_char(), U'é');
    EXPECT_EQ(r.position(), 2u);
    auto word = r.take_while([](char32_t c) { return c != U'é'; });
    EXPECT_EQ(word.as_string_view(), "t");
}

TEST_F(ReaderTest, TextTakeInsideCodePointFails) {
    auto t = text("\xE2\x82\xAC");
    ASSERT_TRUE(t.has_value());
    Reader<Text> r(*t);
    auto result = r.take(1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind(), ErrorKind::invalid);
    EXPECT_EQ(r.position(), 0u);
    EXPECT_TRUE(r.take(3).has_value());
}

// ==============================================================================
// Input Entry Points
// ==============================================================================

TEST_F(ReaderTest, ReadAllRequiresFullConsumption) {
    auto ok = input("ab").read_all([](auto& r) { return r.read_u16_be(); });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, uint16_t{0x6162});

    auto trailing = input("abc").read_all([](auto& r) { return r.read_u16_be(); });
    ASSERT_FALSE(trailing.has_value());
    EXPECT_EQ(trailing.error().kind(), ErrorKind::expected_length);
    EXPECT_EQ(trailing.error().span(), (Span{2, 3}));
    EXPECT_EQ(trailing.error().max_length(), std::optional<std::size_t>{0});
    EXPECT_TRUE(trailing.error().is_fatal());
}

TEST_F(ReaderTest, ReadAllAddsContext) {
    auto result = input("a").read_all([](auto& r) { return r.read_u16_be(); });
    ASSERT_FALSE(result.has_value());
    EXPECT_STREQ(result.error().frames().outermost().operation,
                 config::full_context ? "read all" : "read big-endian integer");
}

TEST_F(ReaderTest, ReadPartialReturnsRemainder) {
    auto result = input("abcd").read_partial([](auto& r) { return r.read_u8(); });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->first, uint8_t{'a'});
    EXPECT_EQ(result->second.to_string(), "bcd");
    EXPECT_EQ(result->second.origin(), 1u);

    auto rest = input("abcd").read_partial([](auto& r) { return r.skip(3); });
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->to_string(), "d");
}
