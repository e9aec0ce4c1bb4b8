#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include "context.hpp"
#include "retry.hpp"
#include "span.hpp"

namespace wary {

/**
 * @brief What kind of expectation the input failed
 */
enum class ErrorKind : uint8_t {
    invalid,         ///< Semantically wrong data
    expected_value,  ///< An exact literal was expected
    expected_length, ///< A length bound was not met
    expected_valid   ///< A named, structured value was expected
};

/**
 * @brief Coarse error taxonomy used by callers deciding what to do next
 */
enum class ErrorClass : uint8_t {
    invalid,  ///< Fatal, the data is wrong
    expected, ///< Fatal, a specific token or value did not match
    retryable ///< Not yet fatal, the input is a prefix of something possibly valid
};

/**
 * @brief Get string representation of an error kind
 */
[[nodiscard]] constexpr const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::invalid:
            return "invalid";
        case ErrorKind::expected_value:
            return "expected value";
        case ErrorKind::expected_length:
            return "expected length";
        case ErrorKind::expected_valid:
            return "expected valid";
    }
    return "unknown";
}

/**
 * @brief Error produced by a failed parse operation
 *
 * Contains everything needed to decide how to react (fatal or retry) and to
 * render a diagnostic against the root input:
 * - the kind of failure and a static description of what was expected
 * - the span of the offending bytes within the root input
 * - for expected_value, the literal that was expected
 * - for expected_length, the length bounds
 * - the retry requirement (none for fatal errors)
 * - the context frames added by enclosing Reader::context scopes
 *
 * Only the context chain may allocate, and only when WARY_ENABLE_FULL_CONTEXT
 * is 1. With the minimal chain an Error is a fixed-size value.
 *
 * @note The literal of an expected_value error is a view. Readers are given
 *       string literals or caller-owned buffers that outlive the parse.
 */
class Error {
public:
    /// Semantically invalid data
    static Error invalid(Span span, const char* description, const char* operation) noexcept {
        Error err(ErrorKind::invalid, span, operation);
        err.expected_ = description;
        return err;
    }

    /// A structured value was expected but could not be produced
    static Error expected_valid(Span span, const char* expected, const char* operation,
                                RetryRequirement retry = RetryRequirement::none()) noexcept {
        Error err(ErrorKind::expected_valid, span, operation);
        err.expected_ = expected;
        err.retry_ = retry;
        return err;
    }

    /// An exact literal was expected; span covers the bytes found instead
    static Error expected_value(Span span, std::span<const uint8_t> literal, const char* operation,
                                RetryRequirement retry = RetryRequirement::none()) noexcept {
        Error err(ErrorKind::expected_value, span, operation);
        err.expected_ = "exact value";
        err.literal_ = literal;
        err.retry_ = retry;
        return err;
    }

    /**
     * @brief A length bound was not met
     *
     * @param span Bytes that were available (or that were left over)
     * @param min Minimum length expected
     * @param max Maximum length expected, if bounded
     */
    static Error expected_length(Span span, std::size_t min, std::optional<std::size_t> max,
                                 const char* expected, const char* operation,
                                 RetryRequirement retry = RetryRequirement::none()) noexcept {
        Error err(ErrorKind::expected_length, span, operation);
        err.expected_ = expected;
        err.min_ = min;
        err.max_ = max;
        err.retry_ = retry;
        return err;
    }

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// Coarse taxonomy: invalid, expected, or retryable
    [[nodiscard]] ErrorClass classify() const noexcept {
        if (retry_.is_retryable()) {
            return ErrorClass::retryable;
        }
        return kind_ == ErrorKind::invalid ? ErrorClass::invalid : ErrorClass::expected;
    }

    /// Bytes the failure refers to, relative to the root input
    [[nodiscard]] Span span() const noexcept { return span_; }

    /// The terminal failure is always the innermost span
    [[nodiscard]] Span innermost_span() const noexcept { return span_; }

    /// The primitive operation that failed (e.g. "take", "consume")
    [[nodiscard]] const char* operation() const noexcept { return operation_; }

    /// What was expected, or the reason the data is invalid
    [[nodiscard]] const char* expected() const noexcept { return expected_; }

    /// Literal that was expected (expected_value only)
    [[nodiscard]] std::span<const uint8_t> expected_literal() const noexcept { return literal_; }

    [[nodiscard]] std::size_t min_length() const noexcept { return min_; }

    [[nodiscard]] std::optional<std::size_t> max_length() const noexcept { return max_; }

    [[nodiscard]] RetryRequirement retry_requirement() const noexcept { return retry_; }

    [[nodiscard]] bool is_fatal() const noexcept { return retry_.is_fatal(); }

    [[nodiscard]] bool is_retryable() const noexcept { return retry_.is_retryable(); }

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the failure
     */
    [[nodiscard]] const char* message() const noexcept {
        switch (kind_) {
            case ErrorKind::invalid:
                return expected_;
            case ErrorKind::expected_value:
                return "found a different value to the exact expected";
            case ErrorKind::expected_length:
                return max_.has_value() && span_.size() > *max_ ? "found more input than expected"
                                                                : "found less input than expected";
            case ErrorKind::expected_valid:
                return "found an invalid value";
        }
        return "invalid input";
    }

    /**
     * @brief Write the full description (message plus the details it has)
     *
     * e.g. "found 1 byte when at least 2 bytes was expected"
     */
    void describe(std::ostream& os) const {
        switch (kind_) {
            case ErrorKind::invalid:
                os << expected_;
                return;
            case ErrorKind::expected_value:
                os << "found a different value to the exact expected";
                return;
            case ErrorKind::expected_valid:
                os << "expected " << expected_;
                return;
            case ErrorKind::expected_length:
                break;
        }
        os << "found " << span_.size() << (span_.size() == 1 ? " byte" : " bytes") << " when ";
        if (max_.has_value()) {
            if (min_ == 0) {
                os << "at most " << *max_;
            } else if (min_ == *max_) {
                os << "exactly " << min_;
            } else {
                os << "at least " << min_ << " and at most " << *max_;
            }
        } else {
            os << "at least " << min_;
        }
        std::size_t shown = max_.has_value() && min_ == 0 ? *max_ : min_;
        os << (shown == 1 ? " byte" : " bytes") << " was expected";
    }

    // ========================================================================
    // Context chain
    // ========================================================================

    /**
     * @brief Record an enclosing operation
     *
     * Called by Reader::context as the error propagates outward, so the first
     * frame pushed is the innermost one. A no-op with the minimal chain.
     */
    Error& with_context(const ContextFrame& frame) {
        context_.push(frame);
        return *this;
    }

    /// Frames, outermost first. Borrows this error.
    [[nodiscard]] FrameRange frames() const noexcept {
        return FrameRange{context_, ContextFrame{operation_, expected_, span_}};
    }

    [[nodiscard]] const ContextChain& context() const noexcept { return context_; }

    /// Number of frames frames() yields (at least 1)
    [[nodiscard]] std::size_t depth() const noexcept { return frames().size(); }

    /// Span of the outermost recorded frame, or of the failure itself
    [[nodiscard]] Span outermost_span() const noexcept { return frames().outermost().span; }

    /// Override the retry requirement (e.g. when the input is known to be bound)
    Error& set_retry_requirement(RetryRequirement retry) noexcept {
        retry_ = retry;
        return *this;
    }

private:
    Error(ErrorKind kind, Span span, const char* operation) noexcept
        : kind_(kind),
          span_(span),
          operation_(operation) {}

    ErrorKind kind_;
    Span span_;
    const char* operation_;
    const char* expected_ = "valid input";
    std::span<const uint8_t> literal_{};
    std::size_t min_ = 0;
    std::optional<std::size_t> max_{};
    RetryRequirement retry_{};
    ContextChain context_{};
};

inline std::ostream& operator<<(std::ostream& os, const Error& err) {
    os << "error attempting to " << err.operation() << ": ";
    err.describe(os);
    return os;
}

} // namespace wary
