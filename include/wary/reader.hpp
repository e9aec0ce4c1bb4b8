#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "detail/fast_scan.hpp"
#include "detail/utf8.hpp"
#include "error_policy.hpp"
#include "input.hpp"
#include "parse_result.hpp"

namespace wary {

using detail::ByteSet;

/// Byte order for integer reads
enum class Endian : uint8_t { big, little };

namespace detail {

// Backing storage for single-byte literals, so an expected_value error for
// consume(byte) can reference its literal after consume returns.
inline constexpr std::array<uint8_t, 256> byte_literals = [] {
    std::array<uint8_t, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = static_cast<uint8_t>(i);
    }
    return table;
}();

template <typename T>
struct is_parse_result : std::false_type {};

template <typename T>
struct is_parse_result<expected<T, Error>> : std::true_type {};

template <typename T>
inline constexpr bool is_parse_result_v = is_parse_result<std::remove_cvref_t<T>>::value;

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

/**
 * @brief Pick the error to report when every branch of an alternation failed
 *
 * - a fatal error beats a retryable one (the data is deterministically wrong
 *   for that branch);
 * - between two fatal errors, the one that reached further into the input
 *   wins, the first on a tie;
 * - two retryable errors keep the first, with the requirements combined.
 */
[[nodiscard]] inline Error merge_branch_errors(Error first, Error second) {
    if (first.is_fatal() != second.is_fatal()) {
        return first.is_fatal() ? std::move(first) : std::move(second);
    }
    if (first.is_fatal()) {
        return second.span().end > first.span().end ? std::move(second) : std::move(first);
    }
    first.set_retry_requirement(combine(first.retry_requirement(), second.retry_requirement()));
    return first;
}

/**
 * @brief Mutable cursor over an input
 *
 * The reader is the only thing that advances through input. Every primitive
 * either succeeds and advances, or fails and leaves the cursor where it was.
 *
 * Errors are produced with spans relative to the root input. Running out of
 * input yields a retryable error unless the input is bound.
 *
 * A reader is a cheap value (input view + cursor). Copying it creates an
 * independent checkpoint cursor; try_read, try_optional and alt use this to
 * backtrack without any rollback bookkeeping. Readers are not meant to be
 * shared between threads.
 *
 * Usage:
 * @code
 *   auto result = wary::input(bytes).read_all([](auto& r) -> wary::ParseResult<Header> {
 *       return r.context("read header", [](auto& r) -> wary::ParseResult<Header> {
 *           auto magic = r.consume("VRT");
 *           if (!magic) return wary::fail(magic.error());
 *           auto len = r.read_u16_be();
 *           if (!len) return wary::fail(len.error());
 *           return Header{*len};
 *       });
 *   });
 * @endcode
 *
 * @tparam InputT Bytes or Text
 */
template <typename InputT>
class Reader {
public:
    using input_type = InputT;
    using token_type = typename InputT::token_type;

    static constexpr bool is_text = InputT::is_text;

    /// Saved cursor position, see checkpoint() / restore()
    struct Checkpoint {
        std::size_t cursor = 0;
    };

    explicit Reader(InputT input) noexcept : input_(input) {}

    // ========================================================================
    // Position
    // ========================================================================

    /// Bytes consumed so far
    [[nodiscard]] std::size_t position() const noexcept { return cursor_; }

    /// Bytes left
    [[nodiscard]] std::size_t remaining() const noexcept { return input_.size() - cursor_; }

    [[nodiscard]] bool at_end() const noexcept { return cursor_ == input_.size(); }

    /// The whole input this reader was created over
    [[nodiscard]] const InputT& input() const noexcept { return input_; }

    /// Unread input (does not advance)
    [[nodiscard]] InputT rest() const noexcept { return input_.slice(cursor_, input_.size()); }

    /// Empty span at the cursor, relative to the root input
    [[nodiscard]] Span here() const noexcept { return Span::at(absolute(cursor_)); }

    /// Span from a checkpoint to the cursor
    [[nodiscard]] Span span_since(Checkpoint cp) const noexcept {
        return Span{absolute(std::min(cp.cursor, cursor_)), absolute(cursor_)};
    }

    [[nodiscard]] Checkpoint checkpoint() const noexcept { return Checkpoint{cursor_}; }

    /**
     * @brief Move the cursor back (or forward) to a saved position
     * @throws std::out_of_range if the checkpoint lies beyond this reader's input
     */
    void restore(Checkpoint cp) {
        if (cp.cursor > input_.size()) {
            throw std::out_of_range("wary::Reader::restore: checkpoint beyond input");
        }
        cursor_ = cp.cursor;
    }

    // ========================================================================
    // Length-based primitives
    // ========================================================================

    /**
     * @brief Next n bytes, without advancing
     *
     * Fails retryable exact(n - remaining()) when fewer than n bytes remain.
     * For Text, fails invalid if byte n would split a code point.
     */
    [[nodiscard]] ParseResult<InputT> peek(std::size_t n) const {
        if (n > remaining()) {
            return fail(short_input(n, "peek"));
        }
        if (!input_.is_boundary(cursor_ + n)) {
            return fail(mid_char(cursor_ + n, "peek"));
        }
        return input_.slice(cursor_, cursor_ + n);
    }

    /// peek(n), then advance past the bytes
    ParseResult<InputT> take(std::size_t n) {
        if (n > remaining()) {
            return fail(short_input(n, "take"));
        }
        if (!input_.is_boundary(cursor_ + n)) {
            return fail(mid_char(cursor_ + n, "take"));
        }
        auto out = input_.slice(cursor_, cursor_ + n);
        cursor_ += n;
        return out;
    }

    ParseResult<void> skip(std::size_t n) {
        if (n > remaining()) {
            return fail(short_input(n, "skip"));
        }
        if (!input_.is_boundary(cursor_ + n)) {
            return fail(mid_char(cursor_ + n, "skip"));
        }
        cursor_ += n;
        return {};
    }

    /// Consume everything left
    InputT take_remaining() noexcept {
        auto out = rest();
        cursor_ = input_.size();
        return out;
    }

    // ========================================================================
    // Bytes primitives
    // ========================================================================

    [[nodiscard]] ParseResult<uint8_t> peek_u8() const
        requires(!is_text)
    {
        if (at_end()) {
            return fail(short_input(1, "peek u8"));
        }
        return input_.as_bytes()[cursor_];
    }

    ParseResult<uint8_t> read_u8()
        requires(!is_text)
    {
        if (at_end()) {
            return fail(short_input(1, "read u8"));
        }
        return input_.as_bytes()[cursor_++];
    }

    /**
     * @brief Read a fixed-width unsigned integer
     *
     * Decodes byte by byte, so it is independent of host byte order and
     * alignment.
     */
    template <std::unsigned_integral T>
    ParseResult<T> read_int(Endian order)
        requires(!is_text)
    {
        constexpr std::size_t width = sizeof(T);
        if (remaining() < width) {
            return fail(short_input(width, order == Endian::big ? "read big-endian integer"
                                                                : "read little-endian integer"));
        }
        auto bytes = input_.as_bytes().subspan(cursor_, width);
        T value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            std::size_t index = order == Endian::big ? i : width - 1 - i;
            if constexpr (width > 1) {
                value = static_cast<T>(value << 8);
            }
            value = static_cast<T>(value | bytes[index]);
        }
        cursor_ += width;
        return value;
    }

    ParseResult<uint16_t> read_u16_be() requires(!is_text) { return read_int<uint16_t>(Endian::big); }
    ParseResult<uint16_t> read_u16_le() requires(!is_text) { return read_int<uint16_t>(Endian::little); }
    ParseResult<uint32_t> read_u32_be() requires(!is_text) { return read_int<uint32_t>(Endian::big); }
    ParseResult<uint32_t> read_u32_le() requires(!is_text) { return read_int<uint32_t>(Endian::little); }
    ParseResult<uint64_t> read_u64_be() requires(!is_text) { return read_int<uint64_t>(Endian::big); }
    ParseResult<uint64_t> read_u64_le() requires(!is_text) { return read_int<uint64_t>(Endian::little); }

    // ========================================================================
    // Text primitives
    // ========================================================================

    /// Next code point without advancing
    [[nodiscard]] ParseResult<char32_t> peek_char() const
        requires(is_text)
    {
        if (at_end()) {
            return fail(short_input(1, "peek char"));
        }
        return detail::utf8_decode(input_.as_bytes().subspan(cursor_)).value;
    }

    ParseResult<char32_t> take_char()
        requires(is_text)
    {
        if (at_end()) {
            return fail(short_input(1, "read char"));
        }
        auto decoded = detail::utf8_decode(input_.as_bytes().subspan(cursor_));
        cursor_ += decoded.len;
        return decoded.value;
    }

    // ========================================================================
    // Predicate primitives (never fail)
    // ========================================================================

    /**
     * @brief Advance past the longest prefix whose tokens satisfy pred
     *
     * Never fails. Consumes nothing when the first token does not match, and
     * everything when all remaining tokens match.
     */
    template <typename Pred>
    InputT take_while(Pred&& pred) {
        auto head = rest().split_prefix(std::forward<Pred>(pred)).first;
        cursor_ += head.size();
        return head;
    }

    template <typename Pred>
    std::size_t skip_while(Pred&& pred) {
        return take_while(std::forward<Pred>(pred)).size();
    }

    /**
     * @brief take_while with a predicate that may fail
     *
     * pred returns ParseResult<bool>. The first error stops the scan, gains a
     * "try take while" frame and is returned with the cursor unchanged.
     */
    template <typename Pred>
    ParseResult<InputT> try_take_while(Pred&& pred) {
        static_assert(std::is_same_v<std::invoke_result_t<Pred&, token_type>, ParseResult<bool>>,
                      "try_take_while() requires a predicate returning ParseResult<bool>");
        const auto bytes = input_.as_bytes();
        std::size_t pos = cursor_;
        while (pos < input_.size()) {
            token_type token{};
            std::size_t len = 1;
            if constexpr (is_text) {
                auto decoded = detail::utf8_decode(bytes.subspan(pos));
                token = decoded.value;
                len = decoded.len == 0 ? 1 : decoded.len;
            } else {
                token = bytes[pos];
            }
            auto keep = std::invoke(pred, token);
            if (!keep) {
                Error err = std::move(keep).error();
                Span inner = err.outermost_span();
                Span attempt{std::min(absolute(cursor_), inner.start),
                             std::max(absolute(pos + len), inner.end)};
                err.with_context(ContextFrame{"try take while", nullptr, attempt});
                return fail(std::move(err));
            }
            if (!*keep) {
                break;
            }
            pos += len;
        }
        auto out = input_.slice(cursor_, pos);
        cursor_ = pos;
        return out;
    }

    /**
     * @brief Run f and return the input it consumed
     *
     * f may return a ParseResult (its value is discarded) or nothing. A failing
     * f leaves the cursor where it was.
     */
    template <typename F>
    auto take_consumed(F&& f) {
        using R = std::invoke_result_t<F, Reader&>;
        const std::size_t start = cursor_;
        if constexpr (detail::is_parse_result_v<R>) {
            auto result = try_read(std::forward<F>(f));
            if (!result) {
                return ParseResult<InputT>(unexpect, std::move(result).error());
            }
            return ParseResult<InputT>(input_.slice(std::min(start, cursor_), cursor_));
        } else {
            std::invoke(std::forward<F>(f), *this);
            return input_.slice(std::min(start, cursor_), cursor_);
        }
    }

    // ========================================================================
    // Scanning primitives (fast-scan backed)
    // ========================================================================

    /**
     * @brief Advance up to (not past) the first occurrence of needle
     *
     * Fails retryable unknown when the needle does not occur before the end of
     * the input, since more input could still contain it.
     *
     * @return The input before the needle
     */
    ParseResult<InputT> take_until(std::string_view needle) {
        return scan_to(rest().find(needle), 0, "take until");
    }

    ParseResult<InputT> take_until(uint8_t needle)
        requires(!is_text)
    {
        return scan_to(rest().find(needle), 0, "take until");
    }

    /// take_until, then also consume the needle
    ParseResult<InputT> take_until_consume(std::string_view needle) {
        return scan_to(rest().find(needle), needle.size(), "take until consume");
    }

    ParseResult<InputT> take_until_consume(uint8_t needle)
        requires(!is_text)
    {
        return scan_to(rest().find(needle), 1, "take until consume");
    }

    ParseResult<void> skip_until(std::string_view needle) {
        return scan_to(rest().find(needle), 0, "skip until").map([](const InputT&) {});
    }

    ParseResult<void> skip_until(uint8_t needle)
        requires(!is_text)
    {
        return scan_to(rest().find(needle), 0, "skip until").map([](const InputT&) {});
    }

    // ========================================================================
    // Exact values
    // ========================================================================

    /// True if the unread input starts with literal
    [[nodiscard]] bool peek_eq(std::string_view literal) const noexcept {
        return rest().starts_with(literal);
    }

    [[nodiscard]] bool peek_eq(uint8_t byte) const noexcept
        requires(!is_text)
    {
        return !at_end() && input_.as_bytes()[cursor_] == byte;
    }

    /**
     * @brief Consume an exact literal
     *
     * Fails fatal expected_value if the unread input can never start with the
     * literal, retryable exact(missing) if the unread input is a strict prefix
     * of it.
     *
     * @note The error references literal; pass string literals or buffers that
     *       outlive the error.
     */
    ParseResult<void> consume(std::span<const uint8_t> literal) {
        auto available = rest().as_bytes();
        std::size_t n = std::min(available.size(), literal.size());
        bool prefix_matches = std::equal(literal.begin(), literal.begin() + n, available.begin());
        if (!prefix_matches || n < literal.size()) {
            auto retry = prefix_matches
                             ? when_more(RetryRequirement::from_had_and_needed(n, literal.size()))
                             : RetryRequirement::none();
            return fail(Error::expected_value(Span::sized(absolute(cursor_), n), literal,
                                              "consume", retry));
        }
        if (!input_.is_boundary(cursor_ + literal.size())) {
            return fail(mid_char(cursor_ + literal.size(), "consume"));
        }
        cursor_ += literal.size();
        return {};
    }

    ParseResult<void> consume(std::string_view literal) {
        return consume(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(literal.data()),
                                                literal.size()));
    }

    ParseResult<void> consume(uint8_t byte)
        requires(!is_text)
    {
        return consume(std::span<const uint8_t>(&detail::byte_literals[byte], 1));
    }

    // ========================================================================
    // Expectations
    // ========================================================================

    /**
     * @brief Run f on a branch; a nullopt result becomes expected_valid
     *
     * f is called with a Reader& and returns std::optional<T>. On nullopt the
     * error spans what f consumed before giving up and the cursor is left
     * unchanged.
     */
    template <typename F>
    auto expect(const char* expected, F&& f)
        -> ParseResult<typename std::invoke_result_t<F, Reader&>::value_type> {
        static_assert(detail::is_optional<std::invoke_result_t<F, Reader&>>::value,
                      "expect() requires a function returning std::optional");
        Reader branch = *this;
        auto value = std::invoke(std::forward<F>(f), branch);
        if (!value) {
            return fail(Error::expected_valid(Span{absolute(cursor_), absolute(branch.cursor_)},
                                              expected, "expect"));
        }
        cursor_ = branch.cursor_;
        return std::move(*value);
    }

    /**
     * @brief Run f on a branch; any failure becomes expected_valid
     *
     * The nested error's detail and context are replaced by the expectation,
     * but its retry requirement is kept (a truncated value is still
     * retryable).
     */
    template <typename F>
    auto expect_erased(const char* expected, F&& f) -> std::invoke_result_t<F, Reader&> {
        static_assert(detail::is_parse_result_v<std::invoke_result_t<F, Reader&>>,
                      "expect_erased() requires a function returning ParseResult");
        Reader branch = *this;
        auto result = std::invoke(std::forward<F>(f), branch);
        if (!result) {
            const Error& inner = result.error();
            Span span{absolute(cursor_), std::max(inner.span().end, absolute(branch.cursor_))};
            return fail(Error::expected_valid(span, expected, "expect",
                                              when_more(inner.retry_requirement())));
        }
        cursor_ = branch.cursor_;
        return result;
    }

    // ========================================================================
    // Backtracking
    // ========================================================================

    /**
     * @brief Speculative sub-parse
     *
     * Runs f on a copy of this reader. On success the copy's cursor is
     * committed; on failure this reader is left exactly where it was and the
     * error is returned.
     */
    template <typename F>
    auto try_read(F&& f) -> std::invoke_result_t<F, Reader&> {
        static_assert(detail::is_parse_result_v<std::invoke_result_t<F, Reader&>>,
                      "try_read() requires a function returning ParseResult");
        Reader branch = *this;
        auto result = std::invoke(std::forward<F>(f), branch);
        if (result) {
            cursor_ = branch.cursor_;
        }
        return result;
    }

    /**
     * @brief Optional sub-parse
     *
     * A fatal failure is converted into nullopt (with full backtrack). A
     * retryable failure is propagated: with more input the value might be
     * present, so absence cannot be decided yet.
     */
    template <typename F>
    auto try_optional(F&& f)
        -> ParseResult<std::optional<typename std::invoke_result_t<F, Reader&>::value_type>> {
        using T = typename std::invoke_result_t<F, Reader&>::value_type;
        auto result = try_read(std::forward<F>(f));
        if (result) {
            return std::optional<T>(std::move(*result));
        }
        if (result.error().is_retryable()) {
            return fail(std::move(result).error());
        }
        return std::optional<T>{};
    }

    /**
     * @brief Sub-parse with a fallback value
     *
     * Like try_optional, a fatal failure yields fallback and a retryable one
     * propagates.
     */
    template <typename F, typename T>
    auto try_or(F&& f, T&& fallback) -> std::invoke_result_t<F, Reader&> {
        using Result = std::invoke_result_t<F, Reader&>;
        auto result = try_read(std::forward<F>(f));
        if (result || result.error().is_retryable()) {
            return result;
        }
        return Result(std::forward<T>(fallback));
    }

    /**
     * @brief Ordered choice
     *
     * Tries each alternative on a fresh branch from the current position and
     * commits the first that succeeds. When all fail, the reported error is
     * chosen by merge_branch_errors.
     */
    template <typename F, typename... Rest>
    auto alt(F&& first, Rest&&... rest) -> std::invoke_result_t<F, Reader&> {
        if constexpr (sizeof...(Rest) == 0) {
            return try_read(std::forward<F>(first));
        } else {
            auto result = try_read(std::forward<F>(first));
            if (result) {
                return result;
            }
            auto next = alt(std::forward<Rest>(rest)...);
            if (next) {
                return next;
            }
            return fail(merge_branch_errors(std::move(result).error(), std::move(next).error()));
        }
    }

    // ========================================================================
    // Context
    // ========================================================================

    /**
     * @brief Run f as a named operation
     *
     * On failure, appends a frame {operation, span of the attempt} to the
     * propagating error. The span starts at the cursor on entry and covers
     * everything the inner failure refers to, so each frame contains the
     * frames nested inside it. On success the result passes through unchanged.
     */
    template <typename F>
    auto context(const char* operation, F&& f) -> std::invoke_result_t<F, Reader&> {
        return context(operation, nullptr, std::forward<F>(f));
    }

    template <typename F>
    auto context(const char* operation, const char* expected, F&& f)
        -> std::invoke_result_t<F, Reader&> {
        static_assert(detail::is_parse_result_v<std::invoke_result_t<F, Reader&>>,
                      "context() requires a function returning ParseResult");
        const std::size_t entry = absolute(cursor_);
        auto result = std::invoke(std::forward<F>(f), *this);
        if (!result) {
            Error& err = result.error();
            Span inner = err.outermost_span();
            Span attempt{std::min(entry, inner.start),
                         std::max({absolute(cursor_), inner.end, entry})};
            err.with_context(ContextFrame{operation, expected, attempt});
        }
        return result;
    }

    // ========================================================================
    // Error helpers for combinator authors
    // ========================================================================

    /// Invalid-data error over span
    [[nodiscard]] Error invalid(Span span, const char* description, const char* operation) const {
        return Error::invalid(span, description, operation);
    }

    /// Expectation error at the cursor (fatal)
    [[nodiscard]] Error expected_here(const char* expected, const char* operation) const {
        std::size_t len = at_end() ? 0 : 1;
        if constexpr (is_text) {
            if (!at_end()) {
                len = detail::utf8_decode(input_.as_bytes().subspan(cursor_)).len;
            }
        }
        return Error::expected_valid(Span::sized(absolute(cursor_), len), expected, operation);
    }

private:
    [[nodiscard]] std::size_t absolute(std::size_t pos) const noexcept {
        return input_.origin() + pos;
    }

    /// Retry requirements collapse to none on a bound input
    [[nodiscard]] RetryRequirement when_more(RetryRequirement retry) const noexcept {
        return input_.is_bound() ? RetryRequirement::none() : retry;
    }

    [[nodiscard]] Error short_input(std::size_t needed, const char* operation) const {
        Span span{absolute(cursor_), absolute(input_.size())};
        return Error::expected_length(
            span, needed, std::nullopt, "enough input", operation,
            when_more(RetryRequirement::from_had_and_needed(remaining(), needed)));
    }

    [[nodiscard]] Error mid_char(std::size_t pos, const char* operation) const {
        return Error::invalid(Span::at(absolute(pos)), "split inside a utf-8 code point",
                              operation);
    }

    ParseResult<InputT> scan_to(std::optional<std::size_t> hit, std::size_t skip_len,
                                const char* operation) {
        if (!hit) {
            return fail(Error::expected_valid(Span{absolute(cursor_), absolute(input_.size())},
                                              "pattern", operation,
                                              when_more(RetryRequirement::unknown())));
        }
        auto out = input_.slice(cursor_, cursor_ + *hit);
        cursor_ += *hit + skip_len;
        return out;
    }

    InputT input_;
    std::size_t cursor_ = 0;
};

// ============================================================================
// Input entry points
// ============================================================================

template <Encoding E>
template <typename ErrorT, typename F>
auto BasicInput<E>::read_all(F&& f) const {
    using Inner = std::invoke_result_t<F, Reader<BasicInput>&>;
    static_assert(detail::is_parse_result_v<Inner>,
                  "read_all() requires a function returning ParseResult");
    static_assert(ErrorPolicy<ErrorT>, "read_all() error type must satisfy ErrorPolicy");
    using T = typename Inner::value_type;
    using Result = expected<T, ErrorT>;
    Reader<BasicInput> r(*this);
    Inner result = r.context("read all", std::forward<F>(f));
    if (!result) {
        return Result(unexpect, detail::convert_error<ErrorT>(std::move(result).error()));
    }
    if (!r.at_end()) {
        auto trailing = r.rest();
        return Result(unexpect,
                      detail::convert_error<ErrorT>(Error::expected_length(
                          trailing.span(), 0, 0, "no trailing input", "read all")));
    }
    if constexpr (std::is_void_v<T>) {
        return Result{};
    } else {
        return Result(std::move(*result));
    }
}

template <Encoding E>
template <typename ErrorT, typename F>
auto BasicInput<E>::read_partial(F&& f) const {
    using Inner = std::invoke_result_t<F, Reader<BasicInput>&>;
    static_assert(detail::is_parse_result_v<Inner>,
                  "read_partial() requires a function returning ParseResult");
    static_assert(ErrorPolicy<ErrorT>, "read_partial() error type must satisfy ErrorPolicy");
    using T = typename Inner::value_type;
    Reader<BasicInput> r(*this);
    auto result = r.context("read partial", std::forward<F>(f));
    if constexpr (std::is_void_v<T>) {
        using Out = expected<BasicInput, ErrorT>;
        if (!result) {
            return Out(unexpect, detail::convert_error<ErrorT>(std::move(result).error()));
        }
        return Out(r.rest());
    } else {
        using Out = expected<std::pair<T, BasicInput>, ErrorT>;
        if (!result) {
            return Out(unexpect, detail::convert_error<ErrorT>(std::move(result).error()));
        }
        return Out(std::pair<T, BasicInput>(std::move(*result), r.rest()));
    }
}

template <Encoding E>
template <typename F>
auto BasicInput<E>::read_infallible(F&& f) const {
    using T = std::invoke_result_t<F, Reader<BasicInput>&>;
    static_assert(!detail::is_parse_result_v<T>,
                  "read_infallible() requires a function that cannot fail");
    Reader<BasicInput> r(*this);
    if constexpr (std::is_void_v<T>) {
        std::invoke(std::forward<F>(f), r);
        return r.rest();
    } else {
        T value = std::invoke(std::forward<F>(f), r);
        return std::pair<T, BasicInput>(std::move(value), r.rest());
    }
}

} // namespace wary
