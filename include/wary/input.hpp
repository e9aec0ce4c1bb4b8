#pragma once

#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "detail/fast_scan.hpp"
#include "detail/utf8.hpp"
#include "parse_result.hpp"
#include "span.hpp"

namespace wary {

/**
 * @brief Whether an input's end is final
 *
 * - start: the default. More bytes may be appended in a later pass, so running
 *          out of input is a retryable condition.
 * - both:  the caller asserts this is all the data there will ever be. Running
 *          out of input is fatal.
 */
enum class Bound : uint8_t {
    start, ///< Start fixed, end may grow
    both   ///< Start and end fixed
};

/**
 * @brief Interpretation of the bytes behind an input
 */
enum class Encoding : uint8_t {
    bytes, ///< Raw bytes, token = uint8_t
    utf8   ///< Validated UTF-8, token = char32_t
};

template <typename InputT>
class Reader;

/**
 * @brief Immutable, zero-copy view over untrusted bytes
 *
 * An input never owns or mutates the bytes it views and never allocates.
 * Besides the byte range it records its origin (the offset of its first byte
 * within the root input it was sliced from), so the Span of any sub-input is
 * plain index arithmetic.
 *
 * Two flavours share this template:
 * - Bytes: arbitrary bytes
 * - Text:  bytes validated as UTF-8 at construction. Every operation that
 *          splits a Text splits on a code point boundary, so every sub-input
 *          is independently valid.
 *
 * The caller keeps the underlying buffer alive for as long as any input,
 * reader or value borrowed from it is in use. Errors and context frames only
 * store offsets, so they may outlive the buffer.
 *
 * Example:
 * @code
 *   auto bytes = wary::input(buffer);
 *   auto value = bytes.read_all([](auto& r) { return r.read_u32_be(); });
 * @endcode
 *
 * @tparam E Bytes or UTF-8 text
 */
template <Encoding E>
class BasicInput {
public:
    using token_type = std::conditional_t<E == Encoding::utf8, char32_t, uint8_t>;

    static constexpr Encoding encoding = E;
    static constexpr bool is_text = E == Encoding::utf8;

    /// Empty input
    constexpr BasicInput() noexcept = default;

    /// Wrap bytes (Bytes flavour only; Text goes through from_utf8)
    constexpr explicit BasicInput(std::span<const uint8_t> bytes,
                                  Bound bound = Bound::start) noexcept
        requires(E == Encoding::bytes)
        : data_(bytes.data()),
          size_(bytes.size()),
          bound_(bound) {}

    /**
     * @brief Validate bytes as UTF-8 and wrap them as text
     *
     * On an unbound input whose only defect is a multi-byte sequence cut off
     * by the end of the buffer, the error is retryable with the number of
     * missing bytes. Any other defect is fatal.
     */
    static ParseResult<BasicInput> from_utf8(std::span<const uint8_t> bytes,
                                             Bound bound = Bound::start)
        requires(E == Encoding::utf8)
    {
        return validate_utf8(bytes, 0, bound).map([&] {
            return BasicInput(bytes.data(), bytes.size(), 0, bound);
        });
    }

    // ========================================================================
    // Size and position
    // ========================================================================

    [[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr std::size_t len() const noexcept { return size_; }

    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] constexpr bool is_empty() const noexcept { return size_ == 0; }

    /// Offset of the first byte within the root input
    [[nodiscard]] constexpr std::size_t origin() const noexcept { return origin_; }

    /// Span covered by this input within its root (for a root input: {0, size})
    [[nodiscard]] constexpr Span span() const noexcept { return Span::sized(origin_, size_); }

    [[nodiscard]] constexpr Bound bound() const noexcept { return bound_; }

    [[nodiscard]] constexpr bool is_bound() const noexcept { return bound_ == Bound::both; }

    /// Same bytes, with the guarantee that no more will follow
    [[nodiscard]] constexpr BasicInput into_bound() const noexcept {
        BasicInput out = *this;
        out.bound_ = Bound::both;
        return out;
    }

    /// Read-only view of the bytes
    [[nodiscard]] constexpr std::span<const uint8_t> as_bytes() const noexcept {
        return {data_, size_};
    }

    /// Bounds-checked byte access
    [[nodiscard]] constexpr std::optional<uint8_t> byte_at(std::size_t index) const noexcept {
        if (index >= size_) {
            return std::nullopt;
        }
        return data_[index];
    }

    /// True if index is a valid split point (always, for Bytes, up to size)
    [[nodiscard]] constexpr bool is_boundary(std::size_t index) const noexcept {
        if (index > size_) {
            return false;
        }
        if constexpr (is_text) {
            return detail::utf8_is_boundary(as_bytes(), index);
        } else {
            return true;
        }
    }

    /**
     * @brief True if this input views bytes inside parent's bytes
     *
     * Compares addresses as integers, so unrelated buffers are simply reported
     * as not within.
     */
    template <Encoding P>
    [[nodiscard]] bool is_within(const BasicInput<P>& parent) const noexcept {
        auto self_begin = reinterpret_cast<std::uintptr_t>(data_);
        auto parent_begin = reinterpret_cast<std::uintptr_t>(parent.as_bytes().data());
        if (self_begin < parent_begin) {
            return false;
        }
        return self_begin - parent_begin + size_ <= parent.size();
    }

    // ========================================================================
    // Splitting
    // ========================================================================

    /**
     * @brief Split into [0, index) and [index, size)
     *
     * Bytes split anywhere. Text fails with an invalid error if index lands
     * inside a code point.
     *
     * @throws std::out_of_range if index > size(). An index beyond the input is
     *         a bug in the calling parser, not a property of the data.
     */
    [[nodiscard]] ParseResult<std::pair<BasicInput, BasicInput>> split_at(std::size_t index) const {
        if (index > size_) {
            throw std::out_of_range("wary::BasicInput::split_at: index beyond input");
        }
        if (!is_boundary(index)) {
            return fail(Error::invalid(Span::at(origin_ + index),
                                       "split inside a utf-8 code point", "split input"));
        }
        return std::pair{slice(0, index), slice(index, size_)};
    }

    /**
     * @brief Split off the longest prefix whose tokens satisfy pred
     *
     * Never fails; the prefix may be empty.
     */
    template <typename Pred>
    [[nodiscard]] std::pair<BasicInput, BasicInput> split_prefix(Pred&& pred) const {
        std::size_t mid = prefix_len(std::forward<Pred>(pred));
        return {slice(0, mid), slice(mid, size_)};
    }

    /// Rest of the input after prefix, if the input starts with it
    [[nodiscard]] std::optional<BasicInput> strip_prefix(std::string_view prefix) const noexcept {
        if (!starts_with(prefix)) {
            return std::nullopt;
        }
        if (!is_boundary(prefix.size())) {
            return std::nullopt;
        }
        return slice(prefix.size(), size_);
    }

    // ========================================================================
    // Searching (fast-scan backed)
    // ========================================================================

    [[nodiscard]] bool starts_with(std::span<const uint8_t> prefix) const noexcept {
        if (prefix.size() > size_) {
            return false;
        }
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            if (data_[i] != prefix[i]) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool starts_with(std::string_view prefix) const noexcept {
        return starts_with(to_byte_span(prefix));
    }

    /// Offset of the first occurrence of byte
    [[nodiscard]] std::optional<std::size_t> find(uint8_t byte) const noexcept
        requires(E == Encoding::bytes)
    {
        return detail::find_byte(as_bytes(), byte);
    }

    /**
     * @brief Offset of the first occurrence of needle
     *
     * For Text, only matches that start and end on code point boundaries count.
     */
    [[nodiscard]] std::optional<std::size_t> find(std::span<const uint8_t> needle) const noexcept {
        std::size_t from = 0;
        while (from <= size_) {
            auto hit = detail::find_substring(as_bytes().subspan(from), needle);
            if (!hit) {
                return std::nullopt;
            }
            std::size_t pos = from + *hit;
            if (is_boundary(pos) && is_boundary(pos + needle.size())) {
                return pos;
            }
            from = pos + 1;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::size_t> find(std::string_view needle) const noexcept {
        return find(to_byte_span(needle));
    }

    /// Offset of the first token satisfying pred
    template <typename Pred>
    [[nodiscard]] std::optional<std::size_t> find_if(Pred&& pred) const {
        if constexpr (!is_text) {
            if constexpr (std::is_same_v<std::remove_cvref_t<Pred>, detail::ByteSet>) {
                return detail::find_in_set(as_bytes(), pred);
            } else {
                return detail::find_if(as_bytes(), std::forward<Pred>(pred));
            }
        } else {
            std::size_t mid = prefix_len([&](token_type t) { return !pred(t); });
            if (mid == size_) {
                return std::nullopt;
            }
            return mid;
        }
    }

    // ========================================================================
    // Text access
    // ========================================================================

    /// Validated text view (Text only)
    [[nodiscard]] std::string_view as_string_view() const noexcept
        requires(E == Encoding::utf8)
    {
        return {reinterpret_cast<const char*>(data_), size_};
    }

    /// Validate these bytes as UTF-8 text, keeping origin and bound
    [[nodiscard]] ParseResult<BasicInput<Encoding::utf8>> as_text() const
        requires(E == Encoding::bytes)
    {
        return BasicInput<Encoding::utf8>::validate_utf8(as_bytes(), origin_, bound_)
            .map([&] { return BasicInput<Encoding::utf8>(data_, size_, origin_, bound_); });
    }

    /// Forget the text guarantee
    [[nodiscard]] BasicInput<Encoding::bytes> as_raw() const noexcept {
        return BasicInput<Encoding::bytes>(data_, size_, origin_, bound_);
    }

    /// Iterator over decoded code points of a Text
    class char_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = char32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = char32_t;

        char_iterator() noexcept = default;
        char_iterator(std::span<const uint8_t> bytes, std::size_t pos) noexcept
            : bytes_(bytes),
              pos_(pos) {}

        char32_t operator*() const noexcept {
            return detail::utf8_decode(bytes_.subspan(pos_)).value;
        }

        char_iterator& operator++() noexcept {
            auto len = detail::utf8_decode(bytes_.subspan(pos_)).len;
            pos_ += len == 0 ? 1 : len;
            return *this;
        }

        char_iterator operator++(int) noexcept {
            char_iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        /// Byte offset of the current code point
        [[nodiscard]] std::size_t offset() const noexcept { return pos_; }

        bool operator==(const char_iterator& other) const noexcept { return pos_ == other.pos_; }

    private:
        std::span<const uint8_t> bytes_{};
        std::size_t pos_ = 0;
    };

    struct CharRange {
        std::span<const uint8_t> bytes;
        [[nodiscard]] char_iterator begin() const noexcept { return {bytes, 0}; }
        [[nodiscard]] char_iterator end() const noexcept { return {bytes, bytes.size()}; }
    };

    [[nodiscard]] CharRange chars() const noexcept
        requires(E == Encoding::utf8)
    {
        return CharRange{as_bytes()};
    }

    /// Number of code points (Text only)
    [[nodiscard]] std::size_t char_count() const noexcept
        requires(E == Encoding::utf8)
    {
        std::size_t count = 0;
        for (uint8_t b : as_bytes()) {
            count += detail::utf8_is_continuation(b) ? 0 : 1;
        }
        return count;
    }

    // ========================================================================
    // Owned copies (for converting borrowed results into independent values)
    // ========================================================================

    [[nodiscard]] std::vector<uint8_t> to_vector() const { return {data_, data_ + size_}; }

    [[nodiscard]] std::string to_string() const {
        return std::string(reinterpret_cast<const char*>(data_), size_);
    }

    /// Byte-wise equality of content (origin and bound are ignored)
    template <Encoding P>
    [[nodiscard]] bool content_equals(const BasicInput<P>& other) const noexcept {
        if (size_ != other.size()) {
            return false;
        }
        auto rhs = other.as_bytes();
        for (std::size_t i = 0; i < size_; ++i) {
            if (data_[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }

    // ========================================================================
    // Entry points (defined in reader.hpp)
    // ========================================================================

    /**
     * @brief Read the whole input with f
     *
     * Runs f inside a "read all" context. Fails with an expected_length error
     * over the trailing bytes if f succeeds without consuming everything.
     *
     * @tparam ErrorT Error reported to the caller: Error (default), or a
     *                reduced policy such as Invalid or Fatal
     */
    template <typename ErrorT = Error, typename F>
    auto read_all(F&& f) const;

    /**
     * @brief Read a prefix of the input with f
     * @return f's value paired with the unread remainder
     */
    template <typename ErrorT = Error, typename F>
    auto read_partial(F&& f) const;

    /// Read a prefix with a function that cannot fail; returns its value and the remainder
    template <typename F>
    auto read_infallible(F&& f) const;

private:
    template <Encoding>
    friend class BasicInput;
    template <typename>
    friend class Reader;

    constexpr BasicInput(const uint8_t* data, std::size_t size, std::size_t origin,
                         Bound bound) noexcept
        : data_(data),
          size_(size),
          origin_(origin),
          bound_(bound) {}

    static std::span<const uint8_t> to_byte_span(std::string_view s) noexcept {
        return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
    }

    static ParseResult<void> validate_utf8(std::span<const uint8_t> bytes, std::size_t origin,
                                           Bound bound) {
        auto status = detail::utf8_validate(bytes);
        if (status.ok) {
            return {};
        }
        std::size_t at = origin + status.valid_up_to;
        if (status.truncated()) {
            auto retry = bound == Bound::both ? RetryRequirement::none()
                                              : RetryRequirement::exact(status.missing);
            return fail(Error::expected_valid(Span{at, origin + bytes.size()}, "utf-8 code point",
                                              "decode utf-8", retry));
        }
        return fail(Error::expected_valid(Span::sized(at, status.error_len), "utf-8 code point",
                                          "decode utf-8"));
    }

    /**
     * Sub-input [start, end) of this input; caller guarantees both are
     * in range (and boundaries, for Text).
     *
     * The slice's end is final if something follows it or if this input's end
     * is final.
     */
    [[nodiscard]] constexpr BasicInput slice(std::size_t start, std::size_t end) const noexcept {
        Bound b = end < size_ ? Bound::both : bound_;
        return BasicInput(data_ + start, end - start, origin_ + start, b);
    }

    /// Length in bytes of the longest prefix whose tokens satisfy pred
    template <typename Pred>
    [[nodiscard]] std::size_t prefix_len(Pred&& pred) const {
        if constexpr (is_text) {
            std::size_t pos = 0;
            while (pos < size_) {
                auto decoded = detail::utf8_decode(as_bytes().subspan(pos));
                if (decoded.len == 0 || !pred(decoded.value)) {
                    break;
                }
                pos += decoded.len;
            }
            return pos;
        } else if constexpr (std::is_same_v<std::remove_cvref_t<Pred>, detail::ByteSet>) {
            auto hit = detail::find_in_set(as_bytes(), ~pred);
            return hit ? *hit : size_;
        } else {
            auto hit = detail::find_if_not(as_bytes(), std::forward<Pred>(pred));
            return hit ? *hit : size_;
        }
    }

    const uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t origin_ = 0;
    Bound bound_ = Bound::start;
};

using Bytes = BasicInput<Encoding::bytes>;
using Text = BasicInput<Encoding::utf8>;

/// Root byte input over caller-owned bytes
[[nodiscard]] inline Bytes input(std::span<const uint8_t> bytes,
                                 Bound bound = Bound::start) noexcept {
    return Bytes(bytes, bound);
}

/// Root byte input over the bytes of a string
[[nodiscard]] inline Bytes input(std::string_view bytes, Bound bound = Bound::start) noexcept {
    return Bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()),
                                          bytes.size()),
                 bound);
}

/// Root text input; validates UTF-8
[[nodiscard]] inline ParseResult<Text> text(std::string_view str, Bound bound = Bound::start) {
    return Text::from_utf8(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()), bound);
}

} // namespace wary
