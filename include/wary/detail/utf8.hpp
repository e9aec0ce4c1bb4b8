#pragma once

#include <array>
#include <span>

#include <cstddef>
#include <cstdint>

namespace wary::detail {

// Sequence length by lead byte (RFC 3629). 0 marks a continuation byte or a
// byte that can never start a sequence (0xC0, 0xC1, 0xF5..0xFF).
inline constexpr std::array<uint8_t, 256> utf8_length_table = [] {
    std::array<uint8_t, 256> table{};
    for (std::size_t b = 0; b < 0x80; ++b) {
        table[b] = 1;
    }
    for (std::size_t b = 0xC2; b < 0xE0; ++b) {
        table[b] = 2;
    }
    for (std::size_t b = 0xE0; b < 0xF0; ++b) {
        table[b] = 3;
    }
    for (std::size_t b = 0xF0; b < 0xF5; ++b) {
        table[b] = 4;
    }
    return table;
}();

/// Number of bytes in the sequence started by lead, 0 if lead cannot start one
[[nodiscard]] constexpr std::size_t utf8_char_len(uint8_t lead) noexcept {
    return utf8_length_table[lead];
}

[[nodiscard]] constexpr bool utf8_is_continuation(uint8_t byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

/// True if index is 0, bytes.size(), or not a continuation byte
[[nodiscard]] constexpr bool utf8_is_boundary(std::span<const uint8_t> bytes,
                                              std::size_t index) noexcept {
    if (index == 0 || index >= bytes.size()) {
        return index <= bytes.size();
    }
    return !utf8_is_continuation(bytes[index]);
}

// Valid range for the second byte of a sequence, excluding overlong
// encodings, surrogates and code points above U+10FFFF.
[[nodiscard]] constexpr bool utf8_second_byte_ok(uint8_t lead, uint8_t second) noexcept {
    switch (lead) {
        case 0xE0:
            return second >= 0xA0 && second <= 0xBF;
        case 0xED:
            return second >= 0x80 && second <= 0x9F;
        case 0xF0:
            return second >= 0x90 && second <= 0xBF;
        case 0xF4:
            return second >= 0x80 && second <= 0x8F;
        default:
            return utf8_is_continuation(second);
    }
}

/**
 * Outcome of validating a byte range as UTF-8.
 *
 * - valid_up_to: length of the longest valid prefix
 * - error_len:   0 if the input ends inside a sequence that could still be
 *                completed; otherwise the length of the invalid sequence
 * - missing:     when error_len == 0, bytes required to complete the final
 *                sequence
 */
struct Utf8Status {
    std::size_t valid_up_to = 0;
    std::size_t error_len = 0;
    std::size_t missing = 0;
    bool ok = true;

    [[nodiscard]] constexpr bool truncated() const noexcept { return !ok && error_len == 0; }
};

[[nodiscard]] constexpr Utf8Status utf8_validate(std::span<const uint8_t> bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        std::size_t len = utf8_char_len(lead);
        if (len == 0) {
            return Utf8Status{i, 1, 0, false};
        }
        // Check each present byte of the sequence
        std::size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            bool ok = j == 1 ? utf8_second_byte_ok(lead, bytes[i + j])
                             : utf8_is_continuation(bytes[i + j]);
            if (!ok) {
                return Utf8Status{i, j, 0, false};
            }
        }
        if (j < len) {
            return Utf8Status{i, 0, len - j, false};
        }
        i += len;
    }
    return Utf8Status{n, 0, 0, true};
}

/**
 * A decoded code point and the number of bytes it occupied.
 * len == 0 means the bytes at the position do not form a valid sequence.
 */
struct DecodedChar {
    char32_t value = 0;
    std::size_t len = 0;
};

/// Decode the code point starting at bytes[0]. Input must not be empty.
[[nodiscard]] constexpr DecodedChar utf8_decode(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) {
        return {};
    }
    uint8_t lead = bytes[0];
    std::size_t len = utf8_char_len(lead);
    if (len == 0 || len > bytes.size()) {
        return {};
    }
    if (len == 1) {
        return DecodedChar{lead, 1};
    }
    if (!utf8_second_byte_ok(lead, bytes[1])) {
        return {};
    }
    char32_t cp = lead & (0x7F >> len);
    for (std::size_t j = 1; j < len; ++j) {
        if (!utf8_is_continuation(bytes[j])) {
            return {};
        }
        cp = (cp << 6) | (bytes[j] & 0x3F);
    }
    return DecodedChar{cp, len};
}

} // namespace wary::detail
