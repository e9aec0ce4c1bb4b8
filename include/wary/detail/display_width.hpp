#pragma once

#include <array>
#include <optional>

#include <cstddef>
#include <cstdint>

namespace wary::detail {

struct CodepointRange {
    char32_t first;
    char32_t last;
};

// Combining marks and zero-width format characters (rendered on top of the
// previous column).
inline constexpr std::array<CodepointRange, 16> zero_width_ranges{{
    {0x0300, 0x036F},   {0x0483, 0x0489},   {0x0591, 0x05BD},   {0x0610, 0x061A},
    {0x064B, 0x065F},   {0x0E31, 0x0E31},   {0x0E34, 0x0E3A},   {0x1AB0, 0x1AFF},
    {0x1DC0, 0x1DFF},   {0x200B, 0x200F},   {0x20D0, 0x20FF},   {0x2060, 0x2064},
    {0xFE00, 0xFE0F},   {0xFE20, 0xFE2F},   {0xFEFF, 0xFEFF},   {0xE0100, 0xE01EF},
}};

// East Asian Wide and Fullwidth blocks plus the emoji planes terminals draw
// two cells wide.
inline constexpr std::array<CodepointRange, 17> wide_ranges{{
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2E80, 0x303E},   {0x3041, 0x33FF},
    {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},   {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},   {0xFE30, 0xFE4F},   {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},
    {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
}};

template <std::size_t N>
[[nodiscard]] constexpr bool in_ranges(const std::array<CodepointRange, N>& ranges,
                                       char32_t cp) noexcept {
    for (const auto& r : ranges) {
        if (cp < r.first) {
            return false;
        }
        if (cp <= r.last) {
            return true;
        }
    }
    return false;
}

/**
 * Terminal column width of a code point.
 *
 * @return 0, 1 or 2; nullopt for control characters that have no printable
 *         form (callers render those escaped).
 */
[[nodiscard]] constexpr std::optional<std::size_t> char_display_width(char32_t cp) noexcept {
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
        return std::nullopt;
    }
    if (cp < 0x300) {
        return 1;
    }
    if (in_ranges(zero_width_ranges, cp)) {
        return 0;
    }
    if (in_ranges(wide_ranges, cp)) {
        return 2;
    }
    return 1;
}

/// Hexadecimal digit count of num (at least 1)
[[nodiscard]] constexpr std::size_t count_hex_digits(uint32_t num) noexcept {
    std::size_t count = 1;
    while (num > 0xF) {
        ++count;
        num >>= 4;
    }
    return count;
}

/**
 * Width a code point occupies once rendered. Unprintable characters are
 * rendered as a backslash, "u{", hex digits and "}".
 */
[[nodiscard]] constexpr std::size_t rendered_char_width(char32_t cp) noexcept {
    if (auto width = char_display_width(cp)) {
        return *width;
    }
    return 4 + count_hex_digits(static_cast<uint32_t>(cp));
}

} // namespace wary::detail
