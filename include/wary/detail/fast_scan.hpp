#pragma once

#include <array>
#include <optional>
#include <span>
#include <string_view>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "../config.hpp"

#if defined(WARY_SIMD_NEON)
    #include <arm_neon.h>
#elif defined(WARY_SIMD_SSE2)
    #ifdef _MSC_VER
        #include <intrin.h>
    #else
        #include <emmintrin.h>
    #endif
#endif

namespace wary::detail {

/**
 * 256-entry byte class for predicate scans.
 *
 * Usage:
 *   constexpr auto digits = ByteSet::range('0', '9');
 *   auto pos = find_in_set(bytes, digits);
 *   auto run = reader.take_while(digits);
 */
class ByteSet {
public:
    constexpr ByteSet() noexcept = default;

    static constexpr ByteSet of(std::string_view chars) noexcept {
        ByteSet set;
        for (char c : chars) {
            set.insert(static_cast<uint8_t>(c));
        }
        return set;
    }

    static constexpr ByteSet range(uint8_t first, uint8_t last) noexcept {
        ByteSet set;
        for (unsigned b = first; b <= last; ++b) {
            set.insert(static_cast<uint8_t>(b));
        }
        return set;
    }

    constexpr void insert(uint8_t b) noexcept { bits_[b >> 6] |= uint64_t{1} << (b & 63); }

    [[nodiscard]] constexpr bool contains(uint8_t b) const noexcept {
        return (bits_[b >> 6] >> (b & 63)) & 1;
    }

    /// Usable directly as a byte predicate
    constexpr bool operator()(uint8_t b) const noexcept { return contains(b); }

    /// Code point predicate for Text readers. Only ASCII can match: bytes
    /// 0x80-0xFF are never whole code points.
    constexpr bool operator()(char32_t cp) const noexcept {
        return cp < 0x80 && contains(static_cast<uint8_t>(cp));
    }

    [[nodiscard]] constexpr ByteSet operator|(const ByteSet& other) const noexcept {
        ByteSet out;
        for (std::size_t i = 0; i < bits_.size(); ++i) {
            out.bits_[i] = bits_[i] | other.bits_[i];
        }
        return out;
    }

    [[nodiscard]] constexpr ByteSet operator~() const noexcept {
        ByteSet out;
        for (std::size_t i = 0; i < bits_.size(); ++i) {
            out.bits_[i] = ~bits_[i];
        }
        return out;
    }

private:
    std::array<uint64_t, 4> bits_{};
};

// ============================================================================
// Scalar reference implementations
//
// Every accelerated routine below must return exactly what these return.
// ============================================================================
namespace scalar {

[[nodiscard]] inline std::optional<std::size_t> find_byte(std::span<const uint8_t> hay,
                                                          uint8_t needle) noexcept {
    for (std::size_t i = 0; i < hay.size(); ++i) {
        if (hay[i] == needle) {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline std::optional<std::size_t>
find_substring(std::span<const uint8_t> hay, std::span<const uint8_t> needle) noexcept {
    if (needle.empty()) {
        return 0;
    }
    if (needle.size() > hay.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i + needle.size() <= hay.size(); ++i) {
        std::size_t j = 0;
        while (j < needle.size() && hay[i + j] == needle[j]) {
            ++j;
        }
        if (j == needle.size()) {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline std::size_t count_byte(std::span<const uint8_t> hay, uint8_t needle) noexcept {
    std::size_t count = 0;
    for (uint8_t b : hay) {
        count += b == needle ? 1 : 0;
    }
    return count;
}

} // namespace scalar

namespace simd {

#if defined(WARY_SIMD_SSE2)

[[nodiscard]] inline unsigned ctz(unsigned mask) noexcept {
    #ifdef _MSC_VER
    unsigned long index;
    _BitScanForward(&index, mask);
    return static_cast<unsigned>(index);
    #else
    return static_cast<unsigned>(__builtin_ctz(mask));
    #endif
}

[[nodiscard]] inline unsigned popcount(unsigned mask) noexcept {
    #ifdef _MSC_VER
    return static_cast<unsigned>(__popcnt(mask));
    #else
    return static_cast<unsigned>(__builtin_popcount(mask));
    #endif
}

[[nodiscard]] inline std::optional<std::size_t> find_byte(std::span<const uint8_t> hay,
                                                          uint8_t needle) noexcept {
    const uint8_t* data = hay.data();
    const std::size_t len = hay.size();
    std::size_t i = 0;
    if (len >= 16) {
        const __m128i needle_vec = _mm_set1_epi8(static_cast<char>(needle));
        for (; i + 16 <= len; i += 16) {
            __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
            int mask = _mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle_vec));
            if (mask) {
                return i + ctz(static_cast<unsigned>(mask));
            }
        }
    }
    for (; i < len; ++i) {
        if (data[i] == needle) {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline std::size_t count_byte(std::span<const uint8_t> hay, uint8_t needle) noexcept {
    const uint8_t* data = hay.data();
    const std::size_t len = hay.size();
    std::size_t count = 0;
    std::size_t i = 0;
    if (len >= 16) {
        const __m128i needle_vec = _mm_set1_epi8(static_cast<char>(needle));
        for (; i + 16 <= len; i += 16) {
            __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
            int mask = _mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle_vec));
            count += popcount(static_cast<unsigned>(mask));
        }
    }
    for (; i < len; ++i) {
        count += data[i] == needle ? 1 : 0;
    }
    return count;
}

#elif defined(WARY_SIMD_NEON)

[[nodiscard]] inline std::optional<std::size_t> find_byte(std::span<const uint8_t> hay,
                                                          uint8_t needle) noexcept {
    const uint8_t* data = hay.data();
    const std::size_t len = hay.size();
    std::size_t i = 0;
    if (len >= 16) {
        const uint8x16_t needle_vec = vdupq_n_u8(needle);
        for (; i + 16 <= len; i += 16) {
            uint8x16_t cmp = vceqq_u8(vld1q_u8(data + i), needle_vec);
            uint64x2_t cmp64 = vreinterpretq_u64_u8(cmp);
            if (vgetq_lane_u64(cmp64, 0) | vgetq_lane_u64(cmp64, 1)) {
                for (std::size_t j = 0; j < 16; ++j) {
                    if (data[i + j] == needle) {
                        return i + j;
                    }
                }
            }
        }
    }
    for (; i < len; ++i) {
        if (data[i] == needle) {
            return i;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline std::size_t count_byte(std::span<const uint8_t> hay, uint8_t needle) noexcept {
    const uint8_t* data = hay.data();
    const std::size_t len = hay.size();
    std::size_t count = 0;
    std::size_t i = 0;
    const uint8x16_t needle_vec = vdupq_n_u8(needle);
    while (i + 16 <= len) {
        // Lane counters saturate at 255 blocks
        uint8x16_t acc = vdupq_n_u8(0);
        std::size_t blocks = 0;
        for (; i + 16 <= len && blocks < 255; i += 16, ++blocks) {
            uint8x16_t cmp = vceqq_u8(vld1q_u8(data + i), needle_vec);
            acc = vsubq_u8(acc, cmp);
        }
        count += vaddlvq_u8(acc);
    }
    for (; i < len; ++i) {
        count += data[i] == needle ? 1 : 0;
    }
    return count;
}

#endif

} // namespace simd

// ============================================================================
// Dispatch (fixed at compile time)
// ============================================================================

/// First offset of needle in hay
[[nodiscard]] inline std::optional<std::size_t> find_byte(std::span<const uint8_t> hay,
                                                          uint8_t needle) noexcept {
#if defined(WARY_SIMD_SSE2) || defined(WARY_SIMD_NEON)
    return simd::find_byte(hay, needle);
#else
    return scalar::find_byte(hay, needle);
#endif
}

/// Number of occurrences of needle in hay
[[nodiscard]] inline std::size_t count_byte(std::span<const uint8_t> hay, uint8_t needle) noexcept {
#if defined(WARY_SIMD_SSE2) || defined(WARY_SIMD_NEON)
    return simd::count_byte(hay, needle);
#else
    return scalar::count_byte(hay, needle);
#endif
}

/**
 * First offset of needle in hay. An empty needle matches at 0.
 *
 * Uses the accelerated byte search to jump between candidate positions of the
 * needle's first byte, then confirms with memcmp.
 */
[[nodiscard]] inline std::optional<std::size_t>
find_substring(std::span<const uint8_t> hay, std::span<const uint8_t> needle) noexcept {
    if (needle.empty()) {
        return 0;
    }
    if (needle.size() > hay.size()) {
        return std::nullopt;
    }
    if (needle.size() == 1) {
        return find_byte(hay, needle[0]);
    }
    const std::size_t last_start = hay.size() - needle.size();
    std::size_t pos = 0;
    while (pos <= last_start) {
        auto hit = find_byte(hay.subspan(pos, last_start - pos + 1), needle[0]);
        if (!hit) {
            return std::nullopt;
        }
        std::size_t candidate = pos + *hit;
        if (std::memcmp(hay.data() + candidate + 1, needle.data() + 1, needle.size() - 1) == 0) {
            return candidate;
        }
        pos = candidate + 1;
    }
    return std::nullopt;
}

/// First offset whose byte is in set
[[nodiscard]] inline std::optional<std::size_t> find_in_set(std::span<const uint8_t> hay,
                                                            const ByteSet& set) noexcept {
    for (std::size_t i = 0; i < hay.size(); ++i) {
        if (set.contains(hay[i])) {
            return i;
        }
    }
    return std::nullopt;
}

/// First offset whose byte satisfies pred
template <typename Pred>
[[nodiscard]] inline std::optional<std::size_t> find_if(std::span<const uint8_t> hay, Pred&& pred) {
    for (std::size_t i = 0; i < hay.size(); ++i) {
        if (pred(hay[i])) {
            return i;
        }
    }
    return std::nullopt;
}

/// First offset whose byte does not satisfy pred
template <typename Pred>
[[nodiscard]] inline std::optional<std::size_t> find_if_not(std::span<const uint8_t> hay,
                                                            Pred&& pred) {
    for (std::size_t i = 0; i < hay.size(); ++i) {
        if (!pred(hay[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace wary::detail
