#pragma once

#include <algorithm>
#include <ostream>

#include <cstddef>

namespace wary {

/**
 * Half-open byte range [start, end) within a root input.
 *
 * Offsets are always derived from index arithmetic against an input's length,
 * never from pointer differences, so a Span stays meaningful after the bytes it
 * described have been sliced or replaced by a longer buffer.
 *
 * Invariant: start <= end. Constructors clamp end up to start.
 */
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;

    constexpr Span() noexcept = default;

    constexpr Span(std::size_t s, std::size_t e) noexcept : start(s), end(e < s ? s : e) {}

    /// Empty span located at offset
    static constexpr Span at(std::size_t offset) noexcept { return Span{offset, offset}; }

    /// Span of len bytes starting at offset
    static constexpr Span sized(std::size_t offset, std::size_t len) noexcept {
        return Span{offset, offset + len};
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return end - start; }

    [[nodiscard]] constexpr bool empty() const noexcept { return start == end; }

    /// True if offset lies inside [start, end)
    [[nodiscard]] constexpr bool contains(std::size_t offset) const noexcept {
        return offset >= start && offset < end;
    }

    /// True if other lies completely inside this span (empty spans included)
    [[nodiscard]] constexpr bool contains(Span other) const noexcept {
        return other.start >= start && other.end <= end;
    }

    [[nodiscard]] constexpr bool intersects(Span other) const noexcept {
        return other.start < end && start < other.end;
    }

    /// Smallest span covering both
    [[nodiscard]] constexpr Span merge(Span other) const noexcept {
        return Span{std::min(start, other.start), std::max(end, other.end)};
    }

    /// Same length, moved forward by n bytes
    [[nodiscard]] constexpr Span shift(std::size_t n) const noexcept {
        return Span{start + n, end + n};
    }

    constexpr bool operator==(const Span&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, Span span) {
    return os << span.start << ".." << span.end;
}

} // namespace wary
