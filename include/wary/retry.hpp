#pragma once

#include <algorithm>
#include <ostream>

#include <cstddef>
#include <cstdint>

#include "config.hpp"

namespace wary {

/**
 * @brief How much more input a failed parse needs before it is worth retrying
 *
 * - none:     the failure is fatal, more bytes will never make the input valid
 * - exact(n): at least n more bytes are needed to decide (n >= 1)
 * - unknown:  more bytes are needed, amount unclear (e.g. unterminated scan)
 *
 * A retry requirement is a lower bound. A caller that appends exactly n bytes
 * and re-runs the parse may be told it needs more again.
 *
 * When WARY_ENABLE_RETRY is 0 every factory returns none, so every error in
 * the program is fatal.
 */
class RetryRequirement {
public:
    enum class Kind : uint8_t {
        none,    ///< Fatal, no retry possible
        exact,   ///< Known shortfall
        unknown  ///< Shortfall of unknown size
    };

    /// Default construction equals none()
    constexpr RetryRequirement() noexcept = default;

    static constexpr RetryRequirement none() noexcept { return RetryRequirement{}; }

    /// Exact shortfall; exact(0) collapses to none()
    static constexpr RetryRequirement exact(std::size_t additional) noexcept {
        if (!config::retry || additional == 0) {
            return none();
        }
        return RetryRequirement{Kind::exact, additional};
    }

    static constexpr RetryRequirement unknown() noexcept {
        if (!config::retry) {
            return none();
        }
        return RetryRequirement{Kind::unknown, 0};
    }

    /// exact(needed - had) when needed > had, otherwise none()
    static constexpr RetryRequirement from_had_and_needed(std::size_t had,
                                                          std::size_t needed) noexcept {
        return needed > had ? exact(needed - had) : none();
    }

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }

    [[nodiscard]] constexpr bool is_fatal() const noexcept { return kind_ == Kind::none; }

    [[nodiscard]] constexpr bool is_retryable() const noexcept { return kind_ != Kind::none; }

    [[nodiscard]] constexpr bool is_exact() const noexcept { return kind_ == Kind::exact; }

    [[nodiscard]] constexpr bool is_unknown() const noexcept { return kind_ == Kind::unknown; }

    /// Additional bytes required; 0 unless is_exact()
    [[nodiscard]] constexpr std::size_t additional() const noexcept { return additional_; }

    /**
     * @brief Minimum number of bytes worth appending before the next attempt
     *
     * exact(n) -> n, unknown -> 1 (something is needed), none -> 0.
     */
    [[nodiscard]] constexpr std::size_t continue_after() const noexcept {
        switch (kind_) {
            case Kind::exact:
                return additional_;
            case Kind::unknown:
                return 1;
            case Kind::none:
                break;
        }
        return 0;
    }

    constexpr bool operator==(const RetryRequirement&) const noexcept = default;

private:
    constexpr RetryRequirement(Kind kind, std::size_t additional) noexcept
        : kind_(kind),
          additional_(additional) {}

    Kind kind_{Kind::none};
    std::size_t additional_{0};
};

/**
 * @brief Merge the requirements of two failures from one combined operation
 *
 * Fatal always wins: bytes cannot rescue data that is already wrong.
 * Two exact requirements keep the larger. Unknown absorbs exact.
 *
 *   a \ b      | none | exact(m)          | unknown
 *   -----------+------+-------------------+--------
 *   none       | none | none              | none
 *   exact(n)   | none | exact(max(n, m))  | unknown
 *   unknown    | none | unknown           | unknown
 */
[[nodiscard]] constexpr RetryRequirement combine(RetryRequirement a, RetryRequirement b) noexcept {
    using Kind = RetryRequirement::Kind;
    if (a.kind() == Kind::none || b.kind() == Kind::none) {
        return RetryRequirement::none();
    }
    if (a.kind() == Kind::unknown || b.kind() == Kind::unknown) {
        return RetryRequirement::unknown();
    }
    return RetryRequirement::exact(std::max(a.additional(), b.additional()));
}

inline std::ostream& operator<<(std::ostream& os, RetryRequirement req) {
    switch (req.kind()) {
        case RetryRequirement::Kind::none:
            return os << "none";
        case RetryRequirement::Kind::exact:
            return os << "exact(" << req.additional() << ")";
        case RetryRequirement::Kind::unknown:
            return os << "unknown";
    }
    return os;
}

} // namespace wary
