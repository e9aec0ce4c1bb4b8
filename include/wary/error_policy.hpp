#pragma once

#include <concepts>
#include <ostream>
#include <utility>

#include "error.hpp"
#include "retry.hpp"

namespace wary {

/**
 * @brief Error with no details at all
 *
 * Select it at an entry point when only success or failure matters:
 * @code
 *   auto result = wary::input(bytes).read_all<wary::Fatal>(parse_header);
 * @endcode
 *
 * Always fatal, so it is not suitable for streaming callers.
 */
struct Fatal {
    static constexpr Fatal from(const Error&) noexcept { return {}; }

    [[nodiscard]] constexpr bool is_fatal() const noexcept { return true; }

    [[nodiscard]] constexpr bool is_retryable() const noexcept { return false; }

    [[nodiscard]] constexpr RetryRequirement retry_requirement() const noexcept {
        return RetryRequirement::none();
    }

    constexpr bool operator==(const Fatal&) const noexcept = default;
};

/**
 * @brief Error that keeps only the retry requirement
 *
 * Enough for a streaming caller to decide between "reject" and "wait for n
 * more bytes", without the span, description or context chain.
 */
class Invalid {
public:
    static Invalid from(const Error& err) noexcept {
        return Invalid{err.retry_requirement()};
    }

    constexpr explicit Invalid(RetryRequirement retry = RetryRequirement::none()) noexcept
        : retry_(retry) {}

    [[nodiscard]] constexpr RetryRequirement retry_requirement() const noexcept { return retry_; }

    [[nodiscard]] constexpr bool is_fatal() const noexcept { return retry_.is_fatal(); }

    [[nodiscard]] constexpr bool is_retryable() const noexcept { return retry_.is_retryable(); }

    constexpr bool operator==(const Invalid&) const noexcept = default;

private:
    RetryRequirement retry_;
};

/**
 * @brief Error types an entry point can report
 *
 * Error itself, or a reduced type constructed from an Error with from().
 */
template <typename E>
concept ErrorPolicy = std::same_as<E, Error> || requires(const Error& err, const E& reduced) {
    { E::from(err) } -> std::same_as<E>;
    { reduced.retry_requirement() } -> std::same_as<RetryRequirement>;
};

namespace detail {

template <ErrorPolicy E>
[[nodiscard]] E convert_error(Error&& err) {
    if constexpr (std::same_as<E, Error>) {
        return std::move(err);
    } else {
        return E::from(err);
    }
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& os, const Fatal&) { return os << "invalid input"; }

inline std::ostream& operator<<(std::ostream& os, const Invalid& err) {
    os << "invalid input";
    if (err.is_retryable()) {
        os << " (retry: " << err.retry_requirement() << ")";
    }
    return os;
}

} // namespace wary
