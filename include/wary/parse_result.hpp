#pragma once

#include <utility>

#include "error.hpp"
#include "expected.hpp"

namespace wary {

/**
 * @brief Result type for every fallible parse operation
 *
 * Alias for expected<T, Error>. Holds either the parsed value or an Error with
 * the failing span, retry requirement and context frames.
 *
 * Usage:
 * @code
 *   auto result = bytes.read_all([](auto& r) { return r.read_u16_be(); });
 *   if (result) {
 *       use(*result);
 *   } else if (result.error().is_retryable()) {
 *       // wait for result.error().retry_requirement() more bytes
 *   } else {
 *       std::cerr << wary::make_report(result.error(), bytes) << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully parsed value
 */
template <typename T>
using ParseResult = expected<T, Error>;

/**
 * @brief Wrap an error for returning from a parse function
 *
 * Usage:
 * @code
 *   return fail(Error::invalid(span, "digit out of range", "parse digit"));
 * @endcode
 */
inline auto fail(Error err) { return unexpected<Error>(std::move(err)); }

} // namespace wary
