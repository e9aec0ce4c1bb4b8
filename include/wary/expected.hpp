#pragma once

// WARY Expected Type
//
// Exposes tl::expected in the wary namespace. Every fallible operation in the
// library returns expected<T, Error> (see parse_result.hpp).
//
// Usage:
//   wary::expected<T, E> result = some_operation();
//   if (result) {
//       process(*result);
//   } else {
//       handle(result.error());
//   }
//
// Monadic operations used by combinator authors:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - recover on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace wary {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace wary
