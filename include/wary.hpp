#pragma once

/**
 * @file wary.hpp
 * @brief Parsing core for untrusted byte and text input
 *
 * Types provided:
 * - wary::Bytes / wary::Text - zero-copy inputs that remember their origin
 * - wary::Reader              - the cursor that consumes an input
 * - wary::Error               - failure with span, retry requirement and context
 * - wary::RetryRequirement    - "fatal" versus "retry with n more bytes"
 * - wary::Invalid / wary::Fatal - reduced errors selectable at read_all / read_partial
 * - wary::ErrorReport         - line/column/excerpt rendering of an error
 *
 * Typical use:
 * @code
 *   auto in = wary::input(buffer);
 *   auto result = in.read_all([](auto& r) { return r.read_u32_be(); });
 *   if (!result) {
 *       std::cerr << wary::make_report(result.error(), in);
 *   }
 * @endcode
 */

#include "wary/config.hpp"
#include "wary/context.hpp"
#include "wary/error.hpp"
#include "wary/error_policy.hpp"
#include "wary/expected.hpp"
#include "wary/input.hpp"
#include "wary/parse_result.hpp"
#include "wary/reader.hpp"
#include "wary/report.hpp"
#include "wary/retry.hpp"
#include "wary/span.hpp"
