#pragma once

#include <algorithm>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "config.hpp"
#include "detail/display_width.hpp"
#include "detail/fast_scan.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "input.hpp"

namespace wary {

/**
 * @brief A context frame resolved to a line and column
 */
struct FrameLocation {
    ContextFrame frame;
    std::size_t line = 1;   ///< 1-based
    std::size_t column = 1; ///< 1-based byte column
};

/**
 * @brief Everything needed to show a failure to a human
 *
 * Produced by make_report() from an error and the root input it was produced
 * against. Plain data: can be inspected field by field, or streamed with
 * operator<< for the default layout.
 */
struct ErrorReport {
    std::string description;      ///< Full description, e.g. "found 1 byte when ..."
    const char* operation = "";   ///< Failing primitive
    ErrorClass error_class = ErrorClass::invalid;
    RetryRequirement retry{};
    Span span{};                  ///< Innermost span, clamped to the input
    std::size_t line = 1;         ///< 1-based line of span.start
    std::size_t column = 1;       ///< 1-based byte column of span.start
    std::size_t display_column = 1; ///< 1-based rendered column of span.start
    bool text_columns = true;     ///< false if the line had invalid UTF-8 (columns are bytes)
    std::string excerpt;          ///< Rendered source line (or window of it)
    std::string underline;        ///< Spaces then carets, aligned under excerpt
    std::vector<FrameLocation> frames; ///< Outermost first
};

namespace detail {

inline constexpr std::size_t excerpt_context_bytes = 64;

struct LineInfo {
    std::size_t line = 1;
    std::size_t start = 0; ///< Offset of the first byte of the line
    std::size_t end = 0;   ///< Offset of the line terminator (or end of input)
};

// O(offset): counts line feeds before offset. Only runs on the failure path.
[[nodiscard]] inline LineInfo locate_line(std::span<const uint8_t> bytes, std::size_t offset) noexcept {
    offset = std::min(offset, bytes.size());
    LineInfo info;
    auto before = bytes.first(offset);
    info.line = 1 + count_byte(before, '\n');
    info.start = offset;
    while (info.start > 0 && bytes[info.start - 1] != '\n') {
        --info.start;
    }
    auto nl = find_byte(bytes.subspan(offset), '\n');
    info.end = nl ? offset + *nl : bytes.size();
    if (info.end > info.start && info.end > offset && bytes[info.end - 1] == '\r') {
        --info.end;
    }
    return info;
}

inline void append_hex(std::string& out, uint32_t value, std::size_t min_digits) {
    static constexpr char digits[] = "0123456789abcdef";
    std::size_t n = std::max(min_digits, count_hex_digits(value));
    for (std::size_t i = n; i-- > 0;) {
        out.push_back(digits[(value >> (i * 4)) & 0xF]);
    }
}

/**
 * Renders bytes [from, to) of one line, recording the rendered column at which
 * each byte offset starts. Valid printable UTF-8 is copied through; control
 * characters are escaped as a backslash-u sequence and invalid bytes as a
 * backslash-x sequence, so the output never contains raw malformed data.
 */
class LineRenderer {
public:
    LineRenderer(std::span<const uint8_t> bytes, std::size_t from, std::size_t to)
        : from_(from),
          columns_(to - from + 1, 0) {
        std::size_t pos = from;
        while (pos < to) {
            auto decoded = utf8_decode(bytes.subspan(pos, to - pos));
            std::size_t len = decoded.len == 0 ? 1 : decoded.len;
            for (std::size_t k = 0; k < len; ++k) {
                columns_[pos - from + k] = width_;
            }
            if (decoded.len == 0) {
                valid_ = false;
                text_.append("\\x");
                append_hex(text_, bytes[pos], 2);
                width_ += 4;
            } else if (auto w = char_display_width(decoded.value)) {
                text_.append(reinterpret_cast<const char*>(bytes.data() + pos), decoded.len);
                width_ += config::unicode ? *w : 1;
            } else {
                text_.append("\\u{");
                append_hex(text_, static_cast<uint32_t>(decoded.value), 1);
                text_.push_back('}');
                width_ += rendered_char_width(decoded.value);
            }
            pos += len;
        }
        columns_[to - from] = width_;
    }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    /// Rendered column (0-based) where the byte at offset starts
    [[nodiscard]] std::size_t column_of(std::size_t offset) const noexcept {
        std::size_t i = std::min(offset - std::min(offset, from_), columns_.size() - 1);
        return columns_[i];
    }

    [[nodiscard]] bool valid() const noexcept { return valid_; }

private:
    std::size_t from_;
    std::vector<std::size_t> columns_;
    std::string text_;
    std::size_t width_ = 0;
    bool valid_ = true;
};

/// Move offset forward to the next UTF-8 boundary (no-op for ASCII / boundaries)
[[nodiscard]] inline std::size_t align_forward(std::span<const uint8_t> bytes,
                                               std::size_t offset) noexcept {
    std::size_t limit = std::min(bytes.size(), offset + 3);
    while (offset < limit && utf8_is_continuation(bytes[offset])) {
        ++offset;
    }
    return offset;
}

} // namespace detail

/**
 * @brief Build a report for err against the input it was produced from
 *
 * root should be the root input (origin 0). A sub-input works too: offsets
 * are translated by its origin and clamped to its bounds, so a mismatched
 * input degrades the excerpt but never reads out of range.
 */
template <Encoding E>
[[nodiscard]] ErrorReport make_report(const Error& err, const BasicInput<E>& root) {
    const auto bytes = root.as_bytes();
    auto local = [&](std::size_t absolute) {
        std::size_t rel = absolute >= root.origin() ? absolute - root.origin() : 0;
        return std::min(rel, bytes.size());
    };

    ErrorReport report;
    {
        std::ostringstream os;
        err.describe(os);
        report.description = os.str();
    }
    report.operation = err.operation();
    report.error_class = err.classify();
    report.retry = err.retry_requirement();

    const std::size_t start = local(err.span().start);
    const std::size_t end = std::max(start, local(err.span().end));
    report.span = Span{start, end};

    auto line = detail::locate_line(bytes, start);
    report.line = line.line;
    report.column = start - line.start + 1;

    // Window the excerpt around the span on long lines
    std::size_t from = line.start;
    if (start - from > detail::excerpt_context_bytes) {
        from = detail::align_forward(bytes, start - detail::excerpt_context_bytes);
    }
    std::size_t to = line.end;
    std::size_t span_line_end = std::clamp(end, start, line.end);
    if (to - span_line_end > detail::excerpt_context_bytes) {
        to = detail::align_forward(bytes, span_line_end + detail::excerpt_context_bytes);
    }

    detail::LineRenderer rendered(bytes, from, to);
    std::string prefix = from > line.start ? "..." : "";
    std::string suffix = to < line.end ? "..." : "";
    report.excerpt = prefix + rendered.text() + suffix;
    report.text_columns = rendered.valid();

    std::size_t caret_col = rendered.column_of(start);
    std::size_t caret_end = rendered.column_of(std::min(span_line_end, to));
    std::size_t caret_len = std::max<std::size_t>(1, caret_end - std::min(caret_end, caret_col));
    report.underline = std::string(prefix.size() + caret_col, ' ') + std::string(caret_len, '^');

    // Invalid bytes before the window also make display columns meaningless
    detail::LineRenderer whole(bytes, line.start, start);
    report.text_columns = report.text_columns && whole.valid();
    report.display_column = report.text_columns ? whole.column_of(start) + 1 : report.column;

    for (const auto& frame : err.frames()) {
        std::size_t at = local(frame.span.start);
        auto info = detail::locate_line(bytes, at);
        report.frames.push_back(FrameLocation{frame, info.line, at - info.start + 1});
    }
    return report;
}

/**
 * Default layout:
 *
 *   error attempting to take: found 1 byte when at least 2 bytes was expected
 *    --> line 1, column 2 (needs 1 more byte)
 *     |
 *   1 | 4
 *     |  ^
 *   context backtrace:
 *     1. `read all` at line 1, column 1
 *     2. `parse number` (expected 2 digits) at line 1, column 1
 */
inline std::ostream& operator<<(std::ostream& os, const ErrorReport& report) {
    os << "error attempting to " << report.operation << ": " << report.description << "\n";
    os << " --> line " << report.line << ", column "
       << (report.text_columns ? report.display_column : report.column);
    if (!report.text_columns) {
        os << " (byte offset " << report.span.start << ")";
    }
    switch (report.retry.kind()) {
        case RetryRequirement::Kind::exact:
            os << " (needs " << report.retry.additional() << " more "
               << (report.retry.additional() == 1 ? "byte" : "bytes") << ")";
            break;
        case RetryRequirement::Kind::unknown:
            os << " (needs more input)";
            break;
        case RetryRequirement::Kind::none:
            break;
    }
    os << "\n";

    std::string line_no = std::to_string(report.line);
    std::string pad(line_no.size(), ' ');
    os << pad << " |\n";
    os << line_no << " | " << report.excerpt << "\n";
    os << pad << " | " << report.underline << "\n";

    if (!report.frames.empty()) {
        os << "context backtrace:\n";
        std::size_t n = 1;
        for (const auto& loc : report.frames) {
            os << "  " << n++ << ". `" << loc.frame.operation << "`";
            if (loc.frame.expected != nullptr) {
                os << " (expected " << loc.frame.expected << ")";
            }
            os << " at line " << loc.line << ", column " << loc.column << "\n";
        }
    }
    return os;
}

[[nodiscard]] inline std::string to_string(const ErrorReport& report) {
    std::ostringstream os;
    os << report;
    return os.str();
}

} // namespace wary
