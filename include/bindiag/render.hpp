#pragma once

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>

#include "error_kind.hpp"
#include "position.hpp"
#include "trace.hpp"

namespace bindiag {

/**
 * @brief Renderer settings
 */
struct RenderOptions {
    /// Also render entries that only carry a raw ErrorKind. Off by default: without
    /// a human label they rarely mean anything to the reader.
    bool show_raw_kinds = false;
};

namespace detail {

inline constexpr std::size_t row_width = 16;
inline constexpr std::string_view caret = "^---";

/// Width of the "00000000:" header plus the separating space
inline constexpr std::size_t row_header_width = 10;

/**
 * Column at which the right-aligned caret ends so that its tip sits under the
 * first hex digit of the byte at @p offset.
 *
 * Hex pairs are laid out as " xxxx" groups (5 characters per two bytes); an odd
 * byte sits 2 characters into its group.
 */
[[nodiscard]] constexpr std::size_t caret_column(std::size_t offset) noexcept {
    const std::size_t line_offset = offset % row_width;
    return row_header_width + caret.size() + (line_offset / 2) * 5 + (line_offset % 2) * 2;
}

[[nodiscard]] constexpr bool is_printable(uint8_t byte) noexcept {
    return (byte >= 0x21 && byte <= 0x7E) || byte == ' ';
}

/**
 * Format one xxd-style row starting at @p line_begin:
 *
 * @code
 * 00000000: 0000 0000 0000 0000 0000 0000 0000 0000  ................
 * ^offset   ^16 bytes in {:02x} grouped by 2         ^ASCII panel
 * @endcode
 *
 * Columns past the end of @p input are padded with spaces; the ASCII panel stops
 * at the end of @p input.
 */
[[nodiscard]] inline std::string hexdump_row(Input input, std::size_t line_begin) {
    std::string row = fmt::format("{:08x}:", line_begin);
    auto out = std::back_inserter(row);

    const auto bytes = input.subspan(std::min(line_begin, input.size()));
    const auto count = std::min(bytes.size(), row_width);

    for (std::size_t i = 0; i < row_width; ++i) {
        if (i % 2 == 0) {
            row.push_back(' ');
        }
        if (i < count) {
            fmt::format_to(out, "{:02x}", bytes[i]);
        } else {
            row.append("  ");
        }
    }

    row.append("  ");

    for (std::size_t i = 0; i < count; ++i) {
        row.push_back(is_printable(bytes[i]) ? static_cast<char>(bytes[i]) : '.');
    }

    return row;
}

/// Label text for a context entry, debug name for a raw one
[[nodiscard]] inline std::string_view annotation_text(const Annotation& annotation) noexcept {
    if (const auto* label = std::get_if<ContextLabel>(&annotation)) {
        return label->text;
    }
    return error_kind_string(std::get<ErrorKind>(annotation));
}

} // namespace detail

/**
 * @brief Render @p trace as an annotated hexdump of @p input
 *
 * One block per rendered entry, in Trace order (innermost failure first), each
 * followed by a blank line:
 *
 * @code
 * 0: at offset 0x11, field X:
 * 00000010: 1011 1213 1415 1617 1819 1a1b 1c1d 1e1f  ................
 *             ^---
 * @endcode
 *
 * Entries carrying only a raw ErrorKind are skipped unless
 * RenderOptions::show_raw_kinds is set. For an empty @p input every entry
 * becomes a single `"<i>: in <annotation>, got empty input"` line. Entries whose
 * position lies outside @p input are skipped. The renderer does no I/O and
 * does not touch the logger; report_failure() logs what it skips.
 *
 * @param input The whole buffer the parse was started on. Every position in
 *              @p trace must be a sub-range of it.
 * @param trace Completed Trace
 * @param options Renderer settings
 * @return The report text
 */
[[nodiscard]] inline std::string render_trace(Input input, const Trace& trace,
                                              const RenderOptions& options = {}) {
    std::string result;
    auto out = std::back_inserter(result);

    for (std::size_t i = 0; i < trace.size(); ++i) {
        const auto& entry = trace[i];

        if (input.empty()) {
            fmt::format_to(out, "{}: in {}, got empty input\n\n", i,
                           detail::annotation_text(entry.annotation));
            continue;
        }

        const auto* label = std::get_if<ContextLabel>(&entry.annotation);
        if (label == nullptr && !options.show_raw_kinds) {
            continue;
        }

        if (!contains(input, entry.position)) {
            continue;
        }

        const std::size_t offset = offset_of(input, entry.position);
        const std::size_t line_begin = offset - (offset % detail::row_width);

        if (label != nullptr) {
            fmt::format_to(out, "{}: at offset {:#x}, {}:\n", i, offset, label->text);
        } else {
            fmt::format_to(out, "{}: at offset {:#x}, in {}:\n", i, offset,
                           detail::annotation_text(entry.annotation));
        }
        fmt::format_to(out, "{}\n{:>{}}\n\n", detail::hexdump_row(input, line_begin),
                       detail::caret, detail::caret_column(offset));
    }

    return result;
}

} // namespace bindiag
