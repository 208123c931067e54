#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "parse_result.hpp"
#include "position.hpp"
#include "trace.hpp"

namespace bindiag {

namespace detail {

/**
 * Deferred label: a zero-argument callable whose result becomes the label text.
 * It is only invoked on the failure path.
 */
template <typename F>
concept LabelSource =
    std::invocable<F&> && std::convertible_to<std::invoke_result_t<F&>, std::string>;

} // namespace detail

// ==========
// Context annotator
// ==========

/**
 * @brief Label a parser so its failures record what was being attempted
 *
 * Runs @p parser on the input. On success the result is returned untouched and
 * @p label is never called. On a recoverable or fatal failure, a Context entry
 * holding `label()` and the input *as seen by this wrapper* (not the inner
 * failure position) is appended to the Trace; the severity is left as is so
 * enclosing alternations still behave the same. Incomplete failures pass
 * through without annotation.
 *
 * @param label Callable producing the label text, evaluated only on failure
 * @param parser Inner parser
 * @return A parser with the same result type as @p parser
 */
template <detail::LabelSource F, ParserLike P>
[[nodiscard]] auto context(F label, P parser) {
    return [label = std::move(label),
            parser = std::move(parser)](Input input) mutable -> std::invoke_result_t<P&, Input> {
        auto result = parser(input);
        if (result.has_value()) {
            return result;
        }
        auto& failure = result.error();
        if (failure.severity == Severity::incomplete) {
            return result;
        }
        failure.trace = std::move(failure.trace).add_context(input, std::string(label()));
        return result;
    };
}

/**
 * @brief Label a parser with a fixed string
 *
 * The pointer is captured as is; pass a string literal or another string that
 * outlives the returned parser.
 */
template <ParserLike P>
[[nodiscard]] auto context(const char* label, P parser) {
    return context([label] { return std::string(label); }, std::move(parser));
}

/// Label a parser with a string computed ahead of time
template <ParserLike P>
[[nodiscard]] auto context(std::string label, P parser) {
    return context([label = std::move(label)] { return label; }, std::move(parser));
}

/**
 * @brief Label a parser with a formatted string
 *
 * The format string is checked at compile time. Arguments are captured by
 * value and only formatted if @p parser fails.
 *
 * @code
 *   auto field = bindiag::context_fmt(le_u32(), "field `{}` (4-byte little-endian)", name);
 * @endcode
 */
template <ParserLike P, typename... Args>
[[nodiscard]] auto context_fmt(P parser, fmt::format_string<Args...> format, Args&&... args) {
    return context(
        [format, ... captured = std::forward<Args>(args)] {
            return fmt::vformat(fmt::string_view(format), fmt::make_format_args(captured...));
        },
        std::move(parser));
}

/**
 * @brief Label a parser with the textual rendering of @p payload
 *
 * @p payload must be formattable by fmt. It is copied into the returned parser
 * and converted to text only on failure.
 */
template <ParserLike P, typename T>
[[nodiscard]] auto context_display(P parser, T payload) {
    return context([payload = std::move(payload)] { return fmt::format("{}", payload); },
                   std::move(parser));
}

// ==========
// Leaf failures
// ==========

/**
 * @brief Failure whose Trace is seeded with a context label
 *
 * For parsers that detect a semantic problem themselves (bad magic, unknown
 * version) and want the innermost entry to already be human readable.
 */
[[nodiscard]] inline ParseFailure context_error(Input input, std::string_view label,
                                                Severity severity = Severity::recoverable) {
    return ParseFailure{severity, Trace::from_context(input, std::string(label))};
}

/// Formatted variant of context_error()
template <typename Arg, typename... Args>
[[nodiscard]] ParseFailure context_error(Input input, fmt::format_string<Arg, Args...> format,
                                         Arg&& arg, Args&&... args) {
    return ParseFailure{
        Severity::recoverable,
        Trace::from_context(input, fmt::format(format, std::forward<Arg>(arg),
                                               std::forward<Args>(args)...))};
}

/**
 * @brief Recoverable failure result seeded with a context label
 *
 * @code
 *   if (magic != 0x4B4E5243) {
 *       return bindiag::bail(input, "bad magic {:#010x}", magic);
 *   }
 * @endcode
 */
[[nodiscard]] inline unexpected<ParseFailure> bail(Input input, std::string_view label) {
    return unexpected(context_error(input, label));
}

template <typename Arg, typename... Args>
[[nodiscard]] unexpected<ParseFailure> bail(Input input, fmt::format_string<Arg, Args...> format,
                                            Arg&& arg, Args&&... args) {
    return unexpected(context_error(input, format, std::forward<Arg>(arg),
                                    std::forward<Args>(args)...));
}

/// Like bail(), but the failure must not be retried by an enclosing alternation
[[nodiscard]] inline unexpected<ParseFailure> bail_fatal(Input input, std::string_view label) {
    return unexpected(context_error(input, label, Severity::fatal));
}

template <typename Arg, typename... Args>
[[nodiscard]] unexpected<ParseFailure> bail_fatal(Input input,
                                                  fmt::format_string<Arg, Args...> format,
                                                  Arg&& arg, Args&&... args) {
    auto failure =
        context_error(input, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
    failure.severity = Severity::fatal;
    return unexpected(std::move(failure));
}

} // namespace bindiag
