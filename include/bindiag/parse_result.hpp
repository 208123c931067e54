#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <cstdint>

#include "error_kind.hpp"
#include "expected.hpp"
#include "position.hpp"
#include "trace.hpp"

namespace bindiag {

/**
 * @brief Control-flow classification of a failure
 *
 * Orthogonal to the Trace: it tells enclosing combinators what they may do next,
 * while the Trace tells the user what went wrong.
 */
enum class Severity : uint8_t {
    recoverable, ///< Sibling alternatives may still be tried
    fatal,       ///< Abort the whole alternation; do not try siblings
    incomplete   ///< Streaming input ran short; more data could make it succeed
};

[[nodiscard]] constexpr const char* severity_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::recoverable:
            return "recoverable";
        case Severity::fatal:
            return "fatal";
        case Severity::incomplete:
            return "incomplete";
    }
    return "unknown";
}

/**
 * @brief Error half of a ParseResult
 */
struct ParseFailure {
    Severity severity; ///< How enclosing combinators must react
    Trace trace;       ///< Failure points, innermost first

    [[nodiscard]] bool is_fatal() const noexcept { return severity == Severity::fatal; }
    [[nodiscard]] bool is_incomplete() const noexcept { return severity == Severity::incomplete; }

    /**
     * @brief Outermost context label, or the innermost raw kind name if no
     *        layer added a label
     *
     * Empty for a failure whose Trace has been moved out.
     */
    [[nodiscard]] std::string_view summary() const {
        if (trace.empty()) {
            return {};
        }
        for (auto it = trace.entries().rbegin(); it != trace.entries().rend(); ++it) {
            if (const auto* label = std::get_if<ContextLabel>(&it->annotation)) {
                return label->text;
            }
        }
        if (const auto* kind = std::get_if<ErrorKind>(&trace.front().annotation)) {
            return error_kind_string(*kind);
        }
        return {};
    }

    friend bool operator==(const ParseFailure&, const ParseFailure&) = default;
};

/**
 * @brief Success half of a ParseResult: the value and what is left to parse
 */
template <typename T>
struct Parsed {
    Input remaining;
    T value;
};

/**
 * @brief Result type of every parser
 *
 * Holds either the parsed value with the remaining input, or a ParseFailure with
 * its Trace.
 *
 * Usage:
 * @code
 *   auto result = header_parser(buffer);
 *   if (result.has_value()) {
 *       auto next = result->remaining;
 *   } else {
 *       std::cerr << bindiag::render_trace(buffer, result.error().trace);
 *   }
 * @endcode
 *
 * @tparam T The type produced on success
 */
template <typename T>
using ParseResult = expected<Parsed<T>, ParseFailure>;

/**
 * @brief Anything callable as `ParseResult<T>(Input)`
 */
template <typename P>
concept ParserLike = std::invocable<P&, Input> && requires(P& p, Input in) {
    { p(in).has_value() } -> std::convertible_to<bool>;
    { p(in).error() } -> std::convertible_to<const ParseFailure&>;
    p(in)->remaining;
    p(in)->value;
};

/// Value type produced by parser @p P
template <ParserLike P>
using parser_value_t =
    std::remove_cvref_t<decltype(std::declval<std::invoke_result_t<P&, Input>>()->value)>;

/**
 * @brief Parser producing exactly @p T
 */
template <typename P, typename T>
concept Parser = ParserLike<P> && std::same_as<parser_value_t<P>, T>;

// ==========
// Failure factory
// ==========

/**
 * @brief Failure seeded with a raw classifier at @p position
 */
[[nodiscard]] inline unexpected<ParseFailure>
make_failure(Input position, ErrorKind kind, Severity severity = Severity::recoverable) {
    return unexpected(ParseFailure{severity, Trace::from_error_kind(position, kind)});
}

} // namespace bindiag
