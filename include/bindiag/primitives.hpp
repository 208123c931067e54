#pragma once

#include <algorithm>
#include <bit>
#include <concepts>
#include <initializer_list>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "error_kind.hpp"
#include "parse_result.hpp"
#include "position.hpp"

// Reference byte-level parsers.
//
// These are deliberately few. They exist so grammars have something that seeds a
// Trace with the right ErrorKind at the right position, and so the annotator and
// renderer can be exercised end to end. Everything here follows the same
// contract: a parser is a callable taking the current Input and returning
// ParseResult<T>.

namespace bindiag {

namespace detail {

template <std::unsigned_integral T, std::endian Order>
[[nodiscard]] constexpr T load(const uint8_t* bytes) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t shift =
            (Order == std::endian::little) ? (8 * i) : (8 * (sizeof(T) - 1 - i));
        value |= static_cast<T>(static_cast<T>(bytes[i]) << shift);
    }
    return value;
}

} // namespace detail

/**
 * @brief Consume exactly @p count bytes
 *
 * Fails with ErrorKind::eof at the current position when fewer bytes remain.
 */
[[nodiscard]] inline auto take(std::size_t count) {
    return [count](Input input) -> ParseResult<Input> {
        if (input.size() < count) {
            return make_failure(input, ErrorKind::eof);
        }
        return Parsed<Input>{input.subspan(count), input.first(count)};
    };
}

/**
 * @brief Match a fixed byte sequence
 *
 * The expected bytes are copied into the parser. Fails with ErrorKind::tag at
 * the current position on mismatch or short input.
 */
[[nodiscard]] inline auto tag(std::initializer_list<uint8_t> bytes) {
    return [pattern = std::vector<uint8_t>(bytes)](Input input) -> ParseResult<Input> {
        if (input.size() < pattern.size() ||
            !std::equal(pattern.begin(), pattern.end(), input.begin())) {
            return make_failure(input, ErrorKind::tag);
        }
        return Parsed<Input>{input.subspan(pattern.size()), input.first(pattern.size())};
    };
}

/// Match the raw bytes of an ASCII string (no terminator)
[[nodiscard]] inline auto tag(std::string_view text) {
    return [pattern = std::vector<uint8_t>(text.begin(), text.end())](
               Input input) -> ParseResult<Input> {
        if (input.size() < pattern.size() ||
            !std::equal(pattern.begin(), pattern.end(), input.begin())) {
            return make_failure(input, ErrorKind::tag);
        }
        return Parsed<Input>{input.subspan(pattern.size()), input.first(pattern.size())};
    };
}

/**
 * @brief Read an unsigned integer of type @p T in byte order @p Order
 *
 * Fails with ErrorKind::eof when fewer than `sizeof(T)` bytes remain.
 */
template <std::unsigned_integral T, std::endian Order>
[[nodiscard]] auto number() {
    return [](Input input) -> ParseResult<T> {
        if (input.size() < sizeof(T)) {
            return make_failure(input, ErrorKind::eof);
        }
        return Parsed<T>{input.subspan(sizeof(T)), detail::load<T, Order>(input.data())};
    };
}

[[nodiscard]] inline auto u8() {
    return number<uint8_t, std::endian::little>();
}
[[nodiscard]] inline auto le_u16() {
    return number<uint16_t, std::endian::little>();
}
[[nodiscard]] inline auto le_u32() {
    return number<uint32_t, std::endian::little>();
}
[[nodiscard]] inline auto le_u64() {
    return number<uint64_t, std::endian::little>();
}
[[nodiscard]] inline auto be_u16() {
    return number<uint16_t, std::endian::big>();
}
[[nodiscard]] inline auto be_u32() {
    return number<uint32_t, std::endian::big>();
}
[[nodiscard]] inline auto be_u64() {
    return number<uint64_t, std::endian::big>();
}

/**
 * @brief Run @p parser and reject values that fail @p predicate
 *
 * A rejected value fails with ErrorKind::verify at the position where
 * @p parser started.
 */
template <ParserLike P, typename Pred>
[[nodiscard]] auto verify(P parser, Pred predicate) {
    return [parser = std::move(parser), predicate = std::move(predicate)](
               Input input) mutable -> std::invoke_result_t<P&, Input> {
        auto result = parser(input);
        if (result.has_value() && !predicate(std::as_const(result->value))) {
            return make_failure(input, ErrorKind::verify);
        }
        return result;
    };
}

/**
 * @brief Read a length with @p length_parser, then take that many bytes
 *
 * Fails with ErrorKind::length_value at the start of the length field when the
 * declared length overruns the input.
 */
template <ParserLike P>
[[nodiscard]] auto length_data(P length_parser) {
    return [length_parser = std::move(length_parser)](Input input) mutable -> ParseResult<Input> {
        auto length = length_parser(input);
        if (!length.has_value()) {
            return unexpected(std::move(length).error());
        }
        auto rest = length->remaining;
        const auto size = static_cast<std::size_t>(length->value);
        if (rest.size() < size) {
            return make_failure(input, ErrorKind::length_value);
        }
        return Parsed<Input>{rest.subspan(size), rest.first(size)};
    };
}

namespace detail {

/// Upper bound, in bytes, of the storage count() reserves before parsing
inline constexpr std::size_t max_count_reserve = 65536;

} // namespace detail

/**
 * @brief Apply @p parser exactly @p times times in sequence
 *
 * The first failing repetition's Trace gets an ErrorKind::count entry at the
 * position where the repetition started. @p times often comes from the input
 * itself, so the up-front reservation is capped at detail::max_count_reserve
 * bytes.
 */
template <ParserLike P>
[[nodiscard]] auto count(P parser, std::size_t times) {
    using Value = parser_value_t<P>;
    return [parser = std::move(parser),
            times](Input input) mutable -> ParseResult<std::vector<Value>> {
        std::vector<Value> values;
        values.reserve(std::min(times, detail::max_count_reserve / sizeof(Value)));
        Input rest = input;
        for (std::size_t i = 0; i < times; ++i) {
            auto item = parser(rest);
            if (!item.has_value()) {
                auto failure = std::move(item).error();
                if (failure.severity != Severity::incomplete) {
                    failure.trace = std::move(failure.trace).append_kind(input, ErrorKind::count);
                }
                return unexpected(std::move(failure));
            }
            rest = item->remaining;
            values.push_back(std::move(item->value));
        }
        return Parsed<std::vector<Value>>{rest, std::move(values)};
    };
}

/**
 * @brief Require @p parser to consume the whole input
 *
 * Leftover bytes fail with ErrorKind::eof positioned at the first unconsumed
 * byte.
 */
template <ParserLike P>
[[nodiscard]] auto all_consuming(P parser) {
    return [parser = std::move(parser)](Input input) mutable -> std::invoke_result_t<P&, Input> {
        auto result = parser(input);
        if (result.has_value() && !result->remaining.empty()) {
            return make_failure(result->remaining, ErrorKind::eof);
        }
        return result;
    };
}

/**
 * @brief Promote recoverable failures of @p parser to fatal
 *
 * Used once a grammar has committed to a branch, so an enclosing alt() reports
 * this failure instead of trying siblings. The Trace is left untouched.
 */
template <ParserLike P>
[[nodiscard]] auto cut(P parser) {
    return [parser = std::move(parser)](Input input) mutable -> std::invoke_result_t<P&, Input> {
        auto result = parser(input);
        if (!result.has_value() && result.error().severity == Severity::recoverable) {
            result.error().severity = Severity::fatal;
        }
        return result;
    };
}

namespace detail {

template <typename Result, typename First, typename... Rest>
Result alt_step(Input input, First& first, Rest&... rest) {
    auto result = first(input);
    if (result.has_value() || result.error().severity != Severity::recoverable) {
        return result;
    }
    if constexpr (sizeof...(Rest) == 0) {
        auto& failure = result.error();
        failure.trace = std::move(failure.trace).append_kind(input, ErrorKind::alt);
        return result;
    } else {
        // The Trace of an abandoned branch is dropped, not merged.
        return alt_step<Result>(input, rest...);
    }
}

} // namespace detail

/**
 * @brief Try each parser in order and return the first success
 *
 * A recoverable failure moves on to the next alternative and its Trace is
 * discarded. A fatal or incomplete failure is returned immediately. When every
 * alternative fails, the last one's Trace is returned with an ErrorKind::alt
 * entry appended at the position the alternation started.
 *
 * All alternatives must produce the same value type.
 */
template <ParserLike First, ParserLike... Rest>
[[nodiscard]] auto alt(First first, Rest... rest)
    requires(std::same_as<parser_value_t<First>, parser_value_t<Rest>> && ...)
{
    return [first = std::move(first), ... rest = std::move(rest)](
               Input input) mutable -> std::invoke_result_t<First&, Input> {
        return detail::alt_step<std::invoke_result_t<First&, Input>>(input, first, rest...);
    };
}

} // namespace bindiag
