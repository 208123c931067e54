#pragma once

#include <cstdint>

namespace bindiag {

/**
 * @brief Low-level classifier emitted by a primitive parser when it fails
 *
 * These codes describe *how* a basic consumption step failed. They are recorded
 * in the Trace for completeness but carry no human context, so the renderer
 * keeps them out of the default report.
 *
 * The built-in primitives emit tag, alt, count, length_value, verify and eof.
 * The remaining kinds are reserved for grammars written on top of the library,
 * which report them through make_failure().
 */
enum class ErrorKind : uint8_t {
    tag,            ///< Expected byte sequence not found
    map_res,        ///< Conversion of a parsed value failed
    map_opt,        ///< Conversion of a parsed value produced nothing
    alt,            ///< Every alternative failed
    is_not,         ///< Byte set scan matched nothing
    is_a,           ///< Byte set scan matched nothing
    separated_list, ///< Separated list could not be parsed
    many0,          ///< Repetition did not consume input
    many1,          ///< Repetition matched fewer than one element
    many_till,      ///< Repetition never reached its terminator
    count,          ///< Fixed repetition produced fewer elements than required
    take_until,     ///< Terminator sequence not found
    length_value,   ///< Length-prefixed block overruns the input
    verify,         ///< Parsed value failed its predicate
    eof,            ///< Not enough bytes left
    complete,       ///< Trailing bytes after a complete parse
    non_empty,      ///< Input was empty where bytes were required
    too_large,      ///< Declared size exceeds what can be represented
    fail            ///< Unconditional failure
};

/**
 * @brief Debug name of an ErrorKind
 *
 * Returns the identifier spelled in PascalCase ("Eof", "Alt", ...). This is the
 * text shown for raw classifier entries in empty-input reports and when the
 * renderer's raw-kind output is enabled.
 */
[[nodiscard]] constexpr const char* error_kind_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::tag:
            return "Tag";
        case ErrorKind::map_res:
            return "MapRes";
        case ErrorKind::map_opt:
            return "MapOpt";
        case ErrorKind::alt:
            return "Alt";
        case ErrorKind::is_not:
            return "IsNot";
        case ErrorKind::is_a:
            return "IsA";
        case ErrorKind::separated_list:
            return "SeparatedList";
        case ErrorKind::many0:
            return "Many0";
        case ErrorKind::many1:
            return "Many1";
        case ErrorKind::many_till:
            return "ManyTill";
        case ErrorKind::count:
            return "Count";
        case ErrorKind::take_until:
            return "TakeUntil";
        case ErrorKind::length_value:
            return "LengthValue";
        case ErrorKind::verify:
            return "Verify";
        case ErrorKind::eof:
            return "Eof";
        case ErrorKind::complete:
            return "Complete";
        case ErrorKind::non_empty:
            return "NonEmpty";
        case ErrorKind::too_large:
            return "TooLarge";
        case ErrorKind::fail:
            return "Fail";
    }
    return "Unknown";
}

} // namespace bindiag
