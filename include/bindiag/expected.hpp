#pragma once

// BINDIAG Expected Type
//
// Exposes tl::expected in the bindiag namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   bindiag::ParseResult<T> result = parser(input);
//   if (result.has_value()) {
//       consume(result->value, result->remaining);
//   } else {
//       report(result.error().trace);
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace bindiag {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace bindiag
