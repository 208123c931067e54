#pragma once

/**
 * @file bindiag.hpp
 * @brief Convenience header for the binary parse diagnostics library
 *
 * Primary types:
 * - Trace: ordered failure points gathered while a parse unwinds
 * - ParseResult: expected<Parsed<T>, ParseFailure> returned by every parser
 *
 * Functions:
 * - context(), context_fmt(), context_display(): label a parser's failures
 * - bail(), bail_fatal(), context_error(): fail with a labelled Trace
 * - render_trace(): hexdump report of a Trace against its input buffer
 * - report_failure(): render and log a terminal failure
 */

#include "bindiag/context.hpp"
#include "bindiag/error_kind.hpp"
#include "bindiag/expected.hpp"
#include "bindiag/log.hpp"
#include "bindiag/parse_result.hpp"
#include "bindiag/position.hpp"
#include "bindiag/primitives.hpp"
#include "bindiag/render.hpp"
#include "bindiag/report.hpp"
#include "bindiag/trace.hpp"
