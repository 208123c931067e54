#pragma once

#include <cstddef>
#include <string>
#include <variant>

#include "log.hpp"
#include "parse_result.hpp"
#include "position.hpp"
#include "render.hpp"
#include "trace.hpp"

namespace bindiag {

namespace detail {

/**
 * @brief Log, per entry, what render_trace() leaves out of the report
 *
 * Raw-kind entries hidden by @p options go out at trace level, entries outside
 * @p input at warn level.
 */
inline void log_skipped_entries(spdlog::logger& logger, Input input, const Trace& trace,
                                const RenderOptions& options) {
    if (input.empty()) {
        return;
    }
    for (std::size_t i = 0; i < trace.size(); ++i) {
        const auto& entry = trace[i];
        if (!is_context(entry.annotation) && !options.show_raw_kinds) {
            logger.trace("skipping raw entry {} ({})", i, annotation_text(entry.annotation));
        } else if (!contains(input, entry.position)) {
            logger.warn("trace entry {} does not point into the rendered buffer", i);
        }
    }
}

} // namespace detail

/**
 * @brief Render a terminal parse failure and log it
 *
 * Logs the failure summary and the full rendered trace at error level through
 * the library logger, and returns the rendered trace so the caller can also
 * print or store it. Entries the renderer skips are logged at trace level (raw
 * kinds) or warn level (positions outside @p input).
 *
 * @param input The whole buffer the failed parse was started on
 * @param failure The failure returned by the top-level parser
 * @param options Renderer settings
 * @return The rendered trace
 */
inline std::string report_failure(Input input, const ParseFailure& failure,
                                  const RenderOptions& options = {}) {
    auto logger = log::logger();
    logger->debug("rendering trace of {} entries against {} bytes", failure.trace.size(),
                  input.size());
    detail::log_skipped_entries(*logger, input, failure.trace, options);

    auto report = render_trace(input, failure.trace, options);
    logger->error("parse failed ({}): {}\n{}", severity_string(failure.severity),
                  failure.summary(), report);
    return report;
}

} // namespace bindiag
