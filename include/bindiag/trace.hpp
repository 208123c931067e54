#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>

#include "error_kind.hpp"
#include "position.hpp"

namespace bindiag {

/**
 * @brief Human-readable label attached by a context annotator
 */
struct ContextLabel {
    std::string text;

    friend bool operator==(const ContextLabel&, const ContextLabel&) = default;
};

/**
 * @brief What a Trace entry says about its position
 *
 * Either a raw classifier produced by a primitive (ErrorKind) or a context label
 * added while the failure propagated outward.
 */
using Annotation = std::variant<ErrorKind, ContextLabel>;

[[nodiscard]] inline bool is_context(const Annotation& annotation) noexcept {
    return std::holds_alternative<ContextLabel>(annotation);
}

[[nodiscard]] inline bool is_error_kind(const Annotation& annotation) noexcept {
    return std::holds_alternative<ErrorKind>(annotation);
}

/**
 * @brief One failure point: where it happened and what was being attempted
 */
struct TraceEntry {
    Input position;
    Annotation annotation;

    /// Structural equality: same address range and same annotation
    friend bool operator==(const TraceEntry& lhs, const TraceEntry& rhs) noexcept {
        return lhs.position.data() == rhs.position.data() &&
               lhs.position.size() == rhs.position.size() && lhs.annotation == rhs.annotation;
    }
};

/**
 * @brief Ordered record of failure points gathered while unwinding a parse
 *
 * Entry 0 is the innermost failure; each enclosing layer appends after it. A
 * Trace is seeded with exactly one entry by the primitive (or leaf) that fails
 * first and then only grows. Entries are never removed, reordered, or merged.
 *
 * Trace is a plain value. The append operations take `*this` by rvalue so a
 * failure can be grown and passed on without copying:
 * @code
 *   return unexpected(ParseFailure{f.severity,
 *                                  std::move(f.trace).add_context(input, "header")});
 * @endcode
 */
class Trace {
public:
    using const_iterator = std::vector<TraceEntry>::const_iterator;

    /// Build a one-entry Trace
    [[nodiscard]] static Trace seed(Input position, Annotation annotation) {
        Trace trace;
        trace.entries_.push_back(TraceEntry{position, std::move(annotation)});
        return trace;
    }

    [[nodiscard]] static Trace from_error_kind(Input position, ErrorKind kind) {
        return seed(position, kind);
    }

    [[nodiscard]] static Trace from_context(Input position, std::string label) {
        return seed(position, ContextLabel{std::move(label)});
    }

    /// Append an entry at the end and return the grown Trace
    [[nodiscard]] Trace append(Input position, Annotation annotation) && {
        entries_.push_back(TraceEntry{position, std::move(annotation)});
        return std::move(*this);
    }

    [[nodiscard]] Trace append_kind(Input position, ErrorKind kind) && {
        return std::move(*this).append(position, kind);
    }

    [[nodiscard]] Trace add_context(Input position, std::string label) && {
        return std::move(*this).append(position, ContextLabel{std::move(label)});
    }

    const std::vector<TraceEntry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const TraceEntry& operator[](std::size_t index) const { return entries_[index]; }
    const TraceEntry& front() const { return entries_.front(); }
    const TraceEntry& back() const { return entries_.back(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /// Number of entries carrying a context label
    std::size_t context_count() const noexcept {
        return static_cast<std::size_t>(std::count_if(
            entries_.begin(), entries_.end(),
            [](const TraceEntry& entry) { return is_context(entry.annotation); }));
    }

    friend bool operator==(const Trace&, const Trace&) = default;

private:
    Trace() = default;

    std::vector<TraceEntry> entries_;
};

/**
 * @brief Append @p annotation at @p position to @p trace
 *
 * Value-semantics form of Trace::append(): each layer owns the Trace it grows.
 */
[[nodiscard]] inline Trace append(Trace trace, Input position, Annotation annotation) {
    return std::move(trace).append(position, std::move(annotation));
}

} // namespace bindiag
