#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

namespace bindiag {

/**
 * @brief Borrowed view of the bytes a parser is looking at
 *
 * Every Input handed around during a parse is a sub-range of the one buffer the
 * top-level parser was started on. Positions are never copied out of that
 * buffer, so an Input must not outlive it.
 */
using Input = std::span<const uint8_t>;

/**
 * @brief Byte offset of @p part from the start of @p whole
 *
 * Computed from the base addresses, not by searching for equal bytes. A
 * zero-length @p part positioned exactly at the end of @p whole yields
 * `whole.size()`.
 *
 * @pre @p part lies within @p whole (both derived from the same buffer)
 */
[[nodiscard]] inline std::size_t offset_of(Input whole, Input part) noexcept {
    return static_cast<std::size_t>(part.data() - whole.data());
}

/**
 * @brief Check that @p part is a sub-range of @p whole
 *
 * Useful for asserting that a Trace was produced from the buffer it is about to
 * be rendered against.
 */
[[nodiscard]] inline bool contains(Input whole, Input part) noexcept {
    auto base = reinterpret_cast<std::uintptr_t>(whole.data());
    auto first = reinterpret_cast<std::uintptr_t>(part.data());
    return first >= base && first + part.size() <= base + whole.size();
}

} // namespace bindiag
