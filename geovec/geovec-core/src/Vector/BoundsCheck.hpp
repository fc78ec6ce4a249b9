#ifndef GEOVEC_BOUNDS_CHECK_HPP
#define GEOVEC_BOUNDS_CHECK_HPP

#include <cstddef>
#include <stdexcept>

#include <fmt/format.h>

#include "geovec-core/src/Config.hpp"
#include "geovec-utils/src/Logging.hpp"

namespace geovec::detail
{

/**
 * @brief Log and raise an out-of-range component access
 *
 * An invalid index is a programming error. It is never mapped to a sentinel
 * value, since a bogus coordinate would flow silently into downstream
 * geometric predicates.
 *
 * @throws std::out_of_range always
 */
[[noreturn]] inline void reportIndexOutOfRange(std::size_t index,
                                               std::size_t dimensions)
{
  geovec_utils::getLogger()->critical(
    "Component index {} out of range for {}-D vector", index, dimensions);
  throw std::out_of_range(fmt::format(
    "Component index {} out of range for {}-D vector", index, dimensions));
}

/// No-op unless GEOVEC_BOUNDS_CHECK is enabled.
inline void checkIndex(std::size_t index, std::size_t dimensions)
{
  if constexpr (BOUNDS_CHECK_ENABLED)
  {
    if (index >= dimensions)
    {
      reportIndexOutOfRange(index, dimensions);
    }
  }
}

}  // namespace geovec::detail

#endif  // GEOVEC_BOUNDS_CHECK_HPP
