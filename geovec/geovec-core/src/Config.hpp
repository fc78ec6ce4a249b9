#ifndef GEOVEC_CONFIG_HPP
#define GEOVEC_CONFIG_HPP

/**
 * @file Config.hpp
 * @brief Compile-time configuration for geovec
 *
 * GEOVEC_BOUNDS_CHECK controls validation of component indices passed to
 * geovec::nth() and geovec::nthMut(). It follows NDEBUG unless set
 * explicitly (the CMake option GEOVEC_ALWAYS_BOUNDS_CHECK sets it to 1).
 *
 * The value must be the same in every translation unit of a program:
 * nth() and nthMut() are inline, and mixing NDEBUG and non-NDEBUG objects
 * gives them two different definitions. Set GEOVEC_BOUNDS_CHECK project-wide
 * (or use GEOVEC_ALWAYS_BOUNDS_CHECK) when NDEBUG differs between targets.
 */

#ifndef GEOVEC_BOUNDS_CHECK
#ifdef NDEBUG
#define GEOVEC_BOUNDS_CHECK 0
#else
#define GEOVEC_BOUNDS_CHECK 1
#endif
#endif

#if GEOVEC_BOUNDS_CHECK != 0 && GEOVEC_BOUNDS_CHECK != 1
#error "GEOVEC_BOUNDS_CHECK must be 0 or 1"
#endif

#define GEOVEC_VERSION_MAJOR 0
#define GEOVEC_VERSION_MINOR 1
#define GEOVEC_VERSION_PATCH 0

namespace geovec
{

inline constexpr bool BOUNDS_CHECK_ENABLED = GEOVEC_BOUNDS_CHECK != 0;

}  // namespace geovec

#endif  // GEOVEC_CONFIG_HPP
