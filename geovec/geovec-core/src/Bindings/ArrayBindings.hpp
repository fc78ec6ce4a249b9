// Ticket: 0004_concrete_bindings

#ifndef GEOVEC_ARRAY_BINDINGS_HPP
#define GEOVEC_ARRAY_BINDINGS_HPP

#include <array>
#include <cstddef>
#include <type_traits>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

/**
 * @file ArrayBindings.hpp
 * @brief Vector capability for std::array<S, 2>, <S, 3> and <S, 4>
 *
 * Lets plain arrays serve as point coordinates. Since the extension
 * functions then apply to every such array, be deliberate about where
 * this header is included.
 */

namespace geovec
{

template <GeoScalar S, std::size_t N>
  requires(N >= 2 && N <= 4)
struct VectorTraits<std::array<S, N>>
{
  using Scalar = S;

  static constexpr std::size_t dimensions()
  {
    return N;
  }

  static std::array<S, N> fromValue(const S& value)
  {
    std::array<S, N> result;
    result.fill(value);
    return result;
  }

  static const S& nth(const std::array<S, N>& vec, std::size_t index)
  {
    return vec[index];
  }

  static S& nthMut(std::array<S, N>& vec, std::size_t index)
  {
    return vec[index];
  }
};

template <GeoScalar S>
struct EnableTwoDimensional<std::array<S, 2>> : std::true_type
{
};

template <GeoScalar S>
struct EnableThreeDimensional<std::array<S, 3>> : std::true_type
{
};

}  // namespace geovec

#endif  // GEOVEC_ARRAY_BINDINGS_HPP
