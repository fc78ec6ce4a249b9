// Ticket: 0003_dimensional_markers

#ifndef GEOVEC_DIMENSIONAL_TRAITS_HPP
#define GEOVEC_DIMENSIONAL_TRAITS_HPP

#include <type_traits>

#include "geovec-core/src/Vector/VectorExtensions.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

namespace geovec
{

/**
 * @brief Opt-in tag declaring that V has exactly two components
 *
 * Bindings specialize this as std::true_type. Algorithms that only make
 * sense in the plane constrain on TwoDimensional instead of VectorN, so
 * higher-dimensional inputs are rejected at the call site.
 */
template <typename V>
struct EnableTwoDimensional : std::false_type
{
};

/**
 * @brief Opt-in tag declaring that V has exactly three components
 *
 * Unlocks cross().
 */
template <typename V>
struct EnableThreeDimensional : std::false_type
{
};

/**
 * @brief A vector type known at compile time to be two dimensional
 *
 * A tag that disagrees with the binding's dimensions() does not satisfy the
 * concept.
 */
template <typename V>
concept TwoDimensional =
  VectorN<V> && EnableTwoDimensional<V>::value && (dimensions<V>() == 2);

/// A vector type known at compile time to be three dimensional.
template <typename V>
concept ThreeDimensional =
  VectorN<V> && EnableThreeDimensional<V>::value && (dimensions<V>() == 3);

/**
 * @brief Right-handed cross product
 *
 * @return lhs x rhs
 */
template <ThreeDimensional V>
V cross(const V& lhs, const V& rhs)
{
  using Traits = VectorTraits<V>;
  const auto& l0 = Traits::nth(lhs, 0);
  const auto& l1 = Traits::nth(lhs, 1);
  const auto& l2 = Traits::nth(lhs, 2);
  const auto& r0 = Traits::nth(rhs, 0);
  const auto& r1 = Traits::nth(rhs, 1);
  const auto& r2 = Traits::nth(rhs, 2);

  V result = zeroVector<V>();
  Traits::nthMut(result, 0) = l1 * r2 - l2 * r1;
  Traits::nthMut(result, 1) = l2 * r0 - l0 * r2;
  Traits::nthMut(result, 2) = l0 * r1 - l1 * r0;
  return result;
}

}  // namespace geovec

#endif  // GEOVEC_DIMENSIONAL_TRAITS_HPP
