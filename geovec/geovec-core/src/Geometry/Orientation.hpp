// Ticket: 0007_orientation_predicates

#ifndef GEOVEC_ORIENTATION_HPP
#define GEOVEC_ORIENTATION_HPP

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

/**
 * @file Orientation.hpp
 * @brief Orientation predicates restricted by dimension
 *
 * Planar predicates accept only TwoDimensional vectors and the triangle
 * normal only ThreeDimensional ones, so passing e.g. a 4-component vector
 * fails to compile instead of producing a meaningless value.
 *
 * Predicates are evaluated in the scalar type's own arithmetic. They are
 * exact for integer scalars and subject to rounding for floating point.
 */

namespace geovec
{

/**
 * @brief Twice the signed area of the triangle (a, b, p)
 *
 * @return > 0 if p lies to the left of the directed line a -> b,
 *         < 0 if to the right, 0 if the three points are collinear
 */
template <TwoDimensional V>
ScalarOf<V> sideQuery(const V& a, const V& b, const V& p)
{
  auto const ab = sub(b, a);
  auto const ap = sub(p, a);
  return nth(ab, 0) * nth(ap, 1) - nth(ab, 1) * nth(ap, 0);
}

/// True if a, b, c form a strictly counter-clockwise triangle.
template <TwoDimensional V>
bool isCounterClockwise(const V& a, const V& b, const V& c)
{
  return zero<ScalarOf<V>>() < sideQuery(a, b, c);
}

/**
 * @brief Unnormalized normal of triangle (a, b, c)
 *
 * Points towards the side from which a, b, c appear counter-clockwise. The
 * length equals twice the triangle's area; degenerate triangles give the
 * zero vector.
 */
template <ThreeDimensional V>
V triangleNormal(const V& a, const V& b, const V& c)
{
  return cross(sub(b, a), sub(c, a));
}

}  // namespace geovec

#endif  // GEOVEC_ORIENTATION_HPP
