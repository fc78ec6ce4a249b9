// Ticket: 0002_vector_extensions

#ifndef GEOVEC_VECTOR_EXTENSIONS_HPP
#define GEOVEC_VECTOR_EXTENSIONS_HPP

#include <cmath>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

/**
 * @file VectorExtensions.hpp
 * @brief Operations derived from the vector capability
 *
 * Every function here is written against VectorTraits alone, so a new
 * binding gets all of them without further work. Inputs are never modified;
 * each operation returns a fresh value.
 *
 * Components are read through the raw traits accessors: loop indices are
 * bounded by dimensions<V>() and need no validation.
 */

namespace geovec
{

/// Vector with all components set to zero.
template <VectorN V>
V zeroVector()
{
  return VectorTraits<V>::fromValue(zero<ScalarOf<V>>());
}

/**
 * @brief Apply a binary scalar operation component by component
 *
 * result[i] = f(lhs[i], rhs[i]) for i in [0, dimensions<V>()).
 */
template <VectorN V, typename F>
  requires std::invocable<F&, const ScalarOf<V>&, const ScalarOf<V>&>
V componentWise(const V& lhs, const V& rhs, F f)
{
  using Traits = VectorTraits<V>;
  V result = lhs;
  for (std::size_t i = 0; i < Traits::dimensions(); ++i)
  {
    Traits::nthMut(result, i) = f(Traits::nth(lhs, i), Traits::nth(rhs, i));
  }
  return result;
}

/**
 * @brief Apply a unary scalar operation component by component
 *
 * The result type may differ from the source type but must have the same
 * dimension; a mismatch is rejected at compile time.
 *
 * @tparam O Result vector type
 */
template <VectorN O, VectorN V, typename F>
  requires(dimensions<O>() == dimensions<V>()) &&
          std::invocable<F&, const ScalarOf<V>&>
O map(const V& vec, F f)
{
  using Traits = VectorTraits<V>;
  O result = zeroVector<O>();
  for (std::size_t i = 0; i < Traits::dimensions(); ++i)
  {
    VectorTraits<O>::nthMut(result, i) = f(Traits::nth(vec, i));
  }
  return result;
}

template <VectorN V>
V add(const V& lhs, const V& rhs)
{
  return componentWise(
    lhs, rhs, [](const auto& l, const auto& r) { return l + r; });
}

template <VectorN V>
V sub(const V& lhs, const V& rhs)
{
  return componentWise(
    lhs, rhs, [](const auto& l, const auto& r) { return l - r; });
}

/// Multiplies every component by scalar.
template <VectorN V>
V mul(const V& vec, const ScalarOf<V>& scalar)
{
  return map<V>(vec, [&scalar](const auto& x) { return x * scalar; });
}

/// Divides every component by scalar. Division by zero follows the scalar
/// type's own semantics.
template <VectorN V>
V div(const V& vec, const ScalarOf<V>& scalar)
{
  return map<V>(vec, [&scalar](const auto& x) { return x / scalar; });
}

template <VectorN V>
V neg(const V& vec)
{
  return map<V>(vec,
                [](const auto& x) { return zero<ScalarOf<V>>() - x; });
}

/// Component-wise minimum.
template <VectorN V>
V minVec(const V& lhs, const V& rhs)
{
  return componentWise(lhs, rhs, [](const auto& l, const auto& r) {
    return minInline<ScalarOf<V>>(l, r);
  });
}

/// Component-wise maximum.
template <VectorN V>
V maxVec(const V& lhs, const V& rhs)
{
  return componentWise(lhs, rhs, [](const auto& l, const auto& r) {
    return maxInline<ScalarOf<V>>(l, r);
  });
}

/**
 * @brief Left fold over the components in index order
 *
 * acc = f(acc, vec[0]), then f(acc, vec[1]), ... Order matters for
 * non-commutative f.
 *
 * @param vec Vector to reduce
 * @param acc Initial accumulator
 * @param f Callable (T, Scalar) -> T
 * @return Final accumulator
 */
template <VectorN V, typename T, typename F>
  requires std::invocable<F&, T, const ScalarOf<V>&>
T fold(const V& vec, T acc, F f)
{
  using Traits = VectorTraits<V>;
  for (std::size_t i = 0; i < Traits::dimensions(); ++i)
  {
    acc = f(std::move(acc), Traits::nth(vec, i));
  }
  return acc;
}

/**
 * @brief Check that a predicate holds at every index
 *
 * Stops at the first index (ascending) where the predicate fails.
 */
template <VectorN V, typename P>
  requires std::predicate<P&, const ScalarOf<V>&, const ScalarOf<V>&>
bool allCompWise(const V& lhs, const V& rhs, P predicate)
{
  using Traits = VectorTraits<V>;
  for (std::size_t i = 0; i < Traits::dimensions(); ++i)
  {
    if (!predicate(Traits::nth(lhs, i), Traits::nth(rhs, i)))
    {
      return false;
    }
  }
  return true;
}

template <VectorN V>
ScalarOf<V> dot(const V& lhs, const V& rhs)
{
  using S = ScalarOf<V>;
  auto const products =
    componentWise(lhs, rhs, [](const S& l, const S& r) { return l * r; });
  return fold(products, zero<S>(), [](S acc, const S& x) { return acc + x; });
}

/// Squared euclidean length. No square root is taken, so the result stays
/// exact for integer and rational scalars.
template <VectorN V>
ScalarOf<V> length2(const V& vec)
{
  return dot(vec, vec);
}

/// Squared euclidean distance between two points.
template <VectorN V>
ScalarOf<V> distance2(const V& lhs, const V& rhs)
{
  return length2(sub(lhs, rhs));
}

// Helper tolerance for floating-point comparisons
inline constexpr double TOLERANCE = 1e-10;

/// True if every pair of components differs by less than tolerance.
template <VectorN V>
  requires std::floating_point<ScalarOf<V>>
bool almostEqual(const V& lhs, const V& rhs, double tolerance = TOLERANCE)
{
  return allCompWise(lhs, rhs, [tolerance](const auto& l, const auto& r) {
    return std::abs(l - r) < tolerance;
  });
}

}  // namespace geovec

#endif  // GEOVEC_VECTOR_EXTENSIONS_HPP
