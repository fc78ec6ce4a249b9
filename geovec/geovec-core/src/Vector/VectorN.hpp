// Ticket: 0001_vector_capability

#ifndef GEOVEC_VECTOR_N_HPP
#define GEOVEC_VECTOR_N_HPP

#include <concepts>
#include <cstddef>
#include <utility>

#include <fmt/core.h>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/BoundsCheck.hpp"

namespace geovec
{

/**
 * @brief Customization point binding a concrete type to the vector capability
 *
 * The primary template is intentionally undefined. A binding specializes it
 * and provides:
 *
 *   using Scalar = ...;                                  // a GeoScalar
 *   static constexpr std::size_t dimensions();           // 2, 3 or 4
 *   static V fromValue(Scalar value);                    // broadcast
 *   static const Scalar& nth(const V& vec, std::size_t index);
 *   static Scalar& nthMut(V& vec, std::size_t index);
 *
 * nth() and nthMut() are raw accessors and may assume a valid index; the
 * free functions geovec::nth() and geovec::nthMut() validate it first.
 * Also consider enabling EnableTwoDimensional or EnableThreeDimensional
 * (DimensionalTraits.hpp) for the bound type.
 *
 * @tparam V Concrete vector type
 */
template <typename V>
struct VectorTraits;

/**
 * @brief Concept for a fixed-size vector type with a bound VectorTraits
 *
 * The dimension must be a positive compile-time constant. Equality, copy and
 * an fmt formatter for the scalar are required so that every vector can be
 * compared and printed (see VecFormatter.hpp).
 */
template <typename V>
concept VectorN =
  std::copyable<V> && std::equality_comparable<V> &&
  requires(V vec, const V cvec, std::size_t index) {
    typename VectorTraits<V>::Scalar;
    requires GeoScalar<typename VectorTraits<V>::Scalar>;
    requires fmt::is_formattable<typename VectorTraits<V>::Scalar>::value;
    { VectorTraits<V>::dimensions() } -> std::same_as<std::size_t>;
    requires(VectorTraits<V>::dimensions() > 0);
    {
      VectorTraits<V>::fromValue(
        std::declval<typename VectorTraits<V>::Scalar>())
    } -> std::same_as<V>;
    {
      VectorTraits<V>::nth(cvec, index)
    } -> std::same_as<const typename VectorTraits<V>::Scalar&>;
    {
      VectorTraits<V>::nthMut(vec, index)
    } -> std::same_as<typename VectorTraits<V>::Scalar&>;
  };

/// Component type of a vector.
template <VectorN V>
using ScalarOf = typename VectorTraits<V>::Scalar;

/// The fixed number of components of V.
template <VectorN V>
constexpr std::size_t dimensions()
{
  return VectorTraits<V>::dimensions();
}

/// Creates a vector with every component set to value.
template <VectorN V>
V fromValue(const ScalarOf<V>& value)
{
  return VectorTraits<V>::fromValue(value);
}

/**
 * @brief Read access to a component
 *
 * @param vec Vector to read
 * @param index Component index in [0, dimensions<V>())
 * @throws std::out_of_range if index is invalid and bounds checking is on
 */
template <VectorN V>
const ScalarOf<V>& nth(const V& vec, std::size_t index)
{
  detail::checkIndex(index, dimensions<V>());
  return VectorTraits<V>::nth(vec, index);
}

/**
 * @brief Write access to a component
 *
 * @param vec Vector to modify
 * @param index Component index in [0, dimensions<V>())
 * @throws std::out_of_range if index is invalid and bounds checking is on
 */
template <VectorN V>
ScalarOf<V>& nthMut(V& vec, std::size_t index)
{
  detail::checkIndex(index, dimensions<V>());
  return VectorTraits<V>::nthMut(vec, index);
}

}  // namespace geovec

#endif  // GEOVEC_VECTOR_N_HPP
