// Ticket: 0001_vector_capability

#ifndef GEOVEC_SCALAR_TRAITS_HPP
#define GEOVEC_SCALAR_TRAITS_HPP

#include <concepts>
#include <type_traits>

namespace geovec
{

/**
 * @brief Constants a scalar type must supply to participate in geovec
 *
 * The primary template covers every type constructible from an integer
 * literal (all built-in arithmetic types). Specialize it for scalar types
 * without such a constructor, e.g. fixed-point or exact rational types;
 * without a specialization such types do not satisfy GeoScalar.
 *
 * @tparam T Scalar type
 */
template <typename T>
struct ScalarTraits
{
  static constexpr T zero()
    requires std::constructible_from<T, int>
  {
    return static_cast<T>(0);
  }

  static constexpr T one()
    requires std::constructible_from<T, int>
  {
    return static_cast<T>(1);
  }
};

/**
 * @brief Concept for a vector component type
 *
 * Requires value semantics, a total order and the four arithmetic operators,
 * each yielding something convertible back to the scalar type. The total
 * order is assumed, not verified: NaN inputs give unspecified results for the
 * min/max operations.
 */
template <typename T>
concept GeoScalar = std::regular<T> && std::totally_ordered<T> &&
                    requires(const T a, const T b) {
                      { a + b } -> std::convertible_to<T>;
                      { a - b } -> std::convertible_to<T>;
                      { a * b } -> std::convertible_to<T>;
                      { a / b } -> std::convertible_to<T>;
                      { ScalarTraits<T>::zero() } -> std::convertible_to<T>;
                      { ScalarTraits<T>::one() } -> std::convertible_to<T>;
                    };

/// Returns the additive identity of T.
template <GeoScalar T>
constexpr T zero()
{
  return ScalarTraits<T>::zero();
}

/// Returns the multiplicative identity of T.
template <GeoScalar T>
constexpr T one()
{
  return ScalarTraits<T>::one();
}

// Smaller of two scalars; returns lhs on ties
template <GeoScalar T>
constexpr T minInline(const T& lhs, const T& rhs)
{
  return rhs < lhs ? rhs : lhs;
}

// Larger of two scalars; returns lhs on ties
template <GeoScalar T>
constexpr T maxInline(const T& lhs, const T& rhs)
{
  return lhs < rhs ? rhs : lhs;
}

}  // namespace geovec

#endif  // GEOVEC_SCALAR_TRAITS_HPP
