// Ticket: 0004_concrete_bindings

#ifndef GEOVEC_EIGEN_BINDINGS_HPP
#define GEOVEC_EIGEN_BINDINGS_HPP

#include <concepts>
#include <cstddef>
#include <type_traits>

#include <Eigen/Dense>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

namespace geovec
{
namespace detail
{

/**
 * @brief Concept matching Eigen's fixed-size column vectors of size 2 to 4
 *
 * Matches Eigen::Vector2d, Eigen::Vector3f, Eigen::Matrix<int, 4, 1>, ...
 * and types publicly derived from them, such as domain wrappers of the
 * form `struct Coordinate : Eigen::Vector3d`. A derived type must be
 * constructible from an Eigen expression of its base type.
 */
template <typename V>
concept FixedEigenVector =
  requires {
    typename V::Scalar;
    V::RowsAtCompileTime;
    V::ColsAtCompileTime;
  } && GeoScalar<typename V::Scalar> && (V::ColsAtCompileTime == 1) &&
  (V::RowsAtCompileTime >= 2) && (V::RowsAtCompileTime <= 4) &&
  std::derived_from<
    V,
    Eigen::Matrix<typename V::Scalar, V::RowsAtCompileTime, 1>>;

}  // namespace detail

template <detail::FixedEigenVector V>
struct VectorTraits<V>
{
  using Scalar = typename V::Scalar;
  using EigenType = Eigen::Matrix<Scalar, V::RowsAtCompileTime, 1>;

  static constexpr std::size_t dimensions()
  {
    return static_cast<std::size_t>(V::RowsAtCompileTime);
  }

  static V fromValue(const Scalar& value)
  {
    return V(EigenType::Constant(value));
  }

  static const Scalar& nth(const V& vec, std::size_t index)
  {
    return vec.coeffRef(static_cast<Eigen::Index>(index));
  }

  static Scalar& nthMut(V& vec, std::size_t index)
  {
    return vec.coeffRef(static_cast<Eigen::Index>(index));
  }
};

template <detail::FixedEigenVector V>
  requires(V::RowsAtCompileTime == 2)
struct EnableTwoDimensional<V> : std::true_type
{
};

template <detail::FixedEigenVector V>
  requires(V::RowsAtCompileTime == 3)
struct EnableThreeDimensional<V> : std::true_type
{
};

}  // namespace geovec

#endif  // GEOVEC_EIGEN_BINDINGS_HPP
