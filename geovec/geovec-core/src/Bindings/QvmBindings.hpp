// Ticket: 0009_qvm_bindings

#ifndef GEOVEC_QVM_BINDINGS_HPP
#define GEOVEC_QVM_BINDINGS_HPP

#include <cstddef>
#include <type_traits>

#include <boost/qvm/vec.hpp>
#include <boost/qvm/vec_operations.hpp>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

/**
 * @file QvmBindings.hpp
 * @brief Vector capability for boost::qvm::vec<S, 2>, <S, 3> and <S, 4>
 *
 * Components are stored in the public array member `a`. Equality comes from
 * boost::qvm::operator== in vec_operations.hpp.
 *
 * Boost.QVM provides its own dot() and cross() overloads; both accept mixed
 * argument types, so for two vectors of the same type the geovec overloads
 * are the more specialized match.
 */

namespace geovec
{

template <GeoScalar S, int D>
  requires(D >= 2 && D <= 4)
struct VectorTraits<boost::qvm::vec<S, D>>
{
  using Scalar = S;

  static constexpr std::size_t dimensions()
  {
    return static_cast<std::size_t>(D);
  }

  static boost::qvm::vec<S, D> fromValue(const S& value)
  {
    boost::qvm::vec<S, D> result{};
    for (auto& component : result.a)
    {
      component = value;
    }
    return result;
  }

  static const S& nth(const boost::qvm::vec<S, D>& vec, std::size_t index)
  {
    return vec.a[index];
  }

  static S& nthMut(boost::qvm::vec<S, D>& vec, std::size_t index)
  {
    return vec.a[index];
  }
};

template <GeoScalar S>
struct EnableTwoDimensional<boost::qvm::vec<S, 2>> : std::true_type
{
};

template <GeoScalar S>
struct EnableThreeDimensional<boost::qvm::vec<S, 3>> : std::true_type
{
};

}  // namespace geovec

#endif  // GEOVEC_QVM_BINDINGS_HPP
