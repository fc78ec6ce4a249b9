// Ticket: 0004_concrete_bindings

#include <gtest/gtest.h>
#include <stdexcept>
#include <type_traits>

#include <Eigen/Dense>

#include "geovec-core/src/Bindings/EigenBindings.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"

using namespace geovec;

namespace
{

// Domain type deriving from an Eigen vector, as position types commonly do
struct Coordinate : Eigen::Vector3d
{
  Coordinate() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Coordinate(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Coordinate& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }
};

// Privately derived: Eigen's interface is not reachable from outside
struct Hidden : private Eigen::Vector3d
{
  using Scalar = double;
  static constexpr int RowsAtCompileTime = 3;
  static constexpr int ColsAtCompileTime = 1;
};

}  // namespace

// ============================================================================
// Capability Tests
// ============================================================================

TEST(EigenBindingsTest, FixedColumnVectorsSatisfyConcept)
{
  static_assert(VectorN<Eigen::Vector2d>);
  static_assert(VectorN<Eigen::Vector3f>);
  static_assert(VectorN<Eigen::Vector4i>);
  static_assert(VectorN<Eigen::Matrix<long, 3, 1>>);
  SUCCEED();
}

TEST(EigenBindingsTest, OtherEigenShapesAreRejected)
{
  static_assert(!VectorN<Eigen::VectorXd>);
  static_assert(!VectorN<Eigen::RowVector3d>);
  static_assert(!VectorN<Eigen::Matrix3d>);
  static_assert(!VectorN<Eigen::Matrix<double, 5, 1>>);
  static_assert(!VectorN<Eigen::Matrix<double, 1, 1>>);
  SUCCEED();
}

TEST(EigenBindingsTest, DerivedDomainTypeIsBound)
{
  static_assert(VectorN<Coordinate>);
  static_assert(ThreeDimensional<Coordinate>);
  static_assert(std::is_same_v<ScalarOf<Coordinate>, double>);
  SUCCEED();
}

TEST(EigenBindingsTest, PrivatelyDerivedTypeIsRejected)
{
  static_assert(std::is_base_of_v<Eigen::Vector3d, Hidden>);
  static_assert(!geovec::detail::FixedEigenVector<Hidden>);
  static_assert(!VectorN<Hidden>);
  SUCCEED();
}

TEST(EigenBindingsTest, DimensionsMatchRows)
{
  EXPECT_EQ(dimensions<Eigen::Vector2f>(), 2U);
  EXPECT_EQ(dimensions<Eigen::Vector3d>(), 3U);
  EXPECT_EQ(dimensions<Eigen::Vector4d>(), 4U);
}

// ============================================================================
// Access Tests
// ============================================================================

TEST(EigenBindingsTest, FromValueBroadcasts)
{
  auto const v = fromValue<Eigen::Vector4d>(2.5);
  EXPECT_EQ(v, Eigen::Vector4d::Constant(2.5));
}

TEST(EigenBindingsTest, FromValueBuildsDerivedType)
{
  Coordinate const c = fromValue<Coordinate>(-1.0);
  EXPECT_DOUBLE_EQ(c.x(), -1.0);
  EXPECT_DOUBLE_EQ(c.y(), -1.0);
  EXPECT_DOUBLE_EQ(c.z(), -1.0);
}

TEST(EigenBindingsTest, NthMatchesEigenAccessors)
{
  Eigen::Vector3d const v{1.0, 2.0, 3.0};
  EXPECT_DOUBLE_EQ(nth(v, 0), v.x());
  EXPECT_DOUBLE_EQ(nth(v, 1), v.y());
  EXPECT_DOUBLE_EQ(nth(v, 2), v.z());
}

TEST(EigenBindingsTest, NthMutWritesThroughToStorage)
{
  Eigen::Vector2i v{0, 0};
  nthMut(v, 1) = 8;
  EXPECT_EQ(v.y(), 8);
  EXPECT_EQ(v.x(), 0);
}

TEST(EigenBindingsTest, OutOfRangeIndexThrows)
{
  Eigen::Vector2d v{1.0, 2.0};
  EXPECT_THROW(static_cast<void>(nth(v, 2)), std::out_of_range);
  EXPECT_THROW(nthMut(v, 5) = 0.0, std::out_of_range);
}

// ============================================================================
// Agreement with Eigen's Native Operations
// ============================================================================

TEST(EigenBindingsTest, ExtensionsAgreeWithEigen)
{
  Eigen::Vector4d const a{1.0, -2.0, 3.5, 0.25};
  Eigen::Vector4d const b{0.5, 4.0, -1.0, 2.0};

  EXPECT_EQ(add(a, b), Eigen::Vector4d{a + b});
  EXPECT_EQ(sub(a, b), Eigen::Vector4d{a - b});
  EXPECT_EQ(mul(a, 2.0), Eigen::Vector4d{a * 2.0});
  EXPECT_EQ(div(a, 4.0), Eigen::Vector4d{a / 4.0});
  EXPECT_DOUBLE_EQ(dot(a, b), a.dot(b));
  EXPECT_DOUBLE_EQ(length2(a), a.squaredNorm());
  EXPECT_EQ(minVec(a, b), Eigen::Vector4d{a.cwiseMin(b)});
  EXPECT_EQ(maxVec(a, b), Eigen::Vector4d{a.cwiseMax(b)});
}

TEST(EigenBindingsTest, ExtensionsPreserveDerivedType)
{
  Coordinate const a{1.0, 2.0, 3.0};
  Coordinate const b{4.0, 5.0, 6.0};

  auto const sum = add(a, b);
  static_assert(std::is_same_v<std::remove_const_t<decltype(sum)>, Coordinate>);
  EXPECT_DOUBLE_EQ(sum.x(), 5.0);
  EXPECT_DOUBLE_EQ(sum.y(), 7.0);
  EXPECT_DOUBLE_EQ(sum.z(), 9.0);

  Coordinate const normal = cross(a, b);
  EXPECT_DOUBLE_EQ(normal.x(), -3.0);
  EXPECT_DOUBLE_EQ(normal.y(), 6.0);
  EXPECT_DOUBLE_EQ(normal.z(), -3.0);
}
