// Ticket: 0003_dimensional_markers

#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <type_traits>

#include <Eigen/Dense>

#include "geovec-core/src/Bindings/ArrayBindings.hpp"
#include "geovec-core/src/Bindings/EigenBindings.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"

using namespace geovec;

using IVec3 = std::array<int, 3>;

namespace
{

// A 4-component type that wrongly claims to be two dimensional
struct Mislabelled
{
  std::array<int, 4> data{};

  bool operator==(const Mislabelled&) const = default;
};

template <typename V>
concept HasCross = requires(const V a, const V b) { cross(a, b); };

}  // namespace

template <>
struct geovec::VectorTraits<Mislabelled>
{
  using Scalar = int;

  static constexpr std::size_t dimensions()
  {
    return 4;
  }

  static Mislabelled fromValue(int value)
  {
    return Mislabelled{{value, value, value, value}};
  }

  static const int& nth(const Mislabelled& v, std::size_t index)
  {
    return v.data[index];
  }

  static int& nthMut(Mislabelled& v, std::size_t index)
  {
    return v.data[index];
  }
};

template <>
struct geovec::EnableTwoDimensional<Mislabelled> : std::true_type
{
};

// ============================================================================
// Marker Tests
// ============================================================================

TEST(DimensionalTraitsTest, ArrayMarkers)
{
  static_assert(TwoDimensional<std::array<float, 2>>);
  static_assert(!ThreeDimensional<std::array<float, 2>>);
  static_assert(ThreeDimensional<std::array<float, 3>>);
  static_assert(!TwoDimensional<std::array<float, 3>>);
  static_assert(!TwoDimensional<std::array<float, 4>>);
  static_assert(!ThreeDimensional<std::array<float, 4>>);
  SUCCEED();
}

TEST(DimensionalTraitsTest, EigenMarkers)
{
  static_assert(TwoDimensional<Eigen::Vector2d>);
  static_assert(ThreeDimensional<Eigen::Vector3f>);
  static_assert(!ThreeDimensional<Eigen::Vector4d>);
  static_assert(!TwoDimensional<Eigen::Vector4d>);
  SUCCEED();
}

TEST(DimensionalTraitsTest, MarkerDisagreeingWithDimensionsIsRejected)
{
  static_assert(VectorN<Mislabelled>);
  static_assert(EnableTwoDimensional<Mislabelled>::value);
  static_assert(!TwoDimensional<Mislabelled>);
  SUCCEED();
}

TEST(DimensionalTraitsTest, CrossOnlyAvailableInThreeDimensions)
{
  static_assert(HasCross<IVec3>);
  static_assert(HasCross<Eigen::Vector3d>);
  static_assert(!HasCross<std::array<int, 2>>);
  static_assert(!HasCross<std::array<int, 4>>);
  static_assert(!HasCross<Eigen::Vector4d>);
  SUCCEED();
}

// ============================================================================
// Cross Product Tests
// ============================================================================

TEST(DimensionalTraitsTest, CrossOfUnitAxes)
{
  EXPECT_EQ(cross(IVec3{1, 0, 0}, IVec3{0, 1, 0}), (IVec3{0, 0, 1}));
  EXPECT_EQ(cross(IVec3{0, 1, 0}, IVec3{0, 0, 1}), (IVec3{1, 0, 0}));
  EXPECT_EQ(cross(IVec3{0, 0, 1}, IVec3{1, 0, 0}), (IVec3{0, 1, 0}));
}

TEST(DimensionalTraitsTest, CrossGeneralVectors)
{
  // (2*6 - 3*5, 3*4 - 1*6, 1*5 - 2*4)
  EXPECT_EQ(cross(IVec3{1, 2, 3}, IVec3{4, 5, 6}), (IVec3{-3, 6, -3}));
}

TEST(DimensionalTraitsTest, CrossIsAntiCommutative)
{
  IVec3 const a{3, -1, 7};
  IVec3 const b{-2, 5, 4};
  EXPECT_EQ(cross(a, b), mul(cross(b, a), -1));
}

TEST(DimensionalTraitsTest, CrossWithSelfIsZero)
{
  IVec3 const a{3, -1, 7};
  EXPECT_EQ(cross(a, a), zeroVector<IVec3>());
}

TEST(DimensionalTraitsTest, CrossIsOrthogonalToInputs)
{
  IVec3 const a{3, -1, 7};
  IVec3 const b{-2, 5, 4};
  auto const c = cross(a, b);
  EXPECT_EQ(dot(a, c), 0);
  EXPECT_EQ(dot(b, c), 0);
}

TEST(DimensionalTraitsTest, CrossMatchesEigenCross)
{
  Eigen::Vector3d const a{0.5, -1.25, 2.0};
  Eigen::Vector3d const b{3.0, 0.75, -4.0};
  Eigen::Vector3d const expected = a.cross(b);
  auto const actual = cross(a, b);
  EXPECT_DOUBLE_EQ(actual.x(), expected.x());
  EXPECT_DOUBLE_EQ(actual.y(), expected.y());
  EXPECT_DOUBLE_EQ(actual.z(), expected.z());
}
