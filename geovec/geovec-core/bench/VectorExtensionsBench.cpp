// Ticket: 0008_add_google_benchmark

#include <benchmark/benchmark.h>
#include <array>
#include <cstdint>
#include <random>
#include <vector>

#include <Eigen/Dense>

#include "geovec-core/src/Bindings/ArrayBindings.hpp"
#include "geovec-core/src/Bindings/EigenBindings.hpp"
#include "geovec-core/src/Geometry/BoundingRect.hpp"
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Generate random points with fixed seed for reproducibility
template <typename V>
std::vector<V> generateRandomPoints(size_t count)
{
  static std::mt19937 rng{42};
  std::uniform_real_distribution<double> dist{-10.0, 10.0};

  std::vector<V> points;
  points.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    V point = geovec::zeroVector<V>();
    for (size_t d = 0; d < geovec::dimensions<V>(); ++d)
    {
      geovec::nthMut(point, d) = dist(rng);
    }
    points.push_back(point);
  }
  return points;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Generic dot product over std::array, the baseline binding
 */
static void BM_GenericDot_Array3(benchmark::State& state)
{
  auto const points = generateRandomPoints<std::array<double, 3>>(1024);

  for (auto _ : state)
  {
    double sum = 0.0;
    for (size_t i = 1; i < points.size(); ++i)
    {
      sum += geovec::dot(points[i - 1], points[i]);
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(points.size() - 1));
}
BENCHMARK(BM_GenericDot_Array3);

/**
 * @brief Generic dot product over Eigen::Vector3d
 *
 * Compare with BM_EigenNativeDot to see the cost of going through the
 * traits layer instead of Eigen's expression templates.
 */
static void BM_GenericDot_Eigen3(benchmark::State& state)
{
  auto const points = generateRandomPoints<Eigen::Vector3d>(1024);

  for (auto _ : state)
  {
    double sum = 0.0;
    for (size_t i = 1; i < points.size(); ++i)
    {
      sum += geovec::dot(points[i - 1], points[i]);
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(points.size() - 1));
}
BENCHMARK(BM_GenericDot_Eigen3);

static void BM_EigenNativeDot(benchmark::State& state)
{
  auto const points = generateRandomPoints<Eigen::Vector3d>(1024);

  for (auto _ : state)
  {
    double sum = 0.0;
    for (size_t i = 1; i < points.size(); ++i)
    {
      sum += points[i - 1].dot(points[i]);
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(points.size() - 1));
}
BENCHMARK(BM_EigenNativeDot);

static void BM_GenericCross_Eigen3(benchmark::State& state)
{
  auto const points = generateRandomPoints<Eigen::Vector3d>(1024);

  for (auto _ : state)
  {
    Eigen::Vector3d acc = Eigen::Vector3d::Zero();
    for (size_t i = 1; i < points.size(); ++i)
    {
      acc += geovec::cross(points[i - 1], points[i]);
    }
    benchmark::DoNotOptimize(acc);
  }
}
BENCHMARK(BM_GenericCross_Eigen3);

static void BM_EigenNativeCross(benchmark::State& state)
{
  auto const points = generateRandomPoints<Eigen::Vector3d>(1024);

  for (auto _ : state)
  {
    Eigen::Vector3d acc = Eigen::Vector3d::Zero();
    for (size_t i = 1; i < points.size(); ++i)
    {
      acc += points[i - 1].cross(points[i]);
    }
    benchmark::DoNotOptimize(acc);
  }
}
BENCHMARK(BM_EigenNativeCross);

/**
 * @brief Bounding rect over a growing point cloud
 *
 * Exercises minVec/maxVec through BoundingRect::fromPoints.
 */
static void BM_BoundingRectFromPoints(benchmark::State& state)
{
  auto const pointCount = static_cast<size_t>(state.range(0));
  auto const points = generateRandomPoints<std::array<double, 3>>(pointCount);

  for (auto _ : state)
  {
    auto rect =
      geovec::BoundingRect<std::array<double, 3>>::fromPoints(points);
    benchmark::DoNotOptimize(rect);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_BoundingRectFromPoints)
  ->RangeMultiplier(4)
  ->Range(16, 16384)
  ->Complexity(benchmark::oN);
