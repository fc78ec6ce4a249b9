// Ticket: 0006_bounding_rect

#ifndef GEOVEC_BOUNDING_RECT_HPP
#define GEOVEC_BOUNDING_RECT_HPP

#include <concepts>
#include <iterator>
#include <ranges>
#include <stdexcept>

#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/VecFormatter.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"
#include "geovec-utils/src/Logging.hpp"

namespace geovec
{

/**
 * @brief Axis-aligned bounding rectangle (box in 3D) over any vector type
 *
 * Bounds are inclusive: a point on the boundary is contained. The invariant
 * lower()[i] <= upper()[i] holds for every index after each operation.
 *
 * @tparam V Vector type used for both corners
 */
template <VectorN V>
class BoundingRect
{
public:
  using Scalar = ScalarOf<V>;

  /**
   * @brief Degenerate rect covering a single point
   */
  explicit BoundingRect(const V& point) : lower_{point}, upper_{point}
  {
  }

  /**
   * @brief Rect spanned by two opposite corners given in any order
   */
  static BoundingRect fromCorners(const V& corner1, const V& corner2)
  {
    return BoundingRect{geovec::minVec(corner1, corner2),
                        geovec::maxVec(corner1, corner2)};
  }

  /**
   * @brief Smallest rect containing every point of a range
   *
   * @param points Range of vectors
   * @throws std::invalid_argument if the range is empty
   */
  template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, const V&>
  static BoundingRect fromPoints(R&& points)
  {
    auto it = std::ranges::begin(points);
    auto const end = std::ranges::end(points);
    if (it == end)
    {
      geovec_utils::getLogger()->error(
        "Cannot create bounding rect from empty point set");
      throw std::invalid_argument(
        "Cannot create bounding rect from empty point set");
    }

    BoundingRect result{static_cast<const V&>(*it)};
    for (++it; it != end; ++it)
    {
      result.add(static_cast<const V&>(*it));
    }
    return result;
  }

  const V& lower() const
  {
    return lower_;
  }

  const V& upper() const
  {
    return upper_;
  }

  // (lower + upper) / 2, truncated for integer scalars
  V center() const
  {
    auto const two = one<Scalar>() + one<Scalar>();
    return geovec::div(geovec::add(lower_, upper_), two);
  }

  V extent() const
  {
    return geovec::sub(upper_, lower_);
  }

  /// Product of the extents (area in 2D, volume in 3D).
  Scalar volume() const
  {
    return geovec::fold(extent(),
                        one<Scalar>(),
                        [](Scalar acc, const Scalar& x) { return acc * x; });
  }

  bool containsPoint(const V& point) const
  {
    auto const lessEqual = [](const Scalar& l, const Scalar& r)
    { return l <= r; };
    return geovec::allCompWise(lower_, point, lessEqual) &&
           geovec::allCompWise(point, upper_, lessEqual);
  }

  bool containsRect(const BoundingRect& other) const
  {
    return containsPoint(other.lower_) && containsPoint(other.upper_);
  }

  /// True if the rects share at least one point (touching counts).
  bool intersects(const BoundingRect& other) const
  {
    auto const lessEqual = [](const Scalar& l, const Scalar& r)
    { return l <= r; };
    return geovec::allCompWise(lower_, other.upper_, lessEqual) &&
           geovec::allCompWise(other.lower_, upper_, lessEqual);
  }

  /// Grow to include point.
  void add(const V& point)
  {
    lower_ = geovec::minVec(lower_, point);
    upper_ = geovec::maxVec(upper_, point);
  }

  /// Grow to include another rect.
  void add(const BoundingRect& other)
  {
    lower_ = geovec::minVec(lower_, other.lower_);
    upper_ = geovec::maxVec(upper_, other.upper_);
  }

  /**
   * @brief Squared distance from a point to the closest point of the rect
   *
   * @return Zero if the point is contained
   */
  Scalar minDistance2(const V& point) const
  {
    auto const clamped =
      geovec::maxVec(geovec::minVec(point, upper_), lower_);
    return geovec::distance2(point, clamped);
  }

  bool operator==(const BoundingRect& other) const
  {
    return lower_ == other.lower_ && upper_ == other.upper_;
  }

private:
  BoundingRect(const V& lower, const V& upper) : lower_{lower}, upper_{upper}
  {
  }

  V lower_;
  V upper_;
};

}  // namespace geovec

// Formatter specialization for fmt (and therefore spdlog) support
namespace fmt
{

template <geovec::VectorN V>
struct formatter<geovec::BoundingRect<V>> : geovec::detail::VecFormatterBase
{
  template <typename FormatContext>
  auto format(const geovec::BoundingRect<V>& rect, FormatContext& ctx) const
    -> decltype(ctx.out())
  {
    auto out = ctx.out();
    *out++ = '[';
    out = formatComponents(rect.lower(), out);
    *out++ = ',';
    *out++ = ' ';
    out = formatComponents(rect.upper(), out);
    *out++ = ']';
    return out;
  }
};

}  // namespace fmt

#endif  // GEOVEC_BOUNDING_RECT_HPP
