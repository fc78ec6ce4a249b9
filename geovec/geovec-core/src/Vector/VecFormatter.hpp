// Ticket: 0005_vector_formatting

#ifndef GEOVEC_VEC_FORMATTER_HPP
#define GEOVEC_VEC_FORMATTER_HPP

#include <concepts>
#include <cstddef>
#include <string>
#include <type_traits>

#include <fmt/format.h>

#include "geovec-core/src/Vector/VectorN.hpp"

namespace geovec
{

/**
 * @brief Formatting view over any vector type
 *
 * Holds a reference only; create it at the call site with vecFmt() and do
 * not keep it beyond the lifetime of the vector. Usable with fmt::format and
 * with spdlog:
 *
 *   logger->debug("support point {:.3f}", geovec::vecFmt(point));
 */
template <VectorN V>
struct VecView
{
  const V& vec;
};

template <VectorN V>
VecView<V> vecFmt(const V& vec)
{
  return VecView<V>{vec};
}

namespace detail
{

/// Shared formatter base for vector types.
/// Provides parse() for [width][.precision][type] format specs
/// and formatComponents() to emit "(c0, c1, ...)" output.
struct VecFormatterBase
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(fmt::format_parse_context& ctx)
    -> decltype(ctx.begin())
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    // Parse optional width
    if (it != end && *it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    // Parse optional precision
    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    // Parse optional presentation type
    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    if (it != end && *it != '}')
    {
      throw fmt::format_error("invalid vector format specifier");
    }

    return it;
  }

protected:
  // Precision and presentation only apply to floating-point components;
  // width only to arithmetic ones.
  template <typename S>
  std::string buildComponentFormat() const
  {
    std::string componentFmt = "{";
    if constexpr (std::is_arithmetic_v<S>)
    {
      componentFmt += ':';
      if (width > 0)
      {
        componentFmt += std::to_string(width);
      }
      if constexpr (std::floating_point<S>)
      {
        componentFmt += '.';
        componentFmt += std::to_string(precision);
        componentFmt += presentation;
      }
    }
    componentFmt += '}';
    return componentFmt;
  }

  template <VectorN V, typename OutputIt>
  OutputIt formatComponents(const V& vec, OutputIt out) const
  {
    const std::string componentFmt = buildComponentFormat<ScalarOf<V>>();
    *out++ = '(';
    for (std::size_t i = 0; i < dimensions<V>(); ++i)
    {
      if (i > 0)
      {
        *out++ = ',';
        *out++ = ' ';
      }
      out = fmt::format_to(
        out, fmt::runtime(componentFmt), VectorTraits<V>::nth(vec, i));
    }
    *out++ = ')';
    return out;
  }
};

}  // namespace detail

}  // namespace geovec

// Formatter specialization for fmt (and therefore spdlog) support
namespace fmt
{

template <geovec::VectorN V>
struct formatter<geovec::VecView<V>> : geovec::detail::VecFormatterBase
{
  template <typename FormatContext>
  auto format(const geovec::VecView<V>& view, FormatContext& ctx) const
    -> decltype(ctx.out())
  {
    return formatComponents(view.vec, ctx.out());
  }
};

}  // namespace fmt

namespace geovec
{

/// Debug representation "(c0, c1, ...)" with default formatting.
template <VectorN V>
std::string toString(const V& vec)
{
  return fmt::format("{}", vecFmt(vec));
}

}  // namespace geovec

#endif  // GEOVEC_VEC_FORMATTER_HPP
