#ifndef MOCAP_KIN_COMPONENT_FORMATTER_BASE_HPP
#define MOCAP_KIN_COMPONENT_FORMATTER_BASE_HPP

#include <array>
#include <cstddef>
#include <string>

#include <fmt/format.h>

namespace mocap_kin::detail
{

/// Shared fmt formatter base for fixed-size component types.
/// Provides parse() for [width][.precision][type] format specs
/// and formatComponents() to emit "(c0, c1, ...)" output.
template <typename T>
struct ComponentFormatterBase
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(fmt::format_parse_context& ctx)
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

    return it;
  }

protected:
  [[nodiscard]] std::string buildComponentFormat() const
  {
    std::string componentFmt = "{:";
    if (width > 0)
    {
      componentFmt += std::to_string(width);
    }
    componentFmt += '.';
    componentFmt += std::to_string(precision);
    componentFmt += presentation;
    componentFmt += '}';
    return componentFmt;
  }

  template <std::size_t N>
  auto formatComponents(const std::array<double, N>& components,
                        fmt::format_context& ctx) const
  {
    const std::string componentFmt = buildComponentFormat();
    auto out = fmt::format_to(ctx.out(), "(");
    for (std::size_t i = 0; i < N; ++i)
    {
      if (i > 0)
      {
        out = fmt::format_to(out, ", ");
      }
      out = fmt::format_to(out, fmt::runtime(componentFmt), components[i]);
    }
    return fmt::format_to(out, ")");
  }
};

}  // namespace mocap_kin::detail

#endif  // MOCAP_KIN_COMPONENT_FORMATTER_BASE_HPP
