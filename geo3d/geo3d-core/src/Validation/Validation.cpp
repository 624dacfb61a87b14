// Ticket: 0002_argument_validation

#include "geo3d-core/src/Validation/Validation.hpp"

#include <algorithm>
#include <cctype>

namespace geo3d::Validation
{

void checkRange(double min, double max, double value)
{
  // Negated form so that NaN is rejected as well
  if (!(min <= value && value <= max))
  {
    throw RangeError{"checkRange: value " + std::to_string(value) +
                     " outside [" + std::to_string(min) + ", " +
                     std::to_string(max) + "]"};
  }
}

std::string normalizeMode(std::string_view mode)
{
  std::string lower{mode};
  std::ranges::transform(lower,
                         lower.begin(),
                         [](unsigned char c)
                         { return static_cast<char>(std::tolower(c)); });
  return lower;
}

LineMode parseLineMode(std::string_view mode)
{
  const std::string lower = normalizeMode(mode);
  if (lower == "point" || lower == "points")
  {
    return LineMode::Point;
  }
  if (lower == "vector")
  {
    return LineMode::Vector;
  }
  throw InvalidModeError{"Line: unknown mode '" + std::string{mode} +
                         "', expected 'point' or 'vector'"};
}

PlaneMode parsePlaneMode(std::string_view mode)
{
  const std::string lower = normalizeMode(mode);
  if (lower == "point" || lower == "points")
  {
    return PlaneMode::Points;
  }
  if (lower == "vector")
  {
    return PlaneMode::Vector;
  }
  if (lower == "normal")
  {
    return PlaneMode::Normal;
  }
  throw InvalidModeError{"Plane: unknown mode '" + std::string{mode} +
                         "', expected 'points', 'vector' or 'normal'"};
}

}  // namespace geo3d::Validation
