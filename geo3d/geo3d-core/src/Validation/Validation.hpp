// Ticket: 0002_argument_validation

#ifndef GEO3D_VALIDATION_VALIDATION_HPP
#define GEO3D_VALIDATION_VALIDATION_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "geo3d-core/src/Validation/GeometryError.hpp"

namespace geo3d
{

/// Line construction modes ("point"/"points", "vector")
enum class LineMode
{
  Point,
  Vector
};

/// Plane construction modes ("point"/"points", "vector", "normal")
enum class PlaneMode
{
  Points,
  Vector,
  Normal
};

/**
 * @brief Argument checks run by every constructor and mutating setter.
 *
 * All checks throw and never modify their arguments; callers run them before
 * writing any member so that a failed check leaves the object unchanged.
 *
 * Thread safety: Stateless, safe for concurrent use.
 */
namespace Validation
{

// ===== Dimension of a single argument =====

/// Named types carrying a compile-time dimension (Point, Vertex, Vector3D)
template <typename T>
  requires requires { T::kDimension; }
constexpr int dimensionOf(const T& /*value*/)
{
  return T::kDimension;
}

template <typename Derived>
int dimensionOf(const Eigen::MatrixBase<Derived>& value)
{
  return static_cast<int>(value.size());
}

inline int dimensionOf(const std::vector<double>& value)
{
  return static_cast<int>(value.size());
}

template <typename... Ts>
int dimensionOf(const std::variant<Ts...>& value)
{
  return std::visit([](const auto& held) { return dimensionOf(held); },
                    value);
}

/**
 * @brief Require every argument to have exactly @p expected coordinates.
 *
 * @throws DimensionMismatchError "mismatch in argument dimensions" when the
 *         arguments disagree among themselves, otherwise "expected argument
 *         of N dimensions, got M".
 */
template <typename... Args>
void checkDimension(int expected, const Args&... args)
{
  static_assert(sizeof...(Args) > 0, "checkDimension needs an argument");
  const std::array<int, sizeof...(Args)> dims{dimensionOf(args)...};
  const auto [minIt, maxIt] = std::minmax_element(dims.begin(), dims.end());

  if (*minIt == expected && *maxIt == expected)
  {
    return;
  }
  if (*minIt != *maxIt)
  {
    throw DimensionMismatchError{
      "checkDimension: mismatch in argument dimensions (got " +
      std::to_string(*minIt) + " to " + std::to_string(*maxIt) +
      ", expected " + std::to_string(expected) + ")"};
  }
  throw DimensionMismatchError{"checkDimension: expected argument of " +
                               std::to_string(expected) +
                               " dimensions, got " + std::to_string(*minIt)};
}

/**
 * @brief Require the alternative held by @p value to be one of Allowed.
 *
 * @param value Tagged input
 * @param message Error text naming the argument and what it accepts
 * @throws TypeMismatchError if the held alternative is not allowed
 */
template <typename... Allowed, typename... Ts>
void checkType(const std::variant<Ts...>& value, std::string_view message)
{
  static_assert(sizeof...(Allowed) > 0, "checkType needs an allowed type");
  const bool accepted = std::visit(
    [](const auto& held)
    {
      using Held = std::decay_t<decltype(held)>;
      return (std::is_same_v<Held, Allowed> || ...);
    },
    value);

  if (!accepted)
  {
    throw TypeMismatchError{std::string{message}};
  }
}

/**
 * @brief Require min <= value <= max.
 * @throws RangeError otherwise
 */
void checkRange(double min, double max, double value);

// ===== Mode strings =====

/// Lowercase copy of @p mode
std::string normalizeMode(std::string_view mode);

/**
 * @brief Parse a Line mode, case-insensitive.
 * @throws InvalidModeError for anything but point/points/vector
 */
LineMode parseLineMode(std::string_view mode);

/**
 * @brief Parse a Plane mode, case-insensitive.
 * @throws InvalidModeError for anything but point/points/vector/normal
 */
PlaneMode parsePlaneMode(std::string_view mode);

}  // namespace Validation

}  // namespace geo3d

#endif  // GEO3D_VALIDATION_VALIDATION_HPP
