// Ticket: 0004_primitive_model

#ifndef GEO3D_PRIMITIVES_CONSTRAINT_INPUT_HPP
#define GEO3D_PRIMITIVES_CONSTRAINT_INPUT_HPP

#include <variant>
#include <vector>

#include "geo3d-core/src/Primitives/Point.hpp"
#include "geo3d-core/src/Validation/Validation.hpp"

namespace geo3d
{

/**
 * @brief A construction argument for mode-selected Line/Plane constructors.
 *
 * Either a raw vector (fixed-size, or a runtime-length sequence that is
 * dimension-checked on use) or a named point. Modes that need a direction
 * accept only the raw alternatives; modes that need a location accept all.
 * A Vertex converts to its Point and is held as the named alternative.
 */
template <int Dim>
using ConstraintInput =
  std::variant<VectorND<Dim>, BasicPoint<Dim>, std::vector<double>>;

/// Coordinate extraction: reduce any point-like value to its raw vector
template <int Dim>
VectorND<Dim> toVector(const VectorND<Dim>& value)
{
  return value;
}

/// Any named point type of matching dimension (Point, UVPoint, Vertex)
template <int Dim, HasCoordinates<Dim> T>
VectorND<Dim> toVector(const T& value)
{
  return value.coords();
}

/// @throws DimensionMismatchError if value.size() != Dim
template <int Dim>
VectorND<Dim> toVector(const std::vector<double>& value)
{
  return BasicPoint<Dim>{value}.coords();
}

template <int Dim>
VectorND<Dim> toVector(const ConstraintInput<Dim>& value)
{
  return std::visit([](const auto& held) { return toVector<Dim>(held); },
                    value);
}

/// Named-point conversion of any point-like value
template <int Dim>
BasicPoint<Dim> toPoint(const ConstraintInput<Dim>& value)
{
  return BasicPoint<Dim>{toVector<Dim>(value)};
}

}  // namespace geo3d

#endif  // GEO3D_PRIMITIVES_CONSTRAINT_INPUT_HPP
