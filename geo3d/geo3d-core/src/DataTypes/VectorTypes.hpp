// Ticket: 0001_vector_types
// Convenience header for all vector types

#ifndef GEO3D_VECTOR_TYPES_HPP
#define GEO3D_VECTOR_TYPES_HPP

#include <concepts>

#include "geo3d-core/src/DataTypes/Vector2D.hpp"
#include "geo3d-core/src/DataTypes/Vector3D.hpp"

namespace geo3d
{

/**
 * @brief Maps a dimension to its raw vector type.
 *
 * VectorND<3> is Vector3D, VectorND<2> is Vector2D. Dimension-generic
 * primitives (BasicPoint, BasicLine) are written against VectorND<Dim>.
 */
template <int Dim>
struct VectorTraits;

template <>
struct VectorTraits<2>
{
  using type = Vector2D;
};

template <>
struct VectorTraits<3>
{
  using type = Vector3D;
};

template <int Dim>
using VectorND = typename VectorTraits<Dim>::type;

/**
 * @brief Capability: "has coordinates of fixed dimension Dim".
 *
 * Satisfied by named point types (Point, UVPoint, Vertex) that expose a
 * compile-time kDimension and a coords() accessor. Used in place of a common
 * base class so that 2D and 3D types stay unrelated.
 */
template <typename T, int Dim>
concept HasCoordinates = requires(const T& value) {
  { T::kDimension } -> std::convertible_to<int>;
  { value.coords() } -> std::convertible_to<VectorND<Dim>>;
} && (T::kDimension == Dim);

}  // namespace geo3d

#endif  // GEO3D_VECTOR_TYPES_HPP
