// Ticket: 0001_vector_types
// Raw 2D vector for UV-frame coordinates

#ifndef GEO3D_VECTOR2D_HPP
#define GEO3D_VECTOR2D_HPP

#include "geo3d-core/src/DataTypes/VectorBase.hpp"

namespace geo3d
{

/**
 * @brief Generic 2D vector type for UV coordinates
 *
 * Result type of VectorAlgebra::mapXyzToUv and the raw vector shape for
 * UVPoint / UVLine.
 */
struct Vector2D final : detail::VectorBase<2>
{
  static constexpr Eigen::Index U = 0;
  static constexpr Eigen::Index V = 1;

  using VectorBase::VectorBase;
  using VectorBase::operator=;
};

}  // namespace geo3d

#endif  // GEO3D_VECTOR2D_HPP
