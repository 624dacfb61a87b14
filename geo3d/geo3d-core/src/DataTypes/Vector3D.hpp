// Ticket: 0001_vector_types
// Raw 3D vector used for positions and directions

#ifndef GEO3D_VECTOR3D_HPP
#define GEO3D_VECTOR3D_HPP

#include "geo3d-core/src/DataTypes/VectorBase.hpp"

namespace geo3d
{

/**
 * @brief Generic 3D vector type
 *
 * This is the "raw vector" input shape accepted by every primitive
 * constructor: a Vector3D is a bare coordinate triple, whereas Point and
 * Vertex are named point types.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::VectorBase<3>
{
  static constexpr Eigen::Index Z = 2;

  using VectorBase::VectorBase;
  using VectorBase::operator=;
};

}  // namespace geo3d

#endif  // GEO3D_VECTOR3D_HPP
