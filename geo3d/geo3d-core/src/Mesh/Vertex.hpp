// Ticket: 0005_mesh_model

#ifndef GEO3D_MESH_VERTEX_HPP
#define GEO3D_MESH_VERTEX_HPP

#include <vector>

#include "geo3d-core/src/DataTypes/Vector3D.hpp"
#include "geo3d-core/src/Primitives/ConstraintInput.hpp"
#include "geo3d-core/src/Primitives/Point.hpp"

namespace geo3d
{

/**
 * @brief Mesh vertex: a 3D point used as a corner of edges and faces.
 *
 * Holds a Point rather than deriving from it, so that a Vertex and a Point
 * stay distinct types in overload resolution (a Face can be built from a
 * Vertex, never from a bare Point). The conversion only runs one way: a
 * Vertex is accepted wherever a Point or a ConstraintInput location is.
 */
class Vertex
{
public:
  static constexpr int kDimension = 3;

  Vertex() = default;

  /**
   * @brief Vertex at a named point, raw vector or coordinate sequence.
   * @throws DimensionMismatchError if a sequence does not have 3 entries
   */
  explicit Vertex(const ConstraintInput<3>& location)
    : point_{toPoint<3>(location)}
  {
  }

  Vertex(double x, double y, double z) : point_{x, y, z}
  {
  }

  [[nodiscard]] const Vector3D& coords() const
  {
    return point_.coords();
  }

  [[nodiscard]] const Point& point() const
  {
    return point_;
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator const Point&() const
  {
    return point_;
  }

  [[nodiscard]] double x() const
  {
    return point_.x();
  }

  [[nodiscard]] double y() const
  {
    return point_.y();
  }

  [[nodiscard]] double z() const
  {
    return point_.z();
  }

  void setX(double value)
  {
    point_.setX(value);
  }

  void setY(double value)
  {
    point_.setY(value);
  }

  void setZ(double value)
  {
    point_.setZ(value);
  }

  void setCoords(const Vector3D& coords)
  {
    point_.setCoords(coords);
  }

  void setCoords(const std::vector<double>& coords)
  {
    point_.setCoords(coords);
  }

  bool operator==(const Vertex& other) const = default;

private:
  Point point_;
};

}  // namespace geo3d

#endif  // GEO3D_MESH_VERTEX_HPP
