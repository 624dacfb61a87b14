// Ticket: 0005_mesh_model

#ifndef GEO3D_MESH_EDGE_HPP
#define GEO3D_MESH_EDGE_HPP

#include "geo3d-core/src/DataTypes/Vector3D.hpp"
#include "geo3d-core/src/Mesh/Vertex.hpp"
#include "geo3d-core/src/Primitives/Line.hpp"

namespace geo3d
{

/**
 * @brief Mesh edge: the finite segment between two vertices.
 *
 * Wraps a Line and inherits its consistency rules (vertexB == vertexA +
 * vector after every mutation). Unlike a Line, points on an edge are only
 * defined for parameters in [0, 1].
 */
class Edge
{
public:
  Edge(const Vertex& vertexA, const Vertex& vertexB);

  /// Edge from a start vertex and the vector to its end vertex
  Edge(const Vertex& vertexA, const Vector3D& vector);

  [[nodiscard]] Vertex vertexA() const;
  [[nodiscard]] Vertex vertexB() const;
  [[nodiscard]] const Vector3D& vector() const;

  /// Move vertexA; the vector follows, vertexB stays
  void setVertexA(const Vertex& vertex);

  /// Move vertexB; the vector follows, vertexA stays
  void setVertexB(const Vertex& vertex);

  /// Replace the vector; vertexB follows, vertexA stays
  void setVector(const Vector3D& vector);

  /**
   * @brief Interpolate along the edge: (1 - t) * vertexA + t * vertexB.
   *
   * @param t Edge parameter, 0 at vertexA and 1 at vertexB
   * @throws RangeError if t is outside [0, 1]
   */
  [[nodiscard]] Vector3D point(double t) const;

  [[nodiscard]] double length() const;

  /// The unbounded line through this edge
  [[nodiscard]] const Line& line() const;

private:
  Line line_;
};

}  // namespace geo3d

#endif  // GEO3D_MESH_EDGE_HPP
