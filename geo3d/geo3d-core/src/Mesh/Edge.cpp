// Ticket: 0005_mesh_model

#include "geo3d-core/src/Mesh/Edge.hpp"

#include "geo3d-core/src/Validation/Validation.hpp"

namespace geo3d
{

Edge::Edge(const Vertex& vertexA, const Vertex& vertexB)
  : line_{vertexA.point(), vertexB.point()}
{
}

Edge::Edge(const Vertex& vertexA, const Vector3D& vector)
  : line_{vertexA.point(), vector}
{
}

Vertex Edge::vertexA() const
{
  return Vertex{line_.pointA()};
}

Vertex Edge::vertexB() const
{
  return Vertex{line_.pointB()};
}

const Vector3D& Edge::vector() const
{
  return line_.vector();
}

void Edge::setVertexA(const Vertex& vertex)
{
  line_.setPointA(vertex.point());
}

void Edge::setVertexB(const Vertex& vertex)
{
  line_.setPointB(vertex.point());
}

void Edge::setVector(const Vector3D& vector)
{
  line_.setVector(vector);
}

Vector3D Edge::point(double t) const
{
  Validation::checkRange(0.0, 1.0, t);
  // Blend the stored endpoints so t == 0 and t == 1 reproduce them exactly
  return (1.0 - t) * line_.pointA() + t * line_.pointB();
}

double Edge::length() const
{
  return line_.vector().norm();
}

const Line& Edge::line() const
{
  return line_;
}

}  // namespace geo3d
