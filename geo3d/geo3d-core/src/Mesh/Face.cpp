// Ticket: 0005_mesh_model

#include "geo3d-core/src/Mesh/Face.hpp"

#include <spdlog/spdlog.h>
#include <cmath>
#include <string>
#include <utility>

#include "geo3d-core/src/Algebra/VectorAlgebra.hpp"
#include "geo3d-core/src/Utils/utils.hpp"
#include "geo3d-core/src/Validation/GeometryError.hpp"

namespace geo3d
{

namespace
{

// Largest-magnitude component made positive, lowest axis on ties
Vector3D dominantComponentPositive(const Vector3D& normal)
{
  Eigen::Index dominant = 0;
  for (Eigen::Index i = 1; i < 3; ++i)
  {
    if (std::abs(normal[i]) > std::abs(normal[dominant]))
    {
      dominant = i;
    }
  }
  return normal[dominant] < 0.0 ? Vector3D{-normal} : normal;
}

// Sign-adjust the face normal so it points along the outward direction.
// A direction perpendicular to the face (or zero) cannot pick a side, so it
// falls back to the dominant-component rule.
Vector3D outwardNormal(const Vector3D& normal,
                       const std::optional<Vector3D>& outwardDirection)
{
  if (!outwardDirection.has_value())
  {
    return dominantComponentPositive(normal);
  }

  double const alignment = normal.dot(*outwardDirection);
  if (std::abs(alignment) <=
      TOLERANCE * normal.norm() * outwardDirection->norm())
  {
    spdlog::debug(
      "Face: outward direction ({}, {}, {}) is perpendicular to the face "
      "normal, using the dominant-component rule",
      outwardDirection->x(),
      outwardDirection->y(),
      outwardDirection->z());
    return dominantComponentPositive(normal);
  }
  return alignment < 0.0 ? Vector3D{-normal} : normal;
}

}  // namespace

// ===== Construction =====

Face::Face(const Vertex& vertexA, const Vertex& vertexB, const Vertex& vertexC)
  : Face{vertexA, vertexB, vertexC, Config{}}
{
}

Face::Face(const Vertex& vertexA,
           const Vertex& vertexB,
           const Vertex& vertexC,
           Config config)
  : Face{canonicalize({vertexA, vertexB, vertexC}, config)}
{
}

Face::Face(const Edge& first, const Edge& second)
  : Face{first, second, Config{}}
{
}

Face::Face(const Edge& first, const Edge& second, Config config)
  : Face{canonicalize(
      verticesFromEdges(first, second, config.vertexTolerance), config)}
{
}

Face::Face(const Vertex& vertex, const Edge& edge)
  : Face{vertex, edge, Config{}}
{
}

Face::Face(const Vertex& vertex, const Edge& edge, Config config)
  : Face{canonicalize({vertex, edge.vertexA(), edge.vertexB()}, config)}
{
}

Face Face::fromElements(const std::vector<MeshElement>& elements)
{
  return fromElements(elements, Config{});
}

Face Face::fromElements(const std::vector<MeshElement>& elements,
                        Config config)
{
  if (elements.size() == 3)
  {
    const auto* a = std::get_if<Vertex>(&elements[0]);
    const auto* b = std::get_if<Vertex>(&elements[1]);
    const auto* c = std::get_if<Vertex>(&elements[2]);
    if (a == nullptr || b == nullptr || c == nullptr)
    {
      throw TypeMismatchError{
        "Face: three-element construction takes three vertices"};
    }
    return Face{*a, *b, *c, std::move(config)};
  }

  if (elements.size() == 2)
  {
    const auto* firstEdge = std::get_if<Edge>(&elements[0]);
    const auto* secondEdge = std::get_if<Edge>(&elements[1]);
    const auto* firstVertex = std::get_if<Vertex>(&elements[0]);
    const auto* secondVertex = std::get_if<Vertex>(&elements[1]);

    if (firstEdge != nullptr && secondEdge != nullptr)
    {
      return Face{*firstEdge, *secondEdge, std::move(config)};
    }
    if (firstVertex != nullptr && secondEdge != nullptr)
    {
      return Face{*firstVertex, *secondEdge, std::move(config)};
    }
    if (firstEdge != nullptr && secondVertex != nullptr)
    {
      return Face{*secondVertex, *firstEdge, std::move(config)};
    }
    throw TypeMismatchError{
      "Face: two-element construction takes two edges or a vertex and an "
      "edge, got two vertices"};
  }

  throw TypeMismatchError{"Face: takes 2 or 3 elements, got " +
                          std::to_string(elements.size())};
}

Face::Face(const std::array<Vertex, 3>& ordered)
  : vertexA_{ordered[0]},
    vertexB_{ordered[1]},
    vertexC_{ordered[2]},
    edges_(buildEdges(ordered[0], ordered[1], ordered[2])),
    vectorU_{ordered[1].coords() - ordered[0].coords()},
    vectorV_{ordered[2].coords() - ordered[0].coords()},
    normal_{vectorU_.cross(vectorV_)}
{
}

std::array<Vertex, 3> Face::canonicalize(std::array<Vertex, 3> vertices,
                                         const Config& config)
{
  const Vector3D& a = vertices[0].coords();
  const Vector3D& b = vertices[1].coords();
  const Vector3D& c = vertices[2].coords();

  Vector3D const u = b - a;
  Vector3D const normal = VectorAlgebra::calculateNormal(a, b, c);
  if (normal.squaredNorm() == 0.0)
  {
    throw DegenerateGeometryError{"Face: vertices are collinear"};
  }

  Vector3D const outward = outwardNormal(normal, config.outwardDirection);

  Vector2D const uvA = VectorAlgebra::mapXyzToUv(a, u, outward, a);
  Vector2D const uvB = VectorAlgebra::mapXyzToUv(a, u, outward, b);
  Vector2D const uvC = VectorAlgebra::mapXyzToUv(a, u, outward, c);

  if (VectorAlgebra::cross2D(uvB - uvA, uvC - uvA) < 0.0)
  {
    spdlog::debug("Face: clockwise input, swapping vertexB and vertexC");
    std::swap(vertices[1], vertices[2]);
  }

  return vertices;
}

std::array<Vertex, 3> Face::verticesFromEdges(const Edge& first,
                                              const Edge& second,
                                              double tolerance)
{
  Vertex const a0 = first.vertexA();
  Vertex const b0 = first.vertexB();
  Vertex const a1 = second.vertexA();
  Vertex const b1 = second.vertexB();

  auto const onSecond = [&](const Vertex& v)
  {
    return coordinatesMatch(v.coords(), a1.coords(), tolerance) ||
           coordinatesMatch(v.coords(), b1.coords(), tolerance);
  };

  bool const sharesA = onSecond(a0);
  bool const sharesB = onSecond(b0);

  if (sharesA == sharesB)
  {
    spdlog::debug("Face: edges share {} endpoints (tolerance {})",
                  sharesA ? 2 : 0,
                  tolerance);
    throw TopologyError{sharesA
                          ? "Face: edges share both endpoints"
                          : "Face: edges do not share an endpoint"};
  }

  Vertex const unshared = sharesA ? b0 : a0;
  return {unshared, a1, b1};
}

// ===== Accessors =====

const Vertex& Face::vertexA() const
{
  return vertexA_;
}

const Vertex& Face::vertexB() const
{
  return vertexB_;
}

const Vertex& Face::vertexC() const
{
  return vertexC_;
}

std::array<Vertex, 3> Face::vertices() const
{
  return {vertexA_, vertexB_, vertexC_};
}

const Edge& Face::edgeA() const
{
  return edges_[0];
}

const Edge& Face::edgeB() const
{
  return edges_[1];
}

const Edge& Face::edgeC() const
{
  return edges_[2];
}

const std::array<Edge, 3>& Face::edges() const
{
  return edges_;
}

const Vector3D& Face::vectorU() const
{
  return vectorU_;
}

const Vector3D& Face::vectorV() const
{
  return vectorV_;
}

const Vector3D& Face::normal() const
{
  return normal_;
}

// ===== Mutators =====

void Face::setVertexA(const Vertex& vertex)
{
  rebuild(vertex, vertexB_, vertexC_);
}

void Face::setVertexB(const Vertex& vertex)
{
  rebuild(vertexA_, vertex, vertexC_);
}

void Face::setVertexC(const Vertex& vertex)
{
  rebuild(vertexA_, vertexB_, vertex);
}

void Face::setEdgeA(const Edge& edge)
{
  rebuild(edge.vertexA(), edge.vertexB(), vertexC_);
}

void Face::setEdgeB(const Edge& edge)
{
  rebuild(vertexA_, edge.vertexA(), edge.vertexB());
}

void Face::setEdgeC(const Edge& edge)
{
  rebuild(edge.vertexB(), vertexB_, edge.vertexA());
}

void Face::flip()
{
  rebuild(vertexA_, vertexC_, vertexB_);
}

// ===== Queries =====

std::array<Vector2D, 3> Face::uvCoordinates() const
{
  const Vector3D& origin = vertexA_.coords();
  return {VectorAlgebra::mapXyzToUv(origin, vectorU_, normal_, origin),
          VectorAlgebra::mapXyzToUv(
            origin, vectorU_, normal_, vertexB_.coords()),
          VectorAlgebra::mapXyzToUv(
            origin, vectorU_, normal_, vertexC_.coords())};
}

bool Face::containsProjection(const Vector3D& point) const
{
  Vector2D const pointUv = VectorAlgebra::mapXyzToUv(
    vertexA_.coords(), vectorU_, normal_, point);
  return VectorAlgebra::pointInTriangle(uvCoordinates(), pointUv);
}

Plane Face::toPlane() const
{
  return Plane{vertexA_.point(), vertexB_.point(), vertexC_.point()};
}

bool Face::isDegenerate() const
{
  return normal_.squaredNorm() == 0.0;
}

// ===== Internals =====

std::array<Edge, 3> Face::buildEdges(const Vertex& vertexA,
                                     const Vertex& vertexB,
                                     const Vertex& vertexC)
{
  return {Edge{vertexA, vertexB},
          Edge{vertexB, vertexC},
          Edge{vertexC, vertexA}};
}

void Face::rebuild(const Vertex& vertexA,
                   const Vertex& vertexB,
                   const Vertex& vertexC)
{
  // Build into a temporary first; arguments may alias our own members
  Face rebuilt{std::array<Vertex, 3>{vertexA, vertexB, vertexC}};
  if (rebuilt.isDegenerate())
  {
    spdlog::warn("Face: vertex update leaves the face degenerate");
  }
  *this = std::move(rebuilt);
}

}  // namespace geo3d
