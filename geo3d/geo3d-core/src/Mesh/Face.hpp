// Ticket: 0005_mesh_model

#ifndef GEO3D_MESH_FACE_HPP
#define GEO3D_MESH_FACE_HPP

#include <array>
#include <optional>
#include <vector>

#include "geo3d-core/src/DataTypes/Vector2D.hpp"
#include "geo3d-core/src/DataTypes/Vector3D.hpp"
#include "geo3d-core/src/Mesh/Edge.hpp"
#include "geo3d-core/src/Mesh/MeshElement.hpp"
#include "geo3d-core/src/Mesh/Vertex.hpp"
#include "geo3d-core/src/Primitives/Plane.hpp"

namespace geo3d
{

/**
 * @brief Triangular mesh face.
 *
 * An ordered vertex triple (a, b, c) with derived data:
 * - edges a->b, b->c, c->a
 * - vectorU = b - a, vectorV = c - a
 * - normal = vectorU x vectorV (not normalized)
 *
 * Construction canonicalizes the vertex order to counter-clockwise as seen
 * from the outward direction. The vertices are mapped into the UV frame with
 * origin a, U axis along b - a and the outward normal; if c lies clockwise of
 * b in that frame, b and c are swapped.
 *
 * The outward normal is +/- (b - a) x (c - a), with the sign taken from
 * Config::outwardDirection when given, otherwise chosen so that the normal's
 * dominant component (largest magnitude, lowest axis on ties) is positive.
 * An outward direction perpendicular to the face uses the dominant-component
 * rule as well.
 *
 * Mutators rebuild all derived data wholesale. Vertex and edge setters do
 * not re-run the winding canonicalization; flip() reverses it explicitly.
 *
 * Error handling: Every mutator either commits a fully consistent state or
 * throws and leaves the face unchanged
 */
class Face
{
public:
  /**
   * @brief Configuration for face construction.
   */
  struct Config
  {
    double vertexTolerance{1e-8};  ///< Component-wise shared-endpoint match
    std::optional<Vector3D> outwardDirection{};  ///< Picks the normal's sign
  };

  /**
   * @brief Face from three vertices in any order.
   * @throws DegenerateGeometryError if the vertices are collinear
   */
  Face(const Vertex& vertexA, const Vertex& vertexB, const Vertex& vertexC);
  Face(const Vertex& vertexA,
       const Vertex& vertexB,
       const Vertex& vertexC,
       Config config);

  /**
   * @brief Face from two edges sharing exactly one endpoint.
   *
   * The first edge's unshared endpoint becomes vertexA; the second edge's
   * endpoints become vertexB and vertexC in that edge's order (before
   * winding canonicalization).
   *
   * @throws TopologyError if the edges share no endpoint, or both
   * @throws DegenerateGeometryError if the resulting vertices are collinear
   */
  Face(const Edge& first, const Edge& second);
  Face(const Edge& first, const Edge& second, Config config);

  /**
   * @brief Face from a vertex and the opposite edge.
   *
   * The vertex becomes vertexA; the edge's endpoints become vertexB and
   * vertexC in the edge's order (before winding canonicalization).
   */
  Face(const Vertex& vertex, const Edge& edge);
  Face(const Vertex& vertex, const Edge& edge, Config config);

  /**
   * @brief Face from elements whose kinds are only known at runtime.
   *
   * Accepts three vertices, two edges, or one vertex and one edge (either
   * order), dispatching to the matching constructor.
   *
   * @throws TypeMismatchError for any other combination or count
   */
  static Face fromElements(const std::vector<MeshElement>& elements);
  static Face fromElements(const std::vector<MeshElement>& elements,
                           Config config);

  [[nodiscard]] const Vertex& vertexA() const;
  [[nodiscard]] const Vertex& vertexB() const;
  [[nodiscard]] const Vertex& vertexC() const;
  [[nodiscard]] std::array<Vertex, 3> vertices() const;

  /// a -> b
  [[nodiscard]] const Edge& edgeA() const;
  /// b -> c
  [[nodiscard]] const Edge& edgeB() const;
  /// c -> a
  [[nodiscard]] const Edge& edgeC() const;
  [[nodiscard]] const std::array<Edge, 3>& edges() const;

  [[nodiscard]] const Vector3D& vectorU() const;
  [[nodiscard]] const Vector3D& vectorV() const;
  [[nodiscard]] const Vector3D& normal() const;

  void setVertexA(const Vertex& vertex);
  void setVertexB(const Vertex& vertex);
  void setVertexC(const Vertex& vertex);

  /// Replaces vertexA and vertexB with the edge's endpoints
  void setEdgeA(const Edge& edge);
  /// Replaces vertexB and vertexC with the edge's endpoints
  void setEdgeB(const Edge& edge);
  /// Replaces vertexC and vertexA with the edge's endpoints
  void setEdgeC(const Edge& edge);

  /// Reverse the winding: swap vertexB and vertexC, then rebuild
  void flip();

  /**
   * @brief Vertices in the face's own UV frame.
   *
   * Origin vertexA, U axis vectorU, normal as stored.
   * @throws DegenerateGeometryError if the face is degenerate
   */
  [[nodiscard]] std::array<Vector2D, 3> uvCoordinates() const;

  /**
   * @brief Whether the projection of @p point onto the face plane lies in
   * the triangle (boundary inclusive).
   * @throws DegenerateGeometryError if the face is degenerate
   */
  [[nodiscard]] bool containsProjection(const Vector3D& point) const;

  /// The plane through a, b, c
  [[nodiscard]] Plane toPlane() const;

  /// True when the normal is the zero vector
  [[nodiscard]] bool isDegenerate() const;

private:
  explicit Face(const std::array<Vertex, 3>& ordered);

  static std::array<Vertex, 3> canonicalize(std::array<Vertex, 3> vertices,
                                            const Config& config);

  static std::array<Vertex, 3> verticesFromEdges(const Edge& first,
                                                 const Edge& second,
                                                 double tolerance);

  static std::array<Edge, 3> buildEdges(const Vertex& vertexA,
                                        const Vertex& vertexB,
                                        const Vertex& vertexC);

  void rebuild(const Vertex& vertexA,
               const Vertex& vertexB,
               const Vertex& vertexC);

  Vertex vertexA_;
  Vertex vertexB_;
  Vertex vertexC_;
  std::array<Edge, 3> edges_;
  Vector3D vectorU_;
  Vector3D vectorV_;
  Vector3D normal_;
};

}  // namespace geo3d

#endif  // GEO3D_MESH_FACE_HPP
