// Ticket: 0004_primitive_model

#ifndef GEO3D_PRIMITIVES_PLANE_HPP
#define GEO3D_PRIMITIVES_PLANE_HPP

#include <string_view>

#include "geo3d-core/src/DataTypes/Vector3D.hpp"
#include "geo3d-core/src/Primitives/ConstraintInput.hpp"
#include "geo3d-core/src/Primitives/Line.hpp"
#include "geo3d-core/src/Primitives/Point.hpp"
#include "geo3d-core/src/Validation/Validation.hpp"

namespace geo3d
{

/**
 * @brief Plane primitive in 3D space.
 *
 * Canonical form: a base point pointA and two in-plane vectors vectorU,
 * vectorV, with
 * - pointB = pointA + vectorU
 * - pointC = pointA + vectorV
 * - normal = vectorU x vectorV (not normalized)
 *
 * Three construction modes normalize to that form:
 * - points: three points, vectors are the differences from the first
 * - vector: base point plus two in-plane vectors
 * - normal: base point, one in-plane vector and a normal n; the second
 *   in-plane vector is derived as n x vectorU
 *
 * Every setter recomputes the dependent point or vector and then the normal.
 * Collinear defining points are accepted; isDegenerate() reports them, and
 * distanceTo()/intersection() throw DegenerateGeometryError on them.
 */
class Plane
{
public:
  using Input = ConstraintInput<3>;

  /// Points mode, selected by argument types
  Plane(const Point& pointA, const Point& pointB, const Point& pointC);

  /// Vector mode, selected by argument types
  Plane(const Point& pointA, const Vector3D& vectorU, const Vector3D& vectorV);

  /**
   * @brief Construct with an explicit mode.
   *
   * @param constraint0 Base point (named point or raw vector)
   * @param constraint1 Second point (points mode) or first in-plane vector
   * @param constraint2 Third point (points mode), second in-plane vector
   *        (vector mode) or normal vector (normal mode)
   * @param mode Construction mode
   * @throws DimensionMismatchError if any argument is not 3D
   * @throws TypeMismatchError if a named point is given where the mode needs
   *         a raw vector
   */
  Plane(const Input& constraint0,
        const Input& constraint1,
        const Input& constraint2,
        PlaneMode mode);

  /// @throws InvalidModeError unless mode is points/vector/normal
  Plane(const Input& constraint0,
        const Input& constraint1,
        const Input& constraint2,
        std::string_view mode);

  [[nodiscard]] const Vector3D& pointA() const;
  [[nodiscard]] const Vector3D& pointB() const;
  [[nodiscard]] const Vector3D& pointC() const;
  [[nodiscard]] const Vector3D& vectorU() const;
  [[nodiscard]] const Vector3D& vectorV() const;
  [[nodiscard]] const Vector3D& normal() const;

  /// Move the base point; pointB and pointC stay, both vectors follow
  void setPointA(const Input& constraint);

  /// Move pointB; vectorU follows
  void setPointB(const Input& constraint);

  /// Move pointC; vectorV follows
  void setPointC(const Input& constraint);

  /// Replace vectorU (raw vector only); pointB follows
  void setVectorU(const Input& vector);

  /// Replace vectorV (raw vector only); pointC follows
  void setVectorV(const Input& vector);

  /**
   * @brief Re-derive vectorV from a normal, exactly as normal mode does.
   *
   * vectorV = normal x vectorU, pointC follows, then the stored normal is
   * recomputed as vectorU x vectorV.
   */
  void setNormal(const Input& normal);

  /// pointA + scaleU * vectorU + scaleV * vectorV
  [[nodiscard]] Vector3D point(double scaleU, double scaleV) const;

  /// @throws DegenerateGeometryError if the plane is degenerate
  [[nodiscard]] double distanceTo(const Input& point) const;

  /**
   * @brief Intersection point of @p line with this plane.
   * @throws DegenerateGeometryError if the plane is degenerate or the line
   *         is parallel to it
   */
  [[nodiscard]] Vector3D intersection(const Line& line) const;

  /// True when the normal is the zero vector (collinear defining points)
  [[nodiscard]] bool isDegenerate() const;

private:
  void assignFromPoints(const Vector3D& pointA,
                        const Vector3D& pointB,
                        const Vector3D& pointC);

  void assignFromVectors(const Vector3D& pointA,
                         const Vector3D& vectorU,
                         const Vector3D& vectorV);

  static Vector3D vectorFromNormal(const Vector3D& normal,
                                   const Vector3D& vectorU);

  Vector3D pointA_;
  Vector3D pointB_;
  Vector3D pointC_;
  Vector3D vectorU_;
  Vector3D vectorV_;
  Vector3D normal_;
};

}  // namespace geo3d

#endif  // GEO3D_PRIMITIVES_PLANE_HPP
