// Ticket: 0003_vector_algebra

#ifndef GEO3D_ALGEBRA_VECTOR_ALGEBRA_HPP
#define GEO3D_ALGEBRA_VECTOR_ALGEBRA_HPP

#include <array>

#include "geo3d-core/src/DataTypes/VectorTypes.hpp"

namespace geo3d
{

/**
 * @brief Stateless vector-calculus helpers on raw coordinate vectors.
 *
 * Lines are passed as two points (l0, l1) and planes as three points
 * (p0, p1, p2). Every function that divides checks its denominator first and
 * throws DegenerateGeometryError when it is at or below @p epsilon, instead
 * of returning an infinity or NaN.
 *
 * Thread safety: Stateless functions, safe to call from multiple threads
 */
namespace VectorAlgebra
{

/**
 * @brief Normal of the plane through three points: (p1 - p0) x (p2 - p0).
 *
 * Not normalized; its length is twice the triangle area.
 */
Vector3D calculateNormal(const Vector3D& p0,
                         const Vector3D& p1,
                         const Vector3D& p2);

/// Euclidean distance between two points
double distancePointPoint(const Vector3D& a, const Vector3D& b);

/**
 * @brief Shortest distance from a point to the infinite line through l0, l1.
 *
 * |(l1 - l0) x (p - l0)| / |l1 - l0|
 *
 * @throws DegenerateGeometryError if |l1 - l0| <= epsilon
 */
double distancePointLine(const Vector3D& point,
                         const Vector3D& l0,
                         const Vector3D& l1,
                         double epsilon = 0.0);

/**
 * @brief Shortest distance from a point to the plane through p0, p1, p2.
 *
 * @throws DegenerateGeometryError if the plane normal has length <= epsilon
 */
double distancePointPlane(const Vector3D& point,
                          const Vector3D& p0,
                          const Vector3D& p1,
                          const Vector3D& p2,
                          double epsilon = 0.0);

/**
 * @brief Intersection of the line through l0, l1 with the plane through
 * p0, p1, p2.
 *
 * l0 + (n . (p0 - l0)) / (n . (l1 - l0)) * (l1 - l0)
 *
 * @throws DegenerateGeometryError if the plane is degenerate or the line is
 *         parallel to it (|n . (l1 - l0)| <= epsilon)
 */
Vector3D intersectionLinePlane(const Vector3D& l0,
                               const Vector3D& l1,
                               const Vector3D& p0,
                               const Vector3D& p1,
                               const Vector3D& p2,
                               double epsilon = 0.0);

/**
 * @brief Projection of @p v0 onto @p v1.
 * @throws DegenerateGeometryError if v1 . v1 <= epsilon
 */
Vector3D projectVector(const Vector3D& v0,
                       const Vector3D& v1,
                       double epsilon = 0.0);

/**
 * @brief Map a 3D point into the local UV frame of a plane.
 *
 * The frame has its origin at @p origin, its U axis along @p uAxis and its V
 * axis along uAxis x (-normal), so (U, V, normal) is right-handed and a
 * counter-clockwise turn seen from the normal is a positive 2D cross product.
 *
 * @param origin Origin of the local frame
 * @param uAxis Vector defining the U axis
 * @param normal Vector pointing out of the UV plane
 * @param point Point to map
 * @param normalize Scale both axes to unit length before projecting
 * @return (u, v) coordinates of the point
 * @throws DegenerateGeometryError if normalize is set and an axis has zero
 *         length (uAxis zero, normal zero, or uAxis parallel to normal)
 */
Vector2D mapXyzToUv(const Vector3D& origin,
                    const Vector3D& uAxis,
                    const Vector3D& normal,
                    const Vector3D& point,
                    bool normalize = true);

/// Scalar 2D cross product a.u * b.v - a.v * b.u
double cross2D(const Vector2D& a, const Vector2D& b);

/**
 * @brief Whether a UV point lies inside a UV triangle.
 *
 * For each edge, the query point and the opposite vertex must lie on the
 * same side. Points on an edge or vertex count as inside.
 */
bool pointInTriangle(const std::array<Vector2D, 3>& faceUv,
                     const Vector2D& pointUv);

}  // namespace VectorAlgebra

}  // namespace geo3d

#endif  // GEO3D_ALGEBRA_VECTOR_ALGEBRA_HPP
