// Ticket: 0003_vector_algebra

#include "geo3d-core/src/Algebra/VectorAlgebra.hpp"

#include <cmath>
#include <string>

#include "geo3d-core/src/Validation/GeometryError.hpp"

namespace geo3d::VectorAlgebra
{

Vector3D calculateNormal(const Vector3D& p0,
                         const Vector3D& p1,
                         const Vector3D& p2)
{
  Vector3D const u = p1 - p0;
  Vector3D const v = p2 - p0;
  return u.cross(v);
}

double distancePointPoint(const Vector3D& a, const Vector3D& b)
{
  return (b - a).norm();
}

double distancePointLine(const Vector3D& point,
                         const Vector3D& l0,
                         const Vector3D& l1,
                         double epsilon)
{
  Vector3D const lineVector = l1 - l0;
  double const lineLength = lineVector.norm();
  if (lineLength <= epsilon)
  {
    throw DegenerateGeometryError{
      "distancePointLine: line points coincide (length = " +
      std::to_string(lineLength) + ")"};
  }

  Vector3D const toPoint = point - l0;
  return lineVector.cross(toPoint).norm() / lineLength;
}

double distancePointPlane(const Vector3D& point,
                          const Vector3D& p0,
                          const Vector3D& p1,
                          const Vector3D& p2,
                          double epsilon)
{
  Vector3D const normal = calculateNormal(p0, p1, p2);
  double const normalLength = normal.norm();
  if (normalLength <= epsilon)
  {
    throw DegenerateGeometryError{
      "distancePointPlane: plane points are collinear (|normal| = " +
      std::to_string(normalLength) + ")"};
  }

  Vector3D const toPoint = point - p0;
  return std::abs(normal.dot(toPoint)) / normalLength;
}

Vector3D intersectionLinePlane(const Vector3D& l0,
                               const Vector3D& l1,
                               const Vector3D& p0,
                               const Vector3D& p1,
                               const Vector3D& p2,
                               double epsilon)
{
  Vector3D const lineVector = l1 - l0;
  Vector3D const normal = calculateNormal(p0, p1, p2);
  if (normal.norm() <= epsilon)
  {
    throw DegenerateGeometryError{
      "intersectionLinePlane: plane points are collinear"};
  }

  double const den = normal.dot(lineVector);
  if (std::abs(den) <= epsilon)
  {
    throw DegenerateGeometryError{
      "intersectionLinePlane: line is parallel to plane (n . dir = " +
      std::to_string(den) + ")"};
  }

  double const num = normal.dot(p0 - l0);
  return l0 + (num / den) * lineVector;
}

Vector3D projectVector(const Vector3D& v0, const Vector3D& v1, double epsilon)
{
  double const den = v1.dot(v1);
  if (den <= epsilon)
  {
    throw DegenerateGeometryError{
      "projectVector: cannot project onto a zero vector"};
  }
  return (v1.dot(v0) / den) * v1;
}

Vector2D mapXyzToUv(const Vector3D& origin,
                    const Vector3D& uAxis,
                    const Vector3D& normal,
                    const Vector3D& point,
                    bool normalize)
{
  Vector3D const local = point - origin;
  Vector3D u = uAxis;
  Vector3D v = uAxis.cross(-normal);

  if (normalize)
  {
    double const uLength = u.norm();
    double const vLength = v.norm();
    if (uLength == 0.0 || vLength == 0.0)
    {
      throw DegenerateGeometryError{
        "mapXyzToUv: UV frame axis has zero length (|u| = " +
        std::to_string(uLength) + ", |v| = " + std::to_string(vLength) +
        ")"};
    }
    u /= uLength;
    v /= vLength;
  }

  return Vector2D{u.dot(local), v.dot(local)};
}

double cross2D(const Vector2D& a, const Vector2D& b)
{
  return a.x() * b.y() - a.y() * b.x();
}

namespace
{

// Point p and reference r lie on the same side of the line through e0, e1
// (zero counts as same side)
bool sameSide(const Vector2D& p,
              const Vector2D& r,
              const Vector2D& e0,
              const Vector2D& e1)
{
  Vector2D const edge = e1 - e0;
  return cross2D(edge, p - e0) * cross2D(edge, r - e0) >= 0.0;
}

}  // namespace

bool pointInTriangle(const std::array<Vector2D, 3>& faceUv,
                     const Vector2D& pointUv)
{
  return sameSide(pointUv, faceUv[0], faceUv[1], faceUv[2]) &&
         sameSide(pointUv, faceUv[1], faceUv[2], faceUv[0]) &&
         sameSide(pointUv, faceUv[2], faceUv[0], faceUv[1]);
}

}  // namespace geo3d::VectorAlgebra
