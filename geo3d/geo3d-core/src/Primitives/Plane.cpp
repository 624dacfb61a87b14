// Ticket: 0004_primitive_model

#include "geo3d-core/src/Primitives/Plane.hpp"

#include <spdlog/spdlog.h>
#include <vector>

#include "geo3d-core/src/Algebra/VectorAlgebra.hpp"

namespace geo3d
{

namespace
{

constexpr const char* kRawVectorOnly =
  "Plane: argument takes a raw vector in modes 'vector' and 'normal'";

}  // namespace

Plane::Plane(const Point& pointA, const Point& pointB, const Point& pointC)
{
  assignFromPoints(pointA.coords(), pointB.coords(), pointC.coords());
}

Plane::Plane(const Point& pointA,
             const Vector3D& vectorU,
             const Vector3D& vectorV)
{
  assignFromVectors(pointA.coords(), vectorU, vectorV);
}

Plane::Plane(const Input& constraint0,
             const Input& constraint1,
             const Input& constraint2,
             PlaneMode mode)
{
  Validation::checkDimension(3, constraint0, constraint1, constraint2);
  Vector3D const a = toVector<3>(constraint0);

  if (mode == PlaneMode::Points)
  {
    assignFromPoints(a, toVector<3>(constraint1), toVector<3>(constraint2));
    return;
  }

  Validation::checkType<Vector3D, std::vector<double>>(constraint1,
                                                       kRawVectorOnly);
  Validation::checkType<Vector3D, std::vector<double>>(constraint2,
                                                       kRawVectorOnly);

  Vector3D const u = toVector<3>(constraint1);
  if (mode == PlaneMode::Vector)
  {
    assignFromVectors(a, u, toVector<3>(constraint2));
    return;
  }

  assignFromVectors(a, u, vectorFromNormal(toVector<3>(constraint2), u));
}

Plane::Plane(const Input& constraint0,
             const Input& constraint1,
             const Input& constraint2,
             std::string_view mode)
  : Plane{constraint0,
          constraint1,
          constraint2,
          Validation::parsePlaneMode(mode)}
{
}

const Vector3D& Plane::pointA() const
{
  return pointA_;
}

const Vector3D& Plane::pointB() const
{
  return pointB_;
}

const Vector3D& Plane::pointC() const
{
  return pointC_;
}

const Vector3D& Plane::vectorU() const
{
  return vectorU_;
}

const Vector3D& Plane::vectorV() const
{
  return vectorV_;
}

const Vector3D& Plane::normal() const
{
  return normal_;
}

void Plane::setPointA(const Input& constraint)
{
  Validation::checkDimension(3, constraint);
  assignFromPoints(toVector<3>(constraint), pointB_, pointC_);
}

void Plane::setPointB(const Input& constraint)
{
  Validation::checkDimension(3, constraint);
  assignFromPoints(pointA_, toVector<3>(constraint), pointC_);
}

void Plane::setPointC(const Input& constraint)
{
  Validation::checkDimension(3, constraint);
  assignFromPoints(pointA_, pointB_, toVector<3>(constraint));
}

void Plane::setVectorU(const Input& vector)
{
  Validation::checkDimension(3, vector);
  Validation::checkType<Vector3D, std::vector<double>>(
    vector, "Plane: 'vectorU' takes a raw vector");
  assignFromVectors(pointA_, toVector<3>(vector), vectorV_);
}

void Plane::setVectorV(const Input& vector)
{
  Validation::checkDimension(3, vector);
  Validation::checkType<Vector3D, std::vector<double>>(
    vector, "Plane: 'vectorV' takes a raw vector");
  assignFromVectors(pointA_, vectorU_, toVector<3>(vector));
}

void Plane::setNormal(const Input& normal)
{
  Validation::checkDimension(3, normal);
  Validation::checkType<Vector3D, std::vector<double>>(
    normal, "Plane: 'normal' takes a raw vector");
  assignFromVectors(
    pointA_, vectorU_, vectorFromNormal(toVector<3>(normal), vectorU_));
}

Vector3D Plane::point(double scaleU, double scaleV) const
{
  return pointA_ + scaleU * vectorU_ + scaleV * vectorV_;
}

double Plane::distanceTo(const Input& point) const
{
  Validation::checkDimension(3, point);
  return VectorAlgebra::distancePointPlane(
    toVector<3>(point), pointA_, pointB_, pointC_);
}

Vector3D Plane::intersection(const Line& line) const
{
  return VectorAlgebra::intersectionLinePlane(
    line.pointA(), line.pointB(), pointA_, pointB_, pointC_);
}

bool Plane::isDegenerate() const
{
  return normal_.squaredNorm() == 0.0;
}

void Plane::assignFromPoints(const Vector3D& pointA,
                             const Vector3D& pointB,
                             const Vector3D& pointC)
{
  pointA_ = pointA;
  pointB_ = pointB;
  pointC_ = pointC;
  vectorU_ = pointB_ - pointA_;
  vectorV_ = pointC_ - pointA_;
  normal_ = vectorU_.cross(vectorV_);
}

void Plane::assignFromVectors(const Vector3D& pointA,
                              const Vector3D& vectorU,
                              const Vector3D& vectorV)
{
  pointA_ = pointA;
  vectorU_ = vectorU;
  vectorV_ = vectorV;
  pointB_ = pointA_ + vectorU_;
  pointC_ = pointA_ + vectorV_;
  normal_ = vectorU_.cross(vectorV_);
}

Vector3D Plane::vectorFromNormal(const Vector3D& normal,
                                 const Vector3D& vectorU)
{
  Vector3D vectorV = normal.cross(vectorU);
  if (vectorV.squaredNorm() == 0.0)
  {
    spdlog::warn(
      "Plane: normal ({}, {}, {}) is zero or parallel to vectorU, derived "
      "vectorV is zero",
      normal.x(),
      normal.y(),
      normal.z());
  }
  return vectorV;
}

}  // namespace geo3d
