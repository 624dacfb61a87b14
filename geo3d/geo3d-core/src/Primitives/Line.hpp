// Ticket: 0004_primitive_model

#ifndef GEO3D_PRIMITIVES_LINE_HPP
#define GEO3D_PRIMITIVES_LINE_HPP

#include <string_view>

#include "geo3d-core/src/Algebra/VectorAlgebra.hpp"
#include "geo3d-core/src/Primitives/ConstraintInput.hpp"
#include "geo3d-core/src/Primitives/Point.hpp"
#include "geo3d-core/src/Validation/Validation.hpp"

namespace geo3d
{

/**
 * @brief Line primitive in 2D (UV) or 3D space.
 *
 * Defined by a base point and a direction vector, and always exposes
 * pointA, pointB and vector with the invariant pointB == pointA + vector.
 *
 * Two construction modes:
 * - point: two points, vector derived as pointB - pointA
 * - vector: one point and a direction vector, pointB derived
 *
 * The values passed in are stored verbatim, so reading back the inputs of
 * either mode returns them exactly. Setters keep the other two quantities
 * consistent:
 * - setPointA / setPointB recompute vector from the other, unchanged point
 * - setVector recomputes pointB from the unchanged pointA
 *
 * Error handling: All arguments are validated before any member is written
 *
 * @tparam Dim 2 for UV lines, 3 for spatial lines
 */
template <int Dim>
class BasicLine
{
public:
  static constexpr int kDimension = Dim;
  using PointType = BasicPoint<Dim>;
  using VectorType = VectorND<Dim>;
  using Input = ConstraintInput<Dim>;

  /// Point mode, selected by argument types
  BasicLine(const PointType& pointA, const PointType& pointB)
  {
    assignFromPoints(pointA.coords(), pointB.coords());
  }

  /// Vector mode, selected by argument types
  BasicLine(const PointType& pointA, const VectorType& vector)
  {
    assignFromVector(pointA.coords(), vector);
  }

  /**
   * @brief Construct with an explicit mode.
   *
   * @param constraint0 Base point (named point or raw vector)
   * @param constraint1 Second point in point mode (named point or raw
   *        vector), direction in vector mode (raw vector only)
   * @param mode Construction mode
   * @throws DimensionMismatchError if an argument does not have Dim coords
   * @throws TypeMismatchError if a named point is given as the direction
   */
  BasicLine(const Input& constraint0, const Input& constraint1, LineMode mode)
  {
    Validation::checkDimension(Dim, constraint0, constraint1);
    const VectorType a = toVector<Dim>(constraint0);

    if (mode == LineMode::Point)
    {
      assignFromPoints(a, toVector<Dim>(constraint1));
      return;
    }

    Validation::checkType<VectorType, std::vector<double>>(
      constraint1,
      "Line: argument 'constraint1' takes a raw vector in mode 'vector'");
    assignFromVector(a, toVector<Dim>(constraint1));
  }

  /**
   * @brief Construct with a mode string ("point"/"points" or "vector",
   * case-insensitive).
   * @throws InvalidModeError for any other mode string
   */
  BasicLine(const Input& constraint0,
            const Input& constraint1,
            std::string_view mode)
    : BasicLine{constraint0, constraint1, Validation::parseLineMode(mode)}
  {
  }

  [[nodiscard]] const VectorType& pointA() const
  {
    return pointA_;
  }

  [[nodiscard]] const VectorType& pointB() const
  {
    return pointB_;
  }

  [[nodiscard]] const VectorType& vector() const
  {
    return vector_;
  }

  void setPointA(const Input& constraint)
  {
    Validation::checkDimension(Dim, constraint);
    assignFromPoints(toVector<Dim>(constraint), pointB_);
  }

  void setPointB(const Input& constraint)
  {
    Validation::checkDimension(Dim, constraint);
    assignFromPoints(pointA_, toVector<Dim>(constraint));
  }

  /// @throws TypeMismatchError if @p vector is a named point
  void setVector(const Input& vector)
  {
    Validation::checkDimension(Dim, vector);
    Validation::checkType<VectorType, std::vector<double>>(
      vector, "Line: 'vector' takes a raw vector");
    assignFromVector(pointA_, toVector<Dim>(vector));
  }

  /**
   * @brief Point on the line at pointA + scale * vector.
   *
   * Any real scale is accepted; scale 0 is pointA and scale 1 is pointB.
   */
  [[nodiscard]] VectorType point(double scale) const
  {
    return pointA_ + scale * vector_;
  }

  /// Shortest distance from @p point to this (infinite) line
  [[nodiscard]] double distanceTo(const Input& point) const
    requires(Dim == 3)
  {
    Validation::checkDimension(Dim, point);
    return VectorAlgebra::distancePointLine(
      toVector<Dim>(point), pointA_, pointB_);
  }

private:
  void assignFromPoints(const VectorType& pointA, const VectorType& pointB)
  {
    pointA_ = pointA;
    pointB_ = pointB;
    vector_ = pointB_ - pointA_;
  }

  void assignFromVector(const VectorType& pointA, const VectorType& vector)
  {
    pointA_ = pointA;
    vector_ = vector;
    pointB_ = pointA_ + vector_;
  }

  VectorType pointA_;
  VectorType pointB_;
  VectorType vector_;
};

using Line = BasicLine<3>;
using UVLine = BasicLine<2>;

}  // namespace geo3d

#endif  // GEO3D_PRIMITIVES_LINE_HPP
