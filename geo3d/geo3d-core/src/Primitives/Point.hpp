// Ticket: 0004_primitive_model

#ifndef GEO3D_PRIMITIVES_POINT_HPP
#define GEO3D_PRIMITIVES_POINT_HPP

#include <vector>

#include "geo3d-core/src/DataTypes/VectorTypes.hpp"
#include "geo3d-core/src/Validation/Validation.hpp"

namespace geo3d
{

/**
 * @brief Point primitive in 2D (UV) or 3D space.
 *
 * Stores one fixed-size coordinate vector. The per-axis accessors read from
 * and write into that vector directly, so they can never drift out of sync
 * with coords().
 *
 * Construction:
 * - from a raw vector of the matching dimension
 * - from exactly Dim scalars
 * - from a runtime-length std::vector<double> (validated)
 *
 * @tparam Dim 2 for UV points, 3 for spatial points
 */
template <int Dim>
class BasicPoint
{
  static_assert(Dim == 2 || Dim == 3,
                "BasicPoint only works in 2D and 3D space");

public:
  static constexpr int kDimension = Dim;
  using VectorType = VectorND<Dim>;

  BasicPoint() = default;

  explicit BasicPoint(const VectorType& coords) : coords_{coords}
  {
  }

  /**
   * @brief Construct from a runtime-length coordinate sequence.
   * @throws DimensionMismatchError if coords.size() != Dim
   */
  explicit BasicPoint(const std::vector<double>& coords)
    : coords_{fromSequence(coords)}
  {
  }

  BasicPoint(double x, double y)
    requires(Dim == 2)
    : coords_{x, y}
  {
  }

  BasicPoint(double x, double y, double z)
    requires(Dim == 3)
    : coords_{x, y, z}
  {
  }

  [[nodiscard]] const VectorType& coords() const
  {
    return coords_;
  }

  void setCoords(const VectorType& coords)
  {
    coords_ = coords;
  }

  /// @throws DimensionMismatchError if coords.size() != Dim (point unchanged)
  void setCoords(const std::vector<double>& coords)
  {
    coords_ = fromSequence(coords);
  }

  [[nodiscard]] double x() const
  {
    return coords_[0];
  }

  [[nodiscard]] double y() const
  {
    return coords_[1];
  }

  [[nodiscard]] double z() const
    requires(Dim == 3)
  {
    return coords_[2];
  }

  void setX(double value)
  {
    coords_[0] = value;
  }

  void setY(double value)
  {
    coords_[1] = value;
  }

  void setZ(double value)
    requires(Dim == 3)
  {
    coords_[2] = value;
  }

  // UV naming for 2D points
  [[nodiscard]] double u() const
    requires(Dim == 2)
  {
    return coords_[0];
  }

  [[nodiscard]] double v() const
    requires(Dim == 2)
  {
    return coords_[1];
  }

  void setU(double value)
    requires(Dim == 2)
  {
    coords_[0] = value;
  }

  void setV(double value)
    requires(Dim == 2)
  {
    coords_[1] = value;
  }

  bool operator==(const BasicPoint& other) const
  {
    return coords_ == other.coords_;
  }

private:
  static VectorType fromSequence(const std::vector<double>& coords)
  {
    Validation::checkDimension(Dim, coords);
    VectorType result;
    for (int i = 0; i < Dim; ++i)
    {
      result[i] = coords[static_cast<size_t>(i)];
    }
    return result;
  }

  VectorType coords_{};
};

using Point = BasicPoint<3>;
using UVPoint = BasicPoint<2>;

}  // namespace geo3d

#endif  // GEO3D_PRIMITIVES_POINT_HPP
