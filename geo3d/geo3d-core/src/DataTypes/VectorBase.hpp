// Ticket: 0001_vector_types
// Fixed-size coordinate vector shared by the UV and spatial vector types

#ifndef GEO3D_VECTOR_BASE_HPP
#define GEO3D_VECTOR_BASE_HPP

#include <Eigen/Dense>

namespace geo3d::detail
{

/**
 * @brief Column vector of Dim doubles tagged with its dimension.
 *
 * Vector2D and Vector3D derive from this, so both keep the Eigen expression
 * API and expose kDimension to the argument checks. A default-constructed
 * vector is zero, unlike a bare Eigen vector.
 *
 * @tparam Dim 2 for UV vectors, 3 for spatial vectors
 */
template <int Dim>
class VectorBase : public Eigen::Matrix<double, Dim, 1>
{
  static_assert(Dim == 2 || Dim == 3, "VectorBase is 2D or 3D only");

public:
  using Storage = Eigen::Matrix<double, Dim, 1>;

  static constexpr int kDimension = Dim;
  static constexpr Eigen::Index X = 0;
  static constexpr Eigen::Index Y = 1;

  VectorBase() : Storage(Storage::Zero())
  {
  }

  VectorBase(double x, double y)
    requires(Dim == 2)
    : Storage(x, y)
  {
  }

  VectorBase(double x, double y, double z)
    requires(Dim == 3)
    : Storage(x, y, z)
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  VectorBase(const Eigen::MatrixBase<OtherDerived>& other) : Storage(other)
  {
  }

  template <typename OtherDerived>
  VectorBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    Storage::operator=(other);
    return *this;
  }
};

}  // namespace geo3d::detail

#endif  // GEO3D_VECTOR_BASE_HPP
