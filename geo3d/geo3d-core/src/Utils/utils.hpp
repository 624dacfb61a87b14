#ifndef GEO3D_UTILS_HPP
#define GEO3D_UTILS_HPP

#include <Eigen/Dense>
#include <cmath>
#include <concepts>

namespace geo3d
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

// Component-wise match: every |a_i - b_i| <= tolerance
template <typename DerivedA, typename DerivedB>
bool coordinatesMatch(const Eigen::MatrixBase<DerivedA>& a,
                      const Eigen::MatrixBase<DerivedB>& b,
                      double tolerance)
{
  return ((a - b).cwiseAbs().array() <= tolerance).all();
}

}  // namespace geo3d

#endif  // GEO3D_UTILS_HPP
