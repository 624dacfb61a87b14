// Ticket: 0002_argument_validation

#ifndef GEO3D_VALIDATION_GEOMETRY_ERROR_HPP
#define GEO3D_VALIDATION_GEOMETRY_ERROR_HPP

#include <stdexcept>

namespace geo3d
{

/**
 * @brief Error types raised by geo3d.
 *
 * One type per failure kind. Every error is raised before any state is
 * written, so the object the failing call targeted is left unchanged.
 */

/// An operand's coordinate count differs from the required dimension
class DimensionMismatchError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// An operand is not one of the shapes the operation accepts
class TypeMismatchError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Unrecognized construction mode string
class InvalidModeError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Scalar parameter outside its permitted closed interval
class RangeError : public std::out_of_range
{
public:
  using std::out_of_range::out_of_range;
};

/// Mesh elements that do not connect the way the operation requires
class TopologyError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Zero-length or zero-area defining vector where a division needs it
class DegenerateGeometryError : public std::domain_error
{
public:
  using std::domain_error::domain_error;
};

}  // namespace geo3d

#endif  // GEO3D_VALIDATION_GEOMETRY_ERROR_HPP
