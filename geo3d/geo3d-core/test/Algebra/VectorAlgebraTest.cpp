// Ticket: 0003_vector_algebra

#include <gtest/gtest.h>
#include <array>
#include <cmath>

#include "geo3d-core/src/Algebra/VectorAlgebra.hpp"
#include "geo3d-core/src/Validation/GeometryError.hpp"
#include "geo3d-core/test/Helpers/GeometryAssertions.hpp"

using namespace geo3d;
using geo3d::test::expectCoordsNear;

// ============================================================================
// calculateNormal
// ============================================================================

TEST(VectorAlgebraTest, CalculateNormalOfUnitTriangle)
{
  Vector3D const n = VectorAlgebra::calculateNormal(
    Vector3D{0.0, 0.0, 0.0}, Vector3D{1.0, 0.0, 0.0}, Vector3D{0.0, 1.0, 0.0});
  expectCoordsNear(Vector3D{0.0, 0.0, 1.0}, n);
}

TEST(VectorAlgebraTest, CalculateNormalIsNotNormalized)
{
  Vector3D const n = VectorAlgebra::calculateNormal(
    Vector3D{0.0, 0.0, 0.0}, Vector3D{2.0, 0.0, 0.0}, Vector3D{0.0, 3.0, 0.0});
  EXPECT_DOUBLE_EQ(n.z(), 6.0);
}

TEST(VectorAlgebraTest, CalculateNormalOfCollinearPointsIsZero)
{
  Vector3D const n = VectorAlgebra::calculateNormal(
    Vector3D{0.0, 0.0, 0.0}, Vector3D{1.0, 1.0, 1.0}, Vector3D{2.0, 2.0, 2.0});
  EXPECT_DOUBLE_EQ(n.norm(), 0.0);
}

// ============================================================================
// Distances
// ============================================================================

TEST(VectorAlgebraTest, DistancePointPointToSelfIsZero)
{
  Vector3D const p{1.5, -2.0, 7.25};
  EXPECT_DOUBLE_EQ(VectorAlgebra::distancePointPoint(p, p), 0.0);
}

TEST(VectorAlgebraTest, DistancePointPointIsEuclidean)
{
  EXPECT_DOUBLE_EQ(VectorAlgebra::distancePointPoint(Vector3D{0.0, 0.0, 0.0},
                                                     Vector3D{3.0, 4.0, 0.0}),
                   5.0);
}

TEST(VectorAlgebraTest, DistancePointLineToXAxis)
{
  double const d = VectorAlgebra::distancePointLine(Vector3D{0.0, 1.0, 0.0},
                                                    Vector3D{0.0, 0.0, 0.0},
                                                    Vector3D{1.0, 0.0, 0.0});
  EXPECT_DOUBLE_EQ(d, 1.0);
}

TEST(VectorAlgebraTest, DistancePointLineOffAxisInZ)
{
  double const d = VectorAlgebra::distancePointLine(Vector3D{0.0, 0.0, 1.0},
                                                    Vector3D{0.0, 0.0, 0.0},
                                                    Vector3D{1.0, 0.0, 0.0});
  EXPECT_DOUBLE_EQ(d, 1.0);
}

TEST(VectorAlgebraTest, DistancePointLineIgnoresPositionAlongLine)
{
  double const d = VectorAlgebra::distancePointLine(Vector3D{42.0, 0.0, 2.0},
                                                    Vector3D{0.0, 0.0, 0.0},
                                                    Vector3D{1.0, 0.0, 0.0});
  EXPECT_NEAR(d, 2.0, 1e-12);
}

TEST(VectorAlgebraTest, DistancePointLineRejectsCoincidentLinePoints)
{
  Vector3D const p{1.0, 1.0, 1.0};
  EXPECT_THROW((void)VectorAlgebra::distancePointLine(p, p, p),
               DegenerateGeometryError);
}

TEST(VectorAlgebraTest, DistancePointLineHonorsEpsilon)
{
  EXPECT_THROW((void)VectorAlgebra::distancePointLine(Vector3D{0.0, 1.0, 0.0},
                                                      Vector3D{0.0, 0.0, 0.0},
                                                      Vector3D{1e-9, 0.0, 0.0},
                                                      1e-6),
               DegenerateGeometryError);
}

TEST(VectorAlgebraTest, DistancePointPlaneToXYPlane)
{
  double const d = VectorAlgebra::distancePointPlane(Vector3D{3.0, -1.0, -2.5},
                                                     Vector3D{0.0, 0.0, 0.0},
                                                     Vector3D{1.0, 0.0, 0.0},
                                                     Vector3D{0.0, 1.0, 0.0});
  EXPECT_DOUBLE_EQ(d, 2.5);
}

TEST(VectorAlgebraTest, DistancePointPlaneRejectsCollinearPlane)
{
  EXPECT_THROW(
    (void)VectorAlgebra::distancePointPlane(Vector3D{0.0, 0.0, 1.0},
                                            Vector3D{0.0, 0.0, 0.0},
                                            Vector3D{1.0, 0.0, 0.0},
                                            Vector3D{2.0, 0.0, 0.0}),
    DegenerateGeometryError);
}

// ============================================================================
// Intersection and projection
// ============================================================================

TEST(VectorAlgebraTest, IntersectionLinePlaneHitsXYPlane)
{
  Vector3D const hit =
    VectorAlgebra::intersectionLinePlane(Vector3D{1.0, 2.0, 5.0},
                                         Vector3D{1.0, 2.0, 4.0},
                                         Vector3D{0.0, 0.0, 0.0},
                                         Vector3D{1.0, 0.0, 0.0},
                                         Vector3D{0.0, 1.0, 0.0});
  expectCoordsNear(Vector3D{1.0, 2.0, 0.0}, hit);
}

TEST(VectorAlgebraTest, IntersectionLinePlaneSlantedLine)
{
  // Line through (0,0,1) and (1,1,0) meets z = 0 at (1,1,0)
  Vector3D const hit =
    VectorAlgebra::intersectionLinePlane(Vector3D{0.0, 0.0, 1.0},
                                         Vector3D{1.0, 1.0, 0.0},
                                         Vector3D{5.0, 5.0, 0.0},
                                         Vector3D{6.0, 5.0, 0.0},
                                         Vector3D{5.0, 6.0, 0.0});
  expectCoordsNear(Vector3D{1.0, 1.0, 0.0}, hit);
}

TEST(VectorAlgebraTest, IntersectionLinePlaneRejectsParallelLine)
{
  EXPECT_THROW(
    (void)VectorAlgebra::intersectionLinePlane(Vector3D{0.0, 0.0, 1.0},
                                               Vector3D{1.0, 0.0, 1.0},
                                               Vector3D{0.0, 0.0, 0.0},
                                               Vector3D{1.0, 0.0, 0.0},
                                               Vector3D{0.0, 1.0, 0.0}),
    DegenerateGeometryError);
}

TEST(VectorAlgebraTest, ProjectVectorOntoAxis)
{
  Vector3D const projected = VectorAlgebra::projectVector(
    Vector3D{3.0, 4.0, 5.0}, Vector3D{2.0, 0.0, 0.0});
  expectCoordsNear(Vector3D{3.0, 0.0, 0.0}, projected);
}

TEST(VectorAlgebraTest, ProjectVectorRejectsZeroTarget)
{
  EXPECT_THROW(
    (void)VectorAlgebra::projectVector(Vector3D{1.0, 0.0, 0.0}, Vector3D{}),
    DegenerateGeometryError);
}

// ============================================================================
// UV mapping
// ============================================================================

TEST(VectorAlgebraTest, MapXyzToUvInXYPlane)
{
  Vector2D const uv = VectorAlgebra::mapXyzToUv(Vector3D{1.0, 1.0, 0.0},
                                                Vector3D{2.0, 0.0, 0.0},
                                                Vector3D{0.0, 0.0, 1.0},
                                                Vector3D{3.0, 4.0, 7.0});
  // Normalized axes: U = +x, V = +y; the normal component is dropped
  EXPECT_NEAR(uv.x(), 2.0, 1e-12);
  EXPECT_NEAR(uv.y(), 3.0, 1e-12);
}

TEST(VectorAlgebraTest, MapXyzToUvWithoutNormalizationScalesByAxisLength)
{
  Vector2D const uv = VectorAlgebra::mapXyzToUv(Vector3D{0.0, 0.0, 0.0},
                                                Vector3D{2.0, 0.0, 0.0},
                                                Vector3D{0.0, 0.0, 1.0},
                                                Vector3D{1.0, 1.0, 0.0},
                                                false);
  EXPECT_NEAR(uv.x(), 2.0, 1e-12);
  EXPECT_NEAR(uv.y(), 2.0, 1e-12);
}

TEST(VectorAlgebraTest, MapXyzToUvRejectsAxisParallelToNormal)
{
  EXPECT_THROW((void)VectorAlgebra::mapXyzToUv(Vector3D{},
                                               Vector3D{0.0, 0.0, 1.0},
                                               Vector3D{0.0, 0.0, 2.0},
                                               Vector3D{1.0, 0.0, 0.0}),
               DegenerateGeometryError);
}

TEST(VectorAlgebraTest, Cross2DSignFollowsTurnDirection)
{
  EXPECT_DOUBLE_EQ(
    VectorAlgebra::cross2D(Vector2D{1.0, 0.0}, Vector2D{0.0, 1.0}), 1.0);
  EXPECT_DOUBLE_EQ(
    VectorAlgebra::cross2D(Vector2D{0.0, 1.0}, Vector2D{1.0, 0.0}), -1.0);
  EXPECT_DOUBLE_EQ(
    VectorAlgebra::cross2D(Vector2D{2.0, 2.0}, Vector2D{1.0, 1.0}), 0.0);
}

// ============================================================================
// pointInTriangle
// ============================================================================

class PointInTriangleTest : public ::testing::Test
{
protected:
  std::array<Vector2D, 3> triangle_{
    Vector2D{0.0, 0.0}, Vector2D{1.0, 0.0}, Vector2D{0.0, 1.0}};
};

TEST_F(PointInTriangleTest, InteriorPointIsInside)
{
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, Vector2D{0.2, 0.2}));
}

TEST_F(PointInTriangleTest, OwnVerticesAndCentroidAreInside)
{
  Vector2D const centroid =
    (triangle_[0] + triangle_[1] + triangle_[2]) / 3.0;
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, centroid));
  for (const Vector2D& corner : triangle_)
  {
    EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, corner));
  }
  EXPECT_FALSE(
    VectorAlgebra::pointInTriangle(triangle_, Vector2D{100.0, -50.0}));
}

TEST_F(PointInTriangleTest, ExteriorPointIsOutside)
{
  EXPECT_FALSE(VectorAlgebra::pointInTriangle(triangle_, Vector2D{1.0, 1.0}));
  EXPECT_FALSE(
    VectorAlgebra::pointInTriangle(triangle_, Vector2D{-0.1, 0.5}));
}

TEST_F(PointInTriangleTest, BoundaryCountsAsInside)
{
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, Vector2D{0.5, 0.0}));
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, Vector2D{0.5, 0.5}));
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(triangle_, Vector2D{0.0, 0.0}));
}

TEST_F(PointInTriangleTest, WindingOfTriangleDoesNotMatter)
{
  std::array<Vector2D, 3> const clockwise{
    triangle_[0], triangle_[2], triangle_[1]};
  EXPECT_TRUE(VectorAlgebra::pointInTriangle(clockwise, Vector2D{0.2, 0.2}));
  EXPECT_FALSE(
    VectorAlgebra::pointInTriangle(clockwise, Vector2D{1.0, 1.0}));
}
