// Ticket: 0005_mesh_model

#include <gtest/gtest.h>
#include <type_traits>
#include <variant>
#include <vector>

#include "geo3d-core/src/Mesh/Vertex.hpp"
#include "geo3d-core/src/Validation/GeometryError.hpp"

using namespace geo3d;

TEST(VertexTest, ScalarConstructor)
{
  Vertex v{1.0, 2.0, 3.0};
  EXPECT_DOUBLE_EQ(v.x(), 1.0);
  EXPECT_DOUBLE_EQ(v.y(), 2.0);
  EXPECT_DOUBLE_EQ(v.z(), 3.0);
}

TEST(VertexTest, ConstructFromPointAndRawVector)
{
  Vertex const fromPoint{Point{4.0, 5.0, 6.0}};
  Vertex const fromVector{Vector3D{4.0, 5.0, 6.0}};
  EXPECT_EQ(fromPoint, fromVector);
  EXPECT_EQ(fromPoint.point(), (Point{4.0, 5.0, 6.0}));
}

TEST(VertexTest, SequenceConstructorValidatesLength)
{
  EXPECT_NO_THROW(Vertex(std::vector<double>{0.0, 0.0, 0.0}));
  EXPECT_THROW(Vertex(std::vector<double>{0.0, 0.0}), DimensionMismatchError);
}

TEST(VertexTest, SettersKeepCoordsInSync)
{
  Vertex v{};
  v.setX(1.0);
  v.setY(2.0);
  v.setZ(3.0);
  EXPECT_EQ(v.coords(), (Vector3D{1.0, 2.0, 3.0}));

  v.setCoords(std::vector<double>{7.0, 8.0, 9.0});
  EXPECT_DOUBLE_EQ(v.x(), 7.0);
  EXPECT_DOUBLE_EQ(v.z(), 9.0);
}

TEST(VertexTest, VertexIsNotAPoint)
{
  static_assert(!std::is_base_of_v<Point, Vertex>);
  static_assert(!std::is_convertible_v<Point, Vertex>);
  static_assert(std::is_convertible_v<Vertex, Point>);
  SUCCEED();
}

TEST(VertexTest, ConvertsToItsPoint)
{
  Vertex const v{1.0, -2.0, 0.5};
  Point const p = v;
  EXPECT_EQ(p, v.point());

  ConstraintInput<3> const input = v;
  EXPECT_TRUE(std::holds_alternative<Point>(input));
  EXPECT_EQ(toVector<3>(input), v.coords());
}
