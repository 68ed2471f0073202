// =============================================================================
// Geometry Value Model Tests
// =============================================================================

#include "test_helpers.hpp"

using namespace ewkb;
using namespace ewkb::core;
using namespace ewkb::test;

class GeometryTest : public ::testing::Test {};

TEST_F(GeometryTest, PointHoldsOneVertex) {
	auto point = MakePoint(false, 1.5, -2.5);
	EXPECT_EQ(point.GetType(), GeometryType::POINT);
	EXPECT_FALSE(point.HasZ());
	EXPECT_EQ(point.Count(), 1u);
	EXPECT_EQ(point.GetSRID(), 0u);

	auto vertex = Point::GetVertex(point);
	EXPECT_EQ(vertex.x, 1.5);
	EXPECT_EQ(vertex.y, -2.5);
}

TEST_F(GeometryTest, PointZKeepsThirdOrdinate) {
	auto point = MakePoint(true, 1, 2, 3);
	EXPECT_TRUE(point.HasZ());
	EXPECT_EQ(point.GetProperties().VertexSize(), 24u);

	auto vertex = Point::GetVertex<VertexXYZ>(point);
	EXPECT_EQ(vertex.x, 1);
	EXPECT_EQ(vertex.y, 2);
	EXPECT_EQ(vertex.z, 3);

	// The XY accessor works regardless of the vertex type
	auto flat = SinglePartGeometry::GetVertex(point, 0);
	EXPECT_EQ(flat.x, 1);
	EXPECT_EQ(flat.y, 2);
}

TEST_F(GeometryTest, CreatedPointIsZeroed) {
	auto point = Point::Create(true);
	EXPECT_EQ(point.Count(), 1u);
	EXPECT_EQ(Point::GetVertex<VertexXYZ>(point), VertexXYZ(0.0));
}

TEST_F(GeometryTest, LineStringFromVertices) {
	vector<VertexXY> vertices;
	vertices.push_back(VertexXY {0, 0});
	vertices.push_back(VertexXY {1, 1});
	vertices.push_back(VertexXY {2, 0});
	auto line = LineString::CreateFromVertices(vertices);

	EXPECT_EQ(line.GetType(), GeometryType::LINESTRING);
	ASSERT_EQ(LineString::VertexCount(line), 3u);
	EXPECT_EQ(LineString::GetVertex<VertexXY>(line, 2), (VertexXY {2, 0}));
	EXPECT_EQ(LineString::ByteSize(line), 48u);
}

TEST_F(GeometryTest, ResizeExtendsWithZeroedVertices) {
	auto line = MakeLineString(true, 2, 1);
	LineString::Resize(line, 4);
	ASSERT_EQ(line.Count(), 4u);
	EXPECT_EQ(LineString::GetVertex<VertexXYZ>(line, 3), VertexXYZ(0.0));

	LineString::Resize(line, 1);
	EXPECT_EQ(line.Count(), 1u);
	EXPECT_EQ(LineString::GetVertex<VertexXYZ>(line, 0), (VertexXYZ {1, 1, 0}));
}

TEST_F(GeometryTest, PolygonRings) {
	auto polygon = MakePolygon(false, 0);
	EXPECT_EQ(polygon.GetType(), GeometryType::POLYGON);
	ASSERT_EQ(Polygon::PartCount(polygon), 2u);
	EXPECT_EQ(Polygon::ExteriorRing(polygon).Count(), 5u);
	EXPECT_EQ(Polygon::Part(polygon, 1).GetType(), GeometryType::LINESTRING);
}

TEST_F(GeometryTest, EmptyPartsFromCount) {
	auto polygon = Polygon::Create(3, true);
	ASSERT_EQ(Polygon::PartCount(polygon), 3u);
	for (const auto &ring : Polygon::Parts(polygon)) {
		EXPECT_EQ(ring.GetType(), GeometryType::LINESTRING);
		EXPECT_TRUE(ring.HasZ());
		EXPECT_EQ(ring.Count(), 0u);
	}

	auto multi_point = MultiPoint::Create(2, false);
	for (const auto &point : MultiPoint::Parts(multi_point)) {
		EXPECT_EQ(point.GetType(), GeometryType::POINT);
		EXPECT_EQ(point.Count(), 1u);
	}
}

TEST_F(GeometryTest, CollectionCreateConsumesItems) {
	vector<Geometry> items;
	items.push_back(MakePoint(false, 1, 2));
	items.push_back(MakeLineString(false, 2, 0));
	auto collection = GeometryCollection::Create(items, false);

	EXPECT_TRUE(items.empty());
	ASSERT_EQ(GeometryCollection::PartCount(collection), 2u);
	EXPECT_EQ(GeometryCollection::Part(collection, 1).GetType(), GeometryType::LINESTRING);
}

TEST_F(GeometryTest, Equality) {
	auto a = MakeGeometryCollection(true);
	auto b = MakeGeometryCollection(true);
	EXPECT_EQ(a, b);

	b.SetSRID(4326);
	EXPECT_NE(a, b);
	a.SetSRID(4326);
	EXPECT_EQ(a, b);

	// Dimensionality matters even when the x and y agree
	EXPECT_NE(MakePoint(false, 1, 2), MakePoint(true, 1, 2, 0));
	EXPECT_NE(MakePoint(false, 1, 2), MakePoint(false, 1, 2.5));

	// So does a difference deep inside the tree
	auto c = MakeGeometryCollection(false);
	auto d = MakeGeometryCollection(false);
	auto &nested = GeometryCollection::Part(d, 4);
	auto &nested_line = MultiLineString::Part(GeometryCollection::Part(nested, 1), 0);
	LineString::SetVertex(nested_line, 0, VertexXY {-1, -1});
	EXPECT_NE(c, d);
}

TEST_F(GeometryTest, CopiesAreIndependent) {
	auto original = MakeMultiPoint(false);
	auto copy = original;
	MultiPoint::Part(copy, 0) = MakePoint(false, 42, 42);
	EXPECT_NE(original, copy);
	EXPECT_EQ(Point::GetVertex(MultiPoint::Part(original, 0)), (VertexXY {0, 0}));
}

TEST_F(GeometryTest, ToStringDescribesStructure) {
	EXPECT_EQ(MakePoint(false, 1, 2).ToString(), "POINT (1 vertex)");
	EXPECT_EQ(MakeLineString(true, 3, 0).ToString(), "LINESTRING Z (3 vertices)");

	auto multi_point = MakeMultiPoint(true);
	multi_point.SetSRID(4326);
	EXPECT_EQ(multi_point.ToString(), "MULTIPOINT Z (3 parts, srid 4326)");
	EXPECT_EQ(Geometry().ToString(), "GEOMETRYCOLLECTION (0 parts)");
}

TEST_F(GeometryTest, VertexCountRecurses) {
	// 1 + 3 + (5 + 4) + 3 + (1 + (2 + 3))
	EXPECT_EQ(Geometry::VertexCount(MakeGeometryCollection(false)), 22u);
}

TEST_F(GeometryTest, MatchDispatchesOnTags) {
	struct op {
		static string Case(Geometry::Tags::SinglePartGeometry, const Geometry &) {
			return "single";
		}
		static string Case(Geometry::Tags::Polygon, const Geometry &) {
			return "polygon";
		}
		static string Case(Geometry::Tags::CollectionGeometry, const Geometry &geom) {
			return "collection of " + std::to_string(geom.Count());
		}
	};
	EXPECT_EQ(Geometry::Match<op>(MakePoint(false, 0, 0)), "single");
	EXPECT_EQ(Geometry::Match<op>(MakeLineString(false, 2, 0)), "single");
	EXPECT_EQ(Geometry::Match<op>(MakePolygon(false, 0)), "polygon");
	EXPECT_EQ(Geometry::Match<op>(MakeMultiLineString(false)), "collection of 2");
}

TEST_F(GeometryTest, GeometryTypeHelpers) {
	EXPECT_EQ(GeometryTypes::ToShapeCode(GeometryType::POINT), 1u);
	EXPECT_EQ(GeometryTypes::ToShapeCode(GeometryType::GEOMETRYCOLLECTION), 7u);
	EXPECT_TRUE(GeometryTypes::IsSinglePart(GeometryType::LINESTRING));
	EXPECT_TRUE(GeometryTypes::IsMultiPart(GeometryType::POLYGON));
	EXPECT_FALSE(GeometryTypes::IsCollection(GeometryType::POLYGON));
	EXPECT_TRUE(GeometryTypes::IsCollection(GeometryType::MULTIPOLYGON));
	EXPECT_EQ(GeometryTypes::ToString(GeometryType::MULTILINESTRING), "MULTILINESTRING");
}
