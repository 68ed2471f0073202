#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry.hpp"

namespace ewkb {

namespace core {

constexpr const GeometryType Point::TYPE;
constexpr const GeometryType LineString::TYPE;
constexpr const GeometryType Polygon::TYPE;
constexpr const GeometryType MultiPoint::TYPE;
constexpr const GeometryType MultiPoint::PART_TYPE;
constexpr const GeometryType MultiLineString::TYPE;
constexpr const GeometryType MultiLineString::PART_TYPE;
constexpr const GeometryType MultiPolygon::TYPE;
constexpr const GeometryType MultiPolygon::PART_TYPE;
constexpr const GeometryType GeometryCollection::TYPE;

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
Geometry Geometry::Create(GeometryType type, uint32_t count, bool has_z) {
	Geometry geom(type, has_z);
	if (GeometryTypes::IsSinglePart(type)) {
		geom.ordinates.resize(static_cast<idx_t>(count) * geom.properties.Dimensions(), 0.0);
	} else {
		geom.parts.resize(count);
	}
	return geom;
}

bool Geometry::operator==(const Geometry &other) const {
	if (type != other.type || properties != other.properties || srid != other.srid) {
		return false;
	}
	if (ordinates.size() != other.ordinates.size() || parts.size() != other.parts.size()) {
		return false;
	}
	for (idx_t i = 0; i < ordinates.size(); i++) {
		if (ordinates[i] != other.ordinates[i]) {
			return false;
		}
	}
	for (idx_t i = 0; i < parts.size(); i++) {
		if (parts[i] != other.parts[i]) {
			return false;
		}
	}
	return true;
}

string Geometry::ToString() const {
	auto result = GeometryTypes::ToString(type);
	if (HasZ()) {
		result += " Z";
	}
	auto count = Count();
	if (IsSinglePart()) {
		result += StringUtil::Format(" (%d %s", count, count == 1 ? "vertex" : "vertices");
	} else {
		result += StringUtil::Format(" (%d %s", count, count == 1 ? "part" : "parts");
	}
	if (srid != 0) {
		result += StringUtil::Format(", srid %d", static_cast<int64_t>(srid));
	}
	result += ")";
	return result;
}

uint32_t Geometry::VertexCount(const Geometry &geom) {
	struct op {
		static uint32_t Case(Geometry::Tags::SinglePartGeometry, const Geometry &geom) {
			return SinglePartGeometry::VertexCount(geom);
		}
		static uint32_t Case(Geometry::Tags::MultiPartGeometry, const Geometry &geom) {
			uint32_t count = 0;
			for (const auto &part : MultiPartGeometry::Parts(geom)) {
				count += Geometry::Match<op>(part);
			}
			return count;
		}
	};
	return Geometry::Match<op>(geom);
}

//------------------------------------------------------------------------------
// CollectionGeometry
//------------------------------------------------------------------------------
Geometry CollectionGeometry::Create(GeometryType type, GeometryType part_type, uint32_t count, bool has_z) {
	D_ASSERT(GeometryTypes::IsMultiPart(type));
	Geometry collection(type, has_z);
	// Points always hold a single vertex, everything else starts out empty
	auto part_count = part_type == GeometryType::POINT ? 1 : 0;
	collection.parts.reserve(count);
	for (uint32_t i = 0; i < count; i++) {
		collection.parts.push_back(Geometry::Create(part_type, part_count, has_z));
	}
	return collection;
}

} // namespace core

} // namespace ewkb
