#pragma once

#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry_properties.hpp"
#include "ewkb/core/geometry/geometry_type.hpp"
#include "ewkb/core/geometry/vertex.hpp"

namespace ewkb {

namespace core {

class Geometry;

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------

// An owned geometry value. Single part geometries (points, linestrings) hold packed vertex ordinates,
// multi part geometries (polygons, multi geometries, collections) hold their parts.
// The SRID belongs to the outermost value, parts carry 0.
class Geometry {
	friend struct SinglePartGeometry;
	friend struct MultiPartGeometry;
	friend struct CollectionGeometry;

private:
	GeometryType type;
	GeometryProperties properties;
	uint32_t srid;
	vector<double> ordinates;
	vector<Geometry> parts;

public:
	// By default, create an empty 2D collection
	Geometry() : type(GeometryType::GEOMETRYCOLLECTION), properties(false), srid(0) {
	}

	Geometry(GeometryType type, bool has_z) : type(type), properties(has_z), srid(0) {
	}

public:
	GeometryType GetType() const {
		return type;
	}
	const GeometryProperties &GetProperties() const {
		return properties;
	}
	bool HasZ() const {
		return properties.HasZ();
	}
	uint32_t GetSRID() const {
		return srid;
	}
	void SetSRID(uint32_t srid_p) {
		srid = srid_p;
	}

	// Number of vertices for single part geometries, number of parts otherwise
	uint32_t Count() const {
		return IsSinglePart() ? static_cast<uint32_t>(ordinates.size() / properties.Dimensions())
		                      : static_cast<uint32_t>(parts.size());
	}

	bool IsCollection() const {
		return GeometryTypes::IsCollection(type);
	}
	bool IsMultiPart() const {
		return GeometryTypes::IsMultiPart(type);
	}
	bool IsSinglePart() const {
		return GeometryTypes::IsSinglePart(type);
	}

	// Structural comparison: type, dimensionality, SRID, every ordinate and every part
	bool operator==(const Geometry &other) const;
	bool operator!=(const Geometry &other) const {
		return !(*this == other);
	}

	// Short structural description, e.g. "MULTIPOINT Z (2 parts, srid 4326)"
	string ToString() const;

public:
	// Used for tag dispatching
	struct Tags {
		// Base types
		struct AnyGeometry {};
		struct SinglePartGeometry : public AnyGeometry {};
		struct MultiPartGeometry : public AnyGeometry {};
		struct CollectionGeometry : public MultiPartGeometry {};
		// Concrete types
		struct Point : public SinglePartGeometry {};
		struct LineString : public SinglePartGeometry {};
		struct Polygon : public MultiPartGeometry {};
		struct MultiPoint : public CollectionGeometry {};
		struct MultiLineString : public CollectionGeometry {};
		struct MultiPolygon : public CollectionGeometry {};
		struct GeometryCollection : public CollectionGeometry {};
	};

	template <class T, class... ARGS>
	static auto Match(Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<Geometry &>(), std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::GEOMETRYCOLLECTION:
			return T::Case(Tags::GeometryCollection {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}

	template <class T, class... ARGS>
	static auto Match(const Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<const Geometry &>(),
	                        std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::GEOMETRYCOLLECTION:
			return T::Case(Tags::GeometryCollection {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}

	static Geometry Create(GeometryType type, uint32_t count, bool has_z);

	// Total number of vertices, recursing into parts
	static uint32_t VertexCount(const Geometry &geom);
};

//------------------------------------------------------------------------------
// Accessors
//------------------------------------------------------------------------------

//------------------------------------------------------------------------------
// SinglePartGeometry
//------------------------------------------------------------------------------
struct SinglePartGeometry {

	static uint32_t VertexCount(const Geometry &geom);

	// Ordinates of a vertex, regardless of the vertex type
	static double GetOrdinate(const Geometry &geom, uint32_t index, uint32_t ordinate);

	// The x and y of a vertex, regardless of the vertex type
	static VertexXY GetVertex(const Geometry &geom, uint32_t index);

	template <class V>
	static V GetVertex(const Geometry &geom, uint32_t index);

	template <class V>
	static void SetVertex(Geometry &geom, uint32_t index, const V &vertex);

	// Resize the geometry, truncating or extending with zeroed vertices as needed
	static void Resize(Geometry &geom, uint32_t new_count);

	// Number of bytes the vertices take up on the wire
	static idx_t ByteSize(const Geometry &geom);
};

inline uint32_t SinglePartGeometry::VertexCount(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	return geom.Count();
}

inline double SinglePartGeometry::GetOrdinate(const Geometry &geom, uint32_t index, uint32_t ordinate) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(ordinate < geom.properties.Dimensions());
	return geom.ordinates[index * geom.properties.Dimensions() + ordinate];
}

inline VertexXY SinglePartGeometry::GetVertex(const Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(index < geom.Count());
	auto offset = index * geom.properties.Dimensions();
	return VertexXY {geom.ordinates[offset], geom.ordinates[offset + 1]};
}

template <class V>
inline V SinglePartGeometry::GetVertex(const Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(V::HAS_Z == geom.HasZ());
	D_ASSERT(index < geom.Count());
	V vertex;
	for (idx_t i = 0; i < V::SIZE; i++) {
		vertex[i] = geom.ordinates[index * V::SIZE + i];
	}
	return vertex;
}

template <class V>
inline void SinglePartGeometry::SetVertex(Geometry &geom, uint32_t index, const V &vertex) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(V::HAS_Z == geom.HasZ());
	D_ASSERT(index < geom.Count());
	for (idx_t i = 0; i < V::SIZE; i++) {
		geom.ordinates[index * V::SIZE + i] = vertex[i];
	}
}

inline void SinglePartGeometry::Resize(Geometry &geom, uint32_t new_count) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	geom.ordinates.resize(static_cast<idx_t>(new_count) * geom.properties.Dimensions(), 0.0);
}

inline idx_t SinglePartGeometry::ByteSize(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	return static_cast<idx_t>(geom.Count()) * geom.properties.VertexSize();
}

//------------------------------------------------------------------------------
// MultiPartGeometry
//------------------------------------------------------------------------------
struct MultiPartGeometry {
	static uint32_t PartCount(const Geometry &geom);
	static Geometry &Part(Geometry &geom, uint32_t index);
	static const Geometry &Part(const Geometry &geom, uint32_t index);
	static vector<Geometry> &Parts(Geometry &geom);
	static const vector<Geometry> &Parts(const Geometry &geom);
};

inline uint32_t MultiPartGeometry::PartCount(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return static_cast<uint32_t>(geom.parts.size());
}

inline Geometry &MultiPartGeometry::Part(Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return geom.parts[index];
}

inline const Geometry &MultiPartGeometry::Part(const Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return geom.parts[index];
}

inline vector<Geometry> &MultiPartGeometry::Parts(Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return geom.parts;
}

inline const vector<Geometry> &MultiPartGeometry::Parts(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return geom.parts;
}

//------------------------------------------------------------------------------
// CollectionGeometry
//------------------------------------------------------------------------------
struct CollectionGeometry : public MultiPartGeometry {
protected:
	static Geometry Create(GeometryType type, vector<Geometry> &items, bool has_z) {
		D_ASSERT(GeometryTypes::IsMultiPart(type));
		Geometry collection(type, has_z);
		collection.parts.reserve(items.size());
		for (auto &item : items) {
			collection.parts.push_back(std::move(item));
		}
		items.clear();
		return collection;
	}

	static Geometry Create(GeometryType type, GeometryType part_type, uint32_t count, bool has_z);
};

//------------------------------------------------------------------------------
// Point
//------------------------------------------------------------------------------
struct Point : public SinglePartGeometry {
	// A point always holds exactly one vertex, zeroed until set
	static Geometry Create(bool has_z);

	template <class V>
	static Geometry CreateFromVertex(const V &vertex);

	// Methods
	template <class V = VertexXY>
	static V GetVertex(const Geometry &geom);

	template <class V = VertexXY>
	static void SetVertex(Geometry &geom, const V &vertex);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POINT;
};

inline Geometry Point::Create(bool has_z) {
	return Geometry::Create(TYPE, 1, has_z);
}

template <class V>
inline Geometry Point::CreateFromVertex(const V &vertex) {
	auto point = Create(V::HAS_Z);
	Point::SetVertex(point, vertex);
	return point;
}

template <class V>
inline V Point::GetVertex(const Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	D_ASSERT(geom.Count() == 1);
	return SinglePartGeometry::GetVertex<V>(geom, 0);
}

template <class V>
void Point::SetVertex(Geometry &geom, const V &vertex) {
	D_ASSERT(geom.GetType() == TYPE);
	D_ASSERT(geom.Count() == 1);
	SinglePartGeometry::SetVertex(geom, 0, vertex);
}

//------------------------------------------------------------------------------
// LineString
//------------------------------------------------------------------------------
struct LineString : public SinglePartGeometry {
	static Geometry Create(uint32_t count, bool has_z);

	template <class V>
	static Geometry CreateFromVertices(const vector<V> &vertices);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::LINESTRING;
};

inline Geometry LineString::Create(uint32_t count, bool has_z) {
	return Geometry::Create(TYPE, count, has_z);
}

template <class V>
inline Geometry LineString::CreateFromVertices(const vector<V> &vertices) {
	auto line = Create(static_cast<uint32_t>(vertices.size()), V::HAS_Z);
	for (uint32_t i = 0; i < vertices.size(); i++) {
		SinglePartGeometry::SetVertex(line, i, vertices[i]);
	}
	return line;
}

//------------------------------------------------------------------------------
// Polygon
//------------------------------------------------------------------------------
struct Polygon : public CollectionGeometry {
	// Create a polygon with "count" empty rings
	static Geometry Create(uint32_t count, bool has_z);
	// Create a polygon from linestring rings, consuming them
	static Geometry Create(vector<Geometry> &rings, bool has_z);

	// Methods
	static const Geometry &ExteriorRing(const Geometry &geom);
	static Geometry &ExteriorRing(Geometry &geom);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POLYGON;
};

inline Geometry Polygon::Create(uint32_t count, bool has_z) {
	return CollectionGeometry::Create(TYPE, GeometryType::LINESTRING, count, has_z);
}

inline Geometry Polygon::Create(vector<Geometry> &rings, bool has_z) {
	return CollectionGeometry::Create(TYPE, rings, has_z);
}

inline Geometry &Polygon::ExteriorRing(Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	D_ASSERT(Polygon::PartCount(geom) > 0);
	return Polygon::Part(geom, 0);
}

inline const Geometry &Polygon::ExteriorRing(const Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	D_ASSERT(Polygon::PartCount(geom) > 0);
	return Polygon::Part(geom, 0);
}

//------------------------------------------------------------------------------
// MultiPoint
//------------------------------------------------------------------------------
struct MultiPoint : public CollectionGeometry {
	static Geometry Create(uint32_t count, bool has_z);
	static Geometry Create(vector<Geometry> &items, bool has_z);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOINT;
	static const constexpr GeometryType PART_TYPE = GeometryType::POINT;
};

inline Geometry MultiPoint::Create(uint32_t count, bool has_z) {
	return CollectionGeometry::Create(TYPE, PART_TYPE, count, has_z);
}

inline Geometry MultiPoint::Create(vector<Geometry> &items, bool has_z) {
	return CollectionGeometry::Create(TYPE, items, has_z);
}

//------------------------------------------------------------------------------
// MultiLineString
//------------------------------------------------------------------------------
struct MultiLineString : public CollectionGeometry {
	static Geometry Create(uint32_t count, bool has_z);
	static Geometry Create(vector<Geometry> &items, bool has_z);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTILINESTRING;
	static const constexpr GeometryType PART_TYPE = GeometryType::LINESTRING;
};

inline Geometry MultiLineString::Create(uint32_t count, bool has_z) {
	return CollectionGeometry::Create(TYPE, PART_TYPE, count, has_z);
}

inline Geometry MultiLineString::Create(vector<Geometry> &items, bool has_z) {
	return CollectionGeometry::Create(TYPE, items, has_z);
}

//------------------------------------------------------------------------------
// MultiPolygon
//------------------------------------------------------------------------------
struct MultiPolygon : public CollectionGeometry {
	static Geometry Create(uint32_t count, bool has_z);
	static Geometry Create(vector<Geometry> &items, bool has_z);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOLYGON;
	static const constexpr GeometryType PART_TYPE = GeometryType::POLYGON;
};

inline Geometry MultiPolygon::Create(uint32_t count, bool has_z) {
	return CollectionGeometry::Create(TYPE, PART_TYPE, count, has_z);
}

inline Geometry MultiPolygon::Create(vector<Geometry> &items, bool has_z) {
	return CollectionGeometry::Create(TYPE, items, has_z);
}

//------------------------------------------------------------------------------
// GeometryCollection
//------------------------------------------------------------------------------
struct GeometryCollection : public CollectionGeometry {
	static Geometry Create(uint32_t count, bool has_z);
	static Geometry Create(vector<Geometry> &items, bool has_z);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::GEOMETRYCOLLECTION;
};

inline Geometry GeometryCollection::Create(uint32_t count, bool has_z) {
	return CollectionGeometry::Create(TYPE, TYPE, count, has_z);
}

inline Geometry GeometryCollection::Create(vector<Geometry> &items, bool has_z) {
	return CollectionGeometry::Create(TYPE, items, has_z);
}

} // namespace core

} // namespace ewkb
