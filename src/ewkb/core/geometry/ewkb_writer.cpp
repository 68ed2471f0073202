#include "ewkb/common.hpp"
#include "ewkb/core/geometry/ewkb_header.hpp"
#include "ewkb/core/geometry/ewkb_writer.hpp"
#include "ewkb/core/geometry/geometry.hpp"
#include "ewkb/core/util/log.hpp"

#include "duckdb/common/serializer/memory_stream.hpp"

namespace ewkb {

namespace core {

static void CheckPartType(const Geometry &geom, const Geometry &part, GeometryType expected) {
	if (part.GetType() != expected) {
		throw InvalidInputException("EWKB Writer: %s parts must be %s, got %s", GeometryTypes::ToString(geom.GetType()),
		                            GeometryTypes::ToString(expected), GeometryTypes::ToString(part.GetType()));
	}
}

static void CheckPointVertexCount(const Geometry &geom) {
	if (geom.Count() != 1) {
		throw InvalidInputException("EWKB Writer: a POINT must hold exactly one vertex, got %d",
		                            static_cast<int64_t>(geom.Count()));
	}
}

//------------------------------------------------------------------------------
// Size Calculator
//------------------------------------------------------------------------------
// Size of a shape body, excluding its own header
struct EWKBBodySize {
	static idx_t Case(Geometry::Tags::Point, const Geometry &geom) {
		CheckPointVertexCount(geom);
		// <x> + <y> (+ <z>)
		return SinglePartGeometry::ByteSize(geom);
	}

	static idx_t Case(Geometry::Tags::LineString, const Geometry &geom) {
		// <count> + <points>
		return sizeof(uint32_t) + SinglePartGeometry::ByteSize(geom);
	}

	static idx_t Case(Geometry::Tags::Polygon, const Geometry &geom) {
		// <ring_count> + <rings>
		idx_t size = sizeof(uint32_t);
		for (const auto &ring : Polygon::Parts(geom)) {
			CheckPartType(geom, ring, GeometryType::LINESTRING);
			// <count> + <points>
			size += sizeof(uint32_t) + SinglePartGeometry::ByteSize(ring);
		}
		return size;
	}

	static idx_t Parts(const Geometry &geom, GeometryType part_type) {
		// <geometry_count>
		idx_t size = sizeof(uint32_t);
		for (const auto &part : CollectionGeometry::Parts(geom)) {
			CheckPartType(geom, part, part_type);
			// + <mini header> + <geometry>
			size += EWKBHeader::MINI_SIZE + Geometry::Match<EWKBBodySize>(part);
		}
		return size;
	}

	static idx_t Case(Geometry::Tags::MultiPoint, const Geometry &geom) {
		return Parts(geom, MultiPoint::PART_TYPE);
	}

	static idx_t Case(Geometry::Tags::MultiLineString, const Geometry &geom) {
		return Parts(geom, MultiLineString::PART_TYPE);
	}

	static idx_t Case(Geometry::Tags::MultiPolygon, const Geometry &geom) {
		return Parts(geom, MultiPolygon::PART_TYPE);
	}

	static idx_t Case(Geometry::Tags::GeometryCollection, const Geometry &geom) {
		idx_t size = sizeof(uint32_t);
		for (const auto &part : GeometryCollection::Parts(geom)) {
			size += EWKBHeader::MINI_SIZE + Geometry::Match<EWKBBodySize>(part);
		}
		return size;
	}
};

//------------------------------------------------------------------------------
// Serializer
//------------------------------------------------------------------------------
struct EWKBBodySerializer {
	static void WriteCount(WriteBuffer &buffer, uint32_t count) {
		if (buffer.WriteSpaceLeft() < sizeof(uint32_t)) {
			buffer.Flush();
		}
		buffer.WriteUInt32(count);
	}

	static void WriteVertices(const Geometry &geom, WriteBuffer &buffer) {
		auto dims = geom.GetProperties().Dimensions();
		auto vertex_size = geom.GetProperties().VertexSize();
		for (uint32_t i = 0; i < geom.Count(); i++) {
			if (buffer.WriteSpaceLeft() < vertex_size) {
				buffer.Flush();
			}
			for (uint32_t j = 0; j < dims; j++) {
				buffer.WriteDouble(SinglePartGeometry::GetOrdinate(geom, i, j));
			}
		}
	}

	static void Case(Geometry::Tags::Point, const Geometry &geom, WriteBuffer &buffer) {
		CheckPointVertexCount(geom);
		WriteVertices(geom, buffer);
	}

	static void Case(Geometry::Tags::LineString, const Geometry &geom, WriteBuffer &buffer) {
		WriteCount(buffer, geom.Count());
		WriteVertices(geom, buffer);
	}

	static void Case(Geometry::Tags::Polygon, const Geometry &geom, WriteBuffer &buffer) {
		WriteCount(buffer, Polygon::PartCount(geom));
		for (const auto &ring : Polygon::Parts(geom)) {
			CheckPartType(geom, ring, GeometryType::LINESTRING);
			WriteCount(buffer, ring.Count());
			WriteVertices(ring, buffer);
		}
	}

	static void Parts(const Geometry &geom, GeometryType part_type, WriteBuffer &buffer) {
		WriteCount(buffer, CollectionGeometry::PartCount(geom));
		for (const auto &part : CollectionGeometry::Parts(geom)) {
			CheckPartType(geom, part, part_type);
			// Nested elements never carry an SRID
			EWKBHeader::Encode(buffer, part_type, part.HasZ(), 0);
			Geometry::Match<EWKBBodySerializer>(part, buffer);
		}
	}

	static void Case(Geometry::Tags::MultiPoint, const Geometry &geom, WriteBuffer &buffer) {
		Parts(geom, MultiPoint::PART_TYPE, buffer);
	}

	static void Case(Geometry::Tags::MultiLineString, const Geometry &geom, WriteBuffer &buffer) {
		Parts(geom, MultiLineString::PART_TYPE, buffer);
	}

	static void Case(Geometry::Tags::MultiPolygon, const Geometry &geom, WriteBuffer &buffer) {
		Parts(geom, MultiPolygon::PART_TYPE, buffer);
	}

	static void Case(Geometry::Tags::GeometryCollection, const Geometry &geom, WriteBuffer &buffer) {
		WriteCount(buffer, GeometryCollection::PartCount(geom));
		for (const auto &part : GeometryCollection::Parts(geom)) {
			EWKBHeader::Encode(buffer, part.GetType(), part.HasZ(), 0);
			Geometry::Match<EWKBBodySerializer>(part, buffer);
		}
	}
};

//------------------------------------------------------------------------------
// EWKBWriter
//------------------------------------------------------------------------------
idx_t EWKBWriter::GetRequiredSize(const Geometry &geometry) {
	return EWKBHeader::EncodedSize(geometry.GetSRID()) + Geometry::Match<EWKBBodySize>(geometry);
}

void EWKBWriter::Write(const Geometry &geometry, WriteBuffer &buffer) const {
	auto start = buffer.Position();
	EWKBHeader::Encode(buffer, geometry.GetType(), geometry.HasZ(), geometry.GetSRID());
	Geometry::Match<EWKBBodySerializer>(geometry, buffer);

	if (Log::IsEnabled(options, LogLevel::TRACE)) {
		Log::Write(options, LogLevel::TRACE, "EWKB: encoded %s into %d bytes", geometry.ToString(),
		           static_cast<int64_t>(buffer.Position() - start));
	}
}

void EWKBWriter::Write(const Geometry &geometry, vector<data_t> &result) const {
	duckdb::MemoryStream stream;
	WriteBuffer buffer(stream, MaxValue<idx_t>(options.write_buffer_size, WriteBuffer::MINIMUM_SIZE));
	Write(geometry, buffer);
	buffer.Flush();
	result.assign(stream.GetData(), stream.GetData() + stream.GetPosition());
}

} // namespace core

} // namespace ewkb
