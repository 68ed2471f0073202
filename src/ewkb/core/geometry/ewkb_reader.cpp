#include "ewkb/common.hpp"
#include "ewkb/core/geometry/ewkb_reader.hpp"
#include "ewkb/core/geometry/geometry.hpp"
#include "ewkb/core/util/log.hpp"

#include "duckdb/common/serializer/memory_stream.hpp"

namespace ewkb {

namespace core {

constexpr const idx_t EWKBReader::MAX_NESTING_DEPTH;

uint32_t EWKBReader::ReadCount(ReadBuffer &buffer, ByteOrder order, idx_t min_element_size) const {
	buffer.Ensure(sizeof(uint32_t));
	auto count = buffer.ReadUInt32(order);
	// Reject counts the remaining bytes cannot possibly hold before allocating for them
	if (min_element_size > 0 && count > buffer.Remaining() / min_element_size) {
		throw SerializationException("EWKB: count %d exceeds the %d bytes left in the value",
		                             static_cast<int64_t>(count), static_cast<int64_t>(buffer.Remaining()));
	}
	return count;
}

void EWKBReader::ReadVertices(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root, Geometry &geometry) const {
	auto vertex_size = root.WireOrdinates() * sizeof(double);
	for (uint32_t i = 0; i < geometry.Count(); i++) {
		buffer.Ensure(vertex_size);
		auto x = buffer.ReadDouble(order);
		auto y = buffer.ReadDouble(order);
		if (root.IsXYZ()) {
			// Z or M, both land in the Z slot
			auto z = buffer.ReadDouble(order);
			SinglePartGeometry::SetVertex(geometry, i, VertexXYZ {x, y, z});
		} else {
			SinglePartGeometry::SetVertex(geometry, i, VertexXY {x, y});
		}
	}
}

EWKBHeader EWKBReader::ReadNestedHeader(ReadBuffer &buffer, const EWKBHeader &root) const {
	auto header = EWKBHeader::DecodeNested(buffer);
	if (header.IsXYZ() != root.IsXYZ() && Log::IsEnabled(options, LogLevel::WARNING)) {
		Log::Write(options, LogLevel::WARNING,
		           "EWKB: nested %s at offset %d declares %s coordinates, decoding it as %s like the enclosing value",
		           GeometryTypes::ToString(header.type), static_cast<int64_t>(buffer.Position()),
		           header.IsXYZ() ? "XYZ" : "XY", root.IsXYZ() ? "XYZ" : "XY");
	}
	return header;
}

Geometry EWKBReader::ReadPoint(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto point = Point::Create(root.IsXYZ());
	ReadVertices(buffer, order, root, point);
	return point;
}

Geometry EWKBReader::ReadLineString(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto count = ReadCount(buffer, order, root.WireOrdinates() * sizeof(double));
	auto line = LineString::Create(count, root.IsXYZ());
	ReadVertices(buffer, order, root, line);
	return line;
}

Geometry EWKBReader::ReadPolygon(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto ring_count = ReadCount(buffer, order, sizeof(uint32_t));
	auto polygon = Polygon::Create(ring_count, root.IsXYZ());
	for (uint32_t i = 0; i < ring_count; i++) {
		Polygon::Part(polygon, i) = ReadLineString(buffer, order, root);
	}
	return polygon;
}

Geometry EWKBReader::ReadMultiPoint(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto count = ReadCount(buffer, order, EWKBHeader::MINI_SIZE);
	auto multi_point = MultiPoint::Create(count, root.IsXYZ());
	for (uint32_t i = 0; i < count; i++) {
		auto point_header = ReadNestedHeader(buffer, root);
		MultiPoint::Part(multi_point, i) = ReadPoint(buffer, point_header.order, root);
	}
	return multi_point;
}

Geometry EWKBReader::ReadMultiLineString(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto count = ReadCount(buffer, order, EWKBHeader::MINI_SIZE);
	auto multi_line_string = MultiLineString::Create(count, root.IsXYZ());
	for (uint32_t i = 0; i < count; i++) {
		auto line_header = ReadNestedHeader(buffer, root);
		MultiLineString::Part(multi_line_string, i) = ReadLineString(buffer, line_header.order, root);
	}
	return multi_line_string;
}

Geometry EWKBReader::ReadMultiPolygon(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const {
	auto count = ReadCount(buffer, order, EWKBHeader::MINI_SIZE);
	auto multi_polygon = MultiPolygon::Create(count, root.IsXYZ());
	for (uint32_t i = 0; i < count; i++) {
		auto polygon_header = ReadNestedHeader(buffer, root);
		MultiPolygon::Part(multi_polygon, i) = ReadPolygon(buffer, polygon_header.order, root);
	}
	return multi_polygon;
}

Geometry EWKBReader::ReadGeometryCollection(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root,
                                            idx_t depth) const {
	auto count = ReadCount(buffer, order, EWKBHeader::MINI_SIZE);
	if (count > 0 && depth >= MAX_NESTING_DEPTH) {
		throw InvalidInputException("EWKB: geometry collections nested deeper than %d levels at offset %d",
		                            static_cast<int64_t>(MAX_NESTING_DEPTH), static_cast<int64_t>(buffer.Position()));
	}
	auto geometry_collection = GeometryCollection::Create(count, root.IsXYZ());
	for (uint32_t i = 0; i < count; i++) {
		auto item_header = ReadNestedHeader(buffer, root);
		GeometryCollection::Part(geometry_collection, i) =
		    ReadBody(buffer, item_header.type, item_header.order, root, depth + 1);
	}
	return geometry_collection;
}

Geometry EWKBReader::ReadBody(ReadBuffer &buffer, GeometryType type, ByteOrder order, const EWKBHeader &root,
                              idx_t depth) const {
	switch (type) {
	case GeometryType::POINT:
		return ReadPoint(buffer, order, root);
	case GeometryType::LINESTRING:
		return ReadLineString(buffer, order, root);
	case GeometryType::POLYGON:
		return ReadPolygon(buffer, order, root);
	case GeometryType::MULTIPOINT:
		return ReadMultiPoint(buffer, order, root);
	case GeometryType::MULTILINESTRING:
		return ReadMultiLineString(buffer, order, root);
	case GeometryType::MULTIPOLYGON:
		return ReadMultiPolygon(buffer, order, root);
	case GeometryType::GEOMETRYCOLLECTION:
		return ReadGeometryCollection(buffer, order, root, depth);
	default:
		throw NotImplementedException("EWKB Reader: Geometry type %d not supported", static_cast<int>(type));
	}
}

Geometry EWKBReader::Read(ReadBuffer &buffer) const {
	auto start = buffer.Position();
	auto header = EWKBHeader::Decode(buffer);
	auto geom = ReadBody(buffer, header.type, header.order, header, 0);
	geom.SetSRID(header.srid);

	if (Log::IsEnabled(options, LogLevel::TRACE)) {
		Log::Write(options, LogLevel::TRACE, "EWKB: decoded %s from %d bytes", geom.ToString(),
		           static_cast<int64_t>(buffer.Position() - start));
	}
	return geom;
}

Geometry EWKBReader::Deserialize(const_data_ptr_t data, idx_t size) const {
	duckdb::MemoryStream stream(const_cast<data_ptr_t>(data), size);
	ReadBuffer buffer(stream, size, MaxValue<idx_t>(options.read_buffer_size, ReadBuffer::MINIMUM_SIZE));
	auto geom = Read(buffer);
	if (buffer.Remaining() != 0) {
		throw InvalidInputException("EWKB: %d trailing bytes after a %d byte value",
		                            static_cast<int64_t>(buffer.Remaining()), static_cast<int64_t>(buffer.Position()));
	}
	return geom;
}

} // namespace core

} // namespace ewkb
