#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry.hpp"
#include "ewkb/core/geometry/ewkb_header.hpp"
#include "ewkb/core/io/read_buffer.hpp"
#include "ewkb/core/options.hpp"

namespace ewkb {

namespace core {

// Decodes EWKB values. Every element of the value is decoded with the dimensionality of the top level header,
// nested mini-headers only contribute their byte order and shape code.
class EWKBReader {
public:
	// GeometryCollections nested deeper than this below the root are rejected
	static constexpr const idx_t MAX_NESTING_DEPTH = 256;

private:
	CodecOptions options;

	// Primitives
	uint32_t ReadCount(ReadBuffer &buffer, ByteOrder order, idx_t min_element_size) const;
	void ReadVertices(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root, Geometry &geometry) const;
	EWKBHeader ReadNestedHeader(ReadBuffer &buffer, const EWKBHeader &root) const;

	// Geometries
	Geometry ReadPoint(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadLineString(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadPolygon(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadMultiPoint(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadMultiLineString(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadMultiPolygon(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root) const;
	Geometry ReadGeometryCollection(ReadBuffer &buffer, ByteOrder order, const EWKBHeader &root, idx_t depth) const;
	Geometry ReadBody(ReadBuffer &buffer, GeometryType type, ByteOrder order, const EWKBHeader &root,
	                  idx_t depth) const;

public:
	explicit EWKBReader(const CodecOptions &options = CodecOptions()) : options(options) {
	}

	// Decode one value from the buffer
	Geometry Read(ReadBuffer &buffer) const;

	// Decode one value that is fully resident in memory. Trailing bytes are an error.
	Geometry Deserialize(const_data_ptr_t data, idx_t size) const;
};

} // namespace core

} // namespace ewkb
