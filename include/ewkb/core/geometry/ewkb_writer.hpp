#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry.hpp"
#include "ewkb/core/io/write_buffer.hpp"
#include "ewkb/core/options.hpp"

namespace ewkb {

namespace core {

// Encodes geometries as big-endian EWKB. Only the outermost value carries an SRID.
class EWKBWriter {
private:
	CodecOptions options;

public:
	explicit EWKBWriter(const CodecOptions &options = CodecOptions()) : options(options) {
	}

	// The exact number of bytes Write() emits for this geometry
	static idx_t GetRequiredSize(const Geometry &geometry);

	// Write a geometry into a buffer, flushing whenever the next field does not fit
	void Write(const Geometry &geometry, WriteBuffer &buffer) const;

	// Write a geometry to an EWKB blob in a byte vector
	void Write(const Geometry &geometry, vector<data_t> &result) const;
};

} // namespace core

} // namespace ewkb
