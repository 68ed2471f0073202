#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/geometry/geometry_type.hpp"
#include "ewkb/core/io/read_buffer.hpp"
#include "ewkb/core/io/write_buffer.hpp"

namespace ewkb {

namespace core {

// The prefix of every EWKB value: <byte order> <type word> [<srid>]
struct EWKBHeader {
	ByteOrder order;
	GeometryType type;
	bool has_z;
	bool has_m;
	uint32_t srid;

	// Size of a header without (MINI_SIZE) and with (MAX_SIZE) an SRID
	static constexpr const idx_t MINI_SIZE = sizeof(uint8_t) + sizeof(uint32_t);
	static constexpr const idx_t MAX_SIZE = MINI_SIZE + sizeof(uint32_t);

	// Either flag selects three ordinates per coordinate in memory
	bool IsXYZ() const {
		return has_z || has_m;
	}

	// Ordinates per coordinate on the wire, M is read into the Z slot
	uint32_t WireOrdinates() const {
		return 2 + IsXYZ();
	}

	// Read a top level header, including the SRID when flagged
	static EWKBHeader Decode(ReadBuffer &buffer);

	// Read the mini-header in front of a nested element. Only the byte order and the shape code are consumed,
	// the Z/M flags are reported but a flagged SRID is never read.
	static EWKBHeader DecodeNested(ReadBuffer &buffer);

	// Write a big-endian header, with the SRID only when it is non-zero
	static void Encode(WriteBuffer &buffer, GeometryType type, bool has_z, uint32_t srid);

	static idx_t EncodedSize(uint32_t srid) {
		return srid != 0 ? MAX_SIZE : MINI_SIZE;
	}

	// Map the low bits of a type word to a geometry type, throwing on anything outside 1..7
	static GeometryType ParseShapeCode(uint32_t type_word);

	static uint32_t MakeTypeWord(GeometryType type, bool has_z, uint32_t srid);
};

} // namespace core

} // namespace ewkb
