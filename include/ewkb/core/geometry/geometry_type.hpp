#pragma once
#include "ewkb/common.hpp"

namespace ewkb {

namespace core {

enum class GeometryType : uint8_t {
	POINT = 0,
	LINESTRING,
	POLYGON,
	MULTIPOINT,
	MULTILINESTRING,
	MULTIPOLYGON,
	GEOMETRYCOLLECTION
};

struct GeometryTypes {
	static bool IsSinglePart(GeometryType type) {
		return type == GeometryType::POINT || type == GeometryType::LINESTRING;
	}

	static bool IsMultiPart(GeometryType type) {
		return type == GeometryType::POLYGON || type == GeometryType::MULTIPOINT ||
		       type == GeometryType::MULTILINESTRING || type == GeometryType::MULTIPOLYGON ||
		       type == GeometryType::GEOMETRYCOLLECTION;
	}

	static bool IsCollection(GeometryType type) {
		return type == GeometryType::MULTIPOINT || type == GeometryType::MULTILINESTRING ||
		       type == GeometryType::MULTIPOLYGON || type == GeometryType::GEOMETRYCOLLECTION;
	}

	// The shape code written in the low bits of an EWKB type word (1-indexed)
	static uint32_t ToShapeCode(GeometryType type) {
		return static_cast<uint32_t>(type) + 1;
	}

	static string ToString(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return "POINT";
		case GeometryType::LINESTRING:
			return "LINESTRING";
		case GeometryType::POLYGON:
			return "POLYGON";
		case GeometryType::MULTIPOINT:
			return "MULTIPOINT";
		case GeometryType::MULTILINESTRING:
			return "MULTILINESTRING";
		case GeometryType::MULTIPOLYGON:
			return "MULTIPOLYGON";
		case GeometryType::GEOMETRYCOLLECTION:
			return "GEOMETRYCOLLECTION";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
		}
	}
};

// Bits of the EWKB type word
struct EWKBFlags {
	static constexpr const uint32_t HAS_Z = 0x80000000;
	static constexpr const uint32_t HAS_M = 0x40000000;
	static constexpr const uint32_t HAS_SRID = 0x20000000;
	static constexpr const uint32_t SHAPE_MASK = 0x00000007;
};

// The byte order selector that starts every (mini-)header
enum class ByteOrder : uint8_t {
	XDR = 0, // big endian
	NDR = 1  // little endian
};

} // namespace core

} // namespace ewkb
