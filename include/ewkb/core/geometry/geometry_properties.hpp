#pragma once
#include "ewkb/common.hpp"

namespace ewkb {

namespace core {

struct GeometryProperties {
private:
	static constexpr const uint8_t Z = 0x01;
	uint8_t flags = 0;

public:
	explicit GeometryProperties(bool has_z = false) {
		SetZ(has_z);
	}

	inline bool HasZ() const {
		return (flags & Z) != 0;
	}
	inline void SetZ(bool value) {
		flags = value ? (flags | Z) : (flags & ~Z);
	}

	// Ordinates per vertex in memory and on the wire
	uint32_t Dimensions() const {
		return 2 + HasZ();
	}

	uint32_t VertexSize() const {
		return sizeof(double) * Dimensions();
	}

	bool operator==(const GeometryProperties &other) const {
		return flags == other.flags;
	}
	bool operator!=(const GeometryProperties &other) const {
		return flags != other.flags;
	}
};

} // namespace core

} // namespace ewkb
