#include "ewkb/common.hpp"
#include "ewkb/core/errors.hpp"
#include "ewkb/core/geometry/ewkb_header.hpp"

namespace ewkb {

namespace core {

constexpr const uint32_t EWKBFlags::HAS_Z;
constexpr const uint32_t EWKBFlags::HAS_M;
constexpr const uint32_t EWKBFlags::HAS_SRID;
constexpr const uint32_t EWKBFlags::SHAPE_MASK;
constexpr const idx_t EWKBHeader::MINI_SIZE;
constexpr const idx_t EWKBHeader::MAX_SIZE;

static ByteOrder ReadByteOrder(ReadBuffer &buffer) {
	// Anything but 0 is treated as little endian
	return buffer.ReadByte() == 0 ? ByteOrder::XDR : ByteOrder::NDR;
}

GeometryType EWKBHeader::ParseShapeCode(uint32_t type_word) {
	auto shape_code = type_word & EWKBFlags::SHAPE_MASK;
	if (shape_code < 1 || shape_code > 7) {
		throw UnrecognizedShapeCodeException(type_word);
	}
	// Subtract 1 since the shape code is 1-indexed
	return static_cast<GeometryType>(shape_code - 1);
}

uint32_t EWKBHeader::MakeTypeWord(GeometryType type, bool has_z, uint32_t srid) {
	auto type_word = GeometryTypes::ToShapeCode(type);
	if (type_word > 7) {
		throw UnrecognizedShapeCodeException(type_word);
	}
	if (has_z) {
		type_word |= EWKBFlags::HAS_Z;
	}
	if (srid != 0) {
		type_word |= EWKBFlags::HAS_SRID;
	}
	return type_word;
}

EWKBHeader EWKBHeader::Decode(ReadBuffer &buffer) {
	buffer.Ensure(MINI_SIZE);
	EWKBHeader header;
	header.order = ReadByteOrder(buffer);
	auto type_word = buffer.ReadUInt32(header.order);
	header.type = ParseShapeCode(type_word);
	header.has_z = (type_word & EWKBFlags::HAS_Z) != 0;
	header.has_m = (type_word & EWKBFlags::HAS_M) != 0;
	header.srid = 0;
	if ((type_word & EWKBFlags::HAS_SRID) != 0) {
		buffer.Ensure(sizeof(uint32_t));
		header.srid = buffer.ReadUInt32(header.order);
	}
	return header;
}

EWKBHeader EWKBHeader::DecodeNested(ReadBuffer &buffer) {
	buffer.Ensure(MINI_SIZE);
	EWKBHeader header;
	header.order = ReadByteOrder(buffer);
	auto type_word = buffer.ReadUInt32(header.order);
	header.type = ParseShapeCode(type_word);
	header.has_z = (type_word & EWKBFlags::HAS_Z) != 0;
	header.has_m = (type_word & EWKBFlags::HAS_M) != 0;
	header.srid = 0;
	return header;
}

void EWKBHeader::Encode(WriteBuffer &buffer, GeometryType type, bool has_z, uint32_t srid) {
	auto size = EncodedSize(srid);
	if (buffer.WriteSpaceLeft() < size) {
		buffer.Flush();
	}
	// Always write big endian
	buffer.WriteByte(static_cast<uint8_t>(ByteOrder::XDR));
	buffer.WriteUInt32(MakeTypeWord(type, has_z, srid));
	if (srid != 0) {
		buffer.WriteUInt32(srid);
	}
}

} // namespace core

} // namespace ewkb
