// =============================================================================
// EWKB Header Codec Tests
// =============================================================================

#include "test_helpers.hpp"
#include "ewkb/core/errors.hpp"
#include "ewkb/core/geometry/ewkb_header.hpp"

using namespace ewkb;
using namespace ewkb::core;
using namespace ewkb::test;

class EWKBHeaderTest : public ::testing::Test {
protected:
	static EWKBHeader DecodeHeader(const vector<data_t> &bytes, bool nested = false) {
		duckdb::MemoryStream stream(const_cast<data_ptr_t>(bytes.data()), bytes.size());
		ReadBuffer buffer(stream, bytes.size(), ReadBuffer::MINIMUM_SIZE);
		return nested ? EWKBHeader::DecodeNested(buffer) : EWKBHeader::Decode(buffer);
	}

	static vector<data_t> EncodeHeader(GeometryType type, bool has_z, uint32_t srid) {
		duckdb::MemoryStream stream;
		WriteBuffer buffer(stream, WriteBuffer::MINIMUM_SIZE);
		EWKBHeader::Encode(buffer, type, has_z, srid);
		buffer.Flush();
		return vector<data_t>(stream.GetData(), stream.GetData() + stream.GetPosition());
	}
};

TEST_F(EWKBHeaderTest, DecodesBigEndianPlainHeader) {
	auto header = DecodeHeader(ByteBuilder().Byte(0).UInt32(3, ByteOrder::XDR).Bytes());
	EXPECT_EQ(header.order, ByteOrder::XDR);
	EXPECT_EQ(header.type, GeometryType::POLYGON);
	EXPECT_FALSE(header.has_z);
	EXPECT_FALSE(header.has_m);
	EXPECT_FALSE(header.IsXYZ());
	EXPECT_EQ(header.WireOrdinates(), 2u);
	EXPECT_EQ(header.srid, 0u);
}

TEST_F(EWKBHeaderTest, DecodesLittleEndianWithSRID) {
	auto bytes = ByteBuilder()
	                 .Byte(1)
	                 .UInt32(5 | EWKBFlags::HAS_Z | EWKBFlags::HAS_SRID, ByteOrder::NDR)
	                 .UInt32(4326, ByteOrder::NDR)
	                 .Bytes();
	auto header = DecodeHeader(bytes);
	EXPECT_EQ(header.order, ByteOrder::NDR);
	EXPECT_EQ(header.type, GeometryType::MULTILINESTRING);
	EXPECT_TRUE(header.has_z);
	EXPECT_FALSE(header.has_m);
	EXPECT_EQ(header.srid, 4326u);
}

TEST_F(EWKBHeaderTest, AnyNonZeroOrderByteIsLittleEndian) {
	auto header = DecodeHeader(ByteBuilder().Byte(0x7F).UInt32(1, ByteOrder::NDR).Bytes());
	EXPECT_EQ(header.order, ByteOrder::NDR);
	EXPECT_EQ(header.type, GeometryType::POINT);
}

TEST_F(EWKBHeaderTest, MeasureFlagsSelectXYZ) {
	auto m_only = DecodeHeader(ByteBuilder().Byte(0).UInt32(2 | EWKBFlags::HAS_M, ByteOrder::XDR).Bytes());
	EXPECT_TRUE(m_only.IsXYZ());
	EXPECT_EQ(m_only.WireOrdinates(), 3u);

	auto zm = DecodeHeader(
	    ByteBuilder().Byte(0).UInt32(2 | EWKBFlags::HAS_Z | EWKBFlags::HAS_M, ByteOrder::XDR).Bytes());
	EXPECT_TRUE(zm.IsXYZ());
	EXPECT_EQ(zm.WireOrdinates(), 3u);
}

TEST_F(EWKBHeaderTest, RejectsUnknownShapeCodes) {
	// Shape bits 0, and 8 which masks to 0
	for (uint32_t type_word : {0u, 8u, EWKBFlags::HAS_SRID}) {
		auto bytes = ByteBuilder().Byte(0).UInt32(type_word, ByteOrder::XDR).Bytes();
		EXPECT_THROW(DecodeHeader(bytes), UnrecognizedShapeCodeException);
		EXPECT_THROW(DecodeHeader(bytes, true), UnrecognizedShapeCodeException);
	}
}

TEST_F(EWKBHeaderTest, UnknownShapeCodeCarriesTypeWord) {
	try {
		EWKBHeader::ParseShapeCode(EWKBFlags::HAS_Z | 8);
		FAIL() << "expected UnrecognizedShapeCodeException";
	} catch (const UnrecognizedShapeCodeException &ex) {
		EXPECT_EQ(ex.GetTypeWord(), EWKBFlags::HAS_Z | 8);
		EXPECT_EQ(ex.GetShapeCode(), 0u);
	}
}

TEST_F(EWKBHeaderTest, TruncatedHeaderFails) {
	EXPECT_THROW(DecodeHeader(ByteBuilder().Byte(0).Byte(0).Bytes()), SerializationException);
	// SRID flagged but missing
	auto bytes = ByteBuilder().Byte(0).UInt32(1 | EWKBFlags::HAS_SRID, ByteOrder::XDR).Bytes();
	EXPECT_THROW(DecodeHeader(bytes), SerializationException);
}

TEST_F(EWKBHeaderTest, NestedHeaderNeverReadsSRID) {
	auto bytes = ByteBuilder()
	                 .Byte(0)
	                 .UInt32(1 | EWKBFlags::HAS_SRID | EWKBFlags::HAS_Z, ByteOrder::XDR)
	                 .UInt32(4326, ByteOrder::XDR)
	                 .Bytes();
	duckdb::MemoryStream stream(const_cast<data_ptr_t>(bytes.data()), bytes.size());
	ReadBuffer buffer(stream, bytes.size(), ReadBuffer::MINIMUM_SIZE);
	auto header = EWKBHeader::DecodeNested(buffer);
	EXPECT_EQ(header.type, GeometryType::POINT);
	EXPECT_EQ(header.srid, 0u);
	// The flags are reported, the SRID bytes are left in place
	EXPECT_TRUE(header.has_z);
	EXPECT_EQ(buffer.Position(), EWKBHeader::MINI_SIZE);
}

TEST_F(EWKBHeaderTest, EncodesCanonicalBigEndian) {
	auto plain = EncodeHeader(GeometryType::POINT, false, 0);
	EXPECT_EQ(plain, ByteBuilder().Byte(0).UInt32(1, ByteOrder::XDR).Bytes());

	auto with_srid = EncodeHeader(GeometryType::GEOMETRYCOLLECTION, true, 3857);
	auto expected = ByteBuilder()
	                    .Byte(0)
	                    .UInt32(7 | EWKBFlags::HAS_Z | EWKBFlags::HAS_SRID, ByteOrder::XDR)
	                    .UInt32(3857, ByteOrder::XDR)
	                    .Bytes();
	EXPECT_EQ(with_srid, expected);
}

TEST_F(EWKBHeaderTest, EncodedSize) {
	EXPECT_EQ(EWKBHeader::EncodedSize(0), 5u);
	EXPECT_EQ(EWKBHeader::EncodedSize(4326), 9u);
	EXPECT_EQ(EncodeHeader(GeometryType::LINESTRING, false, 0).size(), EWKBHeader::EncodedSize(0));
	EXPECT_EQ(EncodeHeader(GeometryType::LINESTRING, true, 1).size(), EWKBHeader::EncodedSize(1));
}

TEST_F(EWKBHeaderTest, EncodeFlushesWhenFull) {
	duckdb::MemoryStream stream;
	WriteBuffer buffer(stream, WriteBuffer::MINIMUM_SIZE);
	for (idx_t i = 0; i < 7; i++) {
		buffer.WriteDouble(0);
	}
	// 8 bytes left, a header with an SRID needs 9
	EWKBHeader::Encode(buffer, GeometryType::POINT, false, 4326);
	EXPECT_EQ(stream.GetPosition(), 56u);
	EXPECT_EQ(buffer.Position(), 65u);
}
