#include "ewkb/common.hpp"
#include "ewkb/core/errors.hpp"
#include "ewkb/core/handler/geometry_handler.hpp"

#include <limits>

namespace ewkb {

namespace core {

constexpr const char *GeometryHandler::TYPE_NAME;

GeometryHandler::GeometryHandler(const CodecOptions &options_p, unique_ptr<BlobHandler> blob_handler_p)
    : options(options_p), reader(options_p), writer(options_p), blob_handler(std::move(blob_handler_p)) {
}

Geometry GeometryHandler::Read(ReadBuffer &buffer, int32_t len) const {
	if (len < 0) {
		throw InvalidInputException("%s: negative field length %d", TYPE_NAME, len);
	}
	auto start = buffer.Position();
	auto geom = reader.Read(buffer);
	auto consumed = buffer.Position() - start;
	if (consumed != static_cast<idx_t>(len)) {
		throw InvalidInputException("%s: field length is %d bytes but the value decoded from %d bytes", TYPE_NAME,
		                            len, static_cast<int64_t>(consumed));
	}
	return geom;
}

int32_t GeometryHandler::ValidateAndGetLength(const Geometry &value) const {
	auto size = EWKBWriter::GetRequiredSize(value);
	if (size > static_cast<idx_t>(std::numeric_limits<int32_t>::max())) {
		throw InvalidInputException("%s: value of %d bytes exceeds the maximum field length", TYPE_NAME,
		                            static_cast<int64_t>(size));
	}
	return static_cast<int32_t>(size);
}

void GeometryHandler::Write(const Geometry &value, WriteBuffer &buffer) const {
	writer.Write(value, buffer);
}

const BlobHandler &GeometryHandler::GetBlobHandler() const {
	if (!blob_handler) {
		throw MisconfiguredFallbackException(TYPE_NAME);
	}
	return *blob_handler;
}

vector<data_t> GeometryHandler::ReadBytes(ReadBuffer &buffer, int32_t len) const {
	return GetBlobHandler().Read(buffer, len);
}

int32_t GeometryHandler::ValidateAndGetLength(const vector<data_t> &value) const {
	return GetBlobHandler().ValidateAndGetLength(value);
}

void GeometryHandler::WriteBytes(const vector<data_t> &value, WriteBuffer &buffer) const {
	GetBlobHandler().Write(value, buffer);
}

} // namespace core

} // namespace ewkb
