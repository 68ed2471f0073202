#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/geometry/ewkb_reader.hpp"
#include "ewkb/core/geometry/ewkb_writer.hpp"
#include "ewkb/core/geometry/geometry.hpp"
#include "ewkb/core/handler/blob_handler.hpp"
#include "ewkb/core/options.hpp"

namespace ewkb {

namespace core {

// Entry point for "geometry" columns. A field is handed over as a buffer positioned at the value plus its length,
// written values are measured up front with ValidateAndGetLength().
class GeometryHandler {
public:
	static constexpr const char *TYPE_NAME = "geometry";

private:
	CodecOptions options;
	EWKBReader reader;
	EWKBWriter writer;
	// Used when the caller asks for the undecoded bytes
	unique_ptr<BlobHandler> blob_handler;

public:
	explicit GeometryHandler(const CodecOptions &options = CodecOptions(),
	                         unique_ptr<BlobHandler> blob_handler = nullptr);

	const CodecOptions &GetOptions() const {
		return options;
	}
	bool HasBlobHandler() const {
		return blob_handler != nullptr;
	}

	Geometry Read(ReadBuffer &buffer, int32_t len) const;
	int32_t ValidateAndGetLength(const Geometry &value) const;
	void Write(const Geometry &value, WriteBuffer &buffer) const;

	// Raw bytes, delegated to the blob handler
	vector<data_t> ReadBytes(ReadBuffer &buffer, int32_t len) const;
	int32_t ValidateAndGetLength(const vector<data_t> &value) const;
	void WriteBytes(const vector<data_t> &value, WriteBuffer &buffer) const;

private:
	const BlobHandler &GetBlobHandler() const;
};

} // namespace core

} // namespace ewkb
