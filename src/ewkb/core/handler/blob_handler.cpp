#include "ewkb/common.hpp"
#include "ewkb/core/handler/blob_handler.hpp"

#include <limits>

namespace ewkb {

namespace core {

constexpr const char *BlobHandler::TYPE_NAME;

vector<data_t> BlobHandler::Read(ReadBuffer &buffer, int32_t len) const {
	if (len < 0) {
		throw InvalidInputException("%s: negative field length %d", TYPE_NAME, len);
	}
	vector<data_t> result(static_cast<idx_t>(len));
	buffer.ReadBytes(result.data(), result.size());
	return result;
}

int32_t BlobHandler::ValidateAndGetLength(const vector<data_t> &value) const {
	if (value.size() > static_cast<idx_t>(std::numeric_limits<int32_t>::max())) {
		throw InvalidInputException("%s: value of %d bytes exceeds the maximum field length", TYPE_NAME,
		                            static_cast<int64_t>(value.size()));
	}
	return static_cast<int32_t>(value.size());
}

void BlobHandler::Write(const vector<data_t> &value, WriteBuffer &buffer) const {
	buffer.WriteBytes(value.data(), value.size());
}

} // namespace core

} // namespace ewkb
