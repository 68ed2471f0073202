#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/io/read_buffer.hpp"
#include "ewkb/core/io/write_buffer.hpp"

namespace ewkb {

namespace core {

// Pass-through handler for undecoded field bytes
class BlobHandler {
public:
	static constexpr const char *TYPE_NAME = "bytea";

	vector<data_t> Read(ReadBuffer &buffer, int32_t len) const;
	int32_t ValidateAndGetLength(const vector<data_t> &value) const;
	void Write(const vector<data_t> &value, WriteBuffer &buffer) const;
};

} // namespace core

} // namespace ewkb
