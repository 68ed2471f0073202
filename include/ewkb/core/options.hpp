#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/io/read_buffer.hpp"
#include "ewkb/core/io/write_buffer.hpp"

namespace ewkb {

namespace core {

enum class LogLevel : uint8_t { TRACE = 0, WARNING = 1, NONE = 2 };

struct CodecOptions {
	// Capacity of the buffers used by in-memory Deserialize and Write
	idx_t read_buffer_size = ReadBuffer::DEFAULT_SIZE;
	idx_t write_buffer_size = WriteBuffer::DEFAULT_SIZE;
	// Messages below this level are dropped
	LogLevel log_level = LogLevel::WARNING;

	// Bind named parameters, e.g. {"read_buffer_size": 4096, "log_level": 'trace'}
	static CodecOptions Bind(const case_insensitive_map_t<Value> &parameters);

	static LogLevel ParseLogLevel(const string &name);
	static string LogLevelToString(LogLevel level);
};

} // namespace core

} // namespace ewkb
