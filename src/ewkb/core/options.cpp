#include "ewkb/common.hpp"
#include "ewkb/core/options.hpp"

namespace ewkb {

namespace core {

static idx_t BindBufferSize(const string &name, const Value &value, idx_t minimum) {
	if (value.IsNull() || !value.type().IsIntegral()) {
		throw InvalidInputException("'%s' parameter must be an integer", name);
	}
	auto size = value.GetValue<int64_t>();
	if (size < static_cast<int64_t>(minimum)) {
		throw InvalidInputException("'%s' parameter must be at least %d bytes", name,
		                            static_cast<int64_t>(minimum));
	}
	return static_cast<idx_t>(size);
}

LogLevel CodecOptions::ParseLogLevel(const string &name) {
	auto lname = StringUtil::Lower(name);
	if (lname == "trace") {
		return LogLevel::TRACE;
	}
	if (lname == "warning") {
		return LogLevel::WARNING;
	}
	if (lname == "none") {
		return LogLevel::NONE;
	}
	throw InvalidInputException("Unknown log level '%s', expected 'trace', 'warning' or 'none'", name);
}

string CodecOptions::LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "trace";
	case LogLevel::WARNING:
		return "warning";
	case LogLevel::NONE:
		return "none";
	default:
		throw InternalException("Unknown log level");
	}
}

CodecOptions CodecOptions::Bind(const case_insensitive_map_t<Value> &parameters) {
	CodecOptions options;
	for (auto &kv : parameters) {
		auto loption = StringUtil::Lower(kv.first);
		if (loption == "read_buffer_size") {
			options.read_buffer_size = BindBufferSize(loption, kv.second, ReadBuffer::MINIMUM_SIZE);
		} else if (loption == "write_buffer_size") {
			options.write_buffer_size = BindBufferSize(loption, kv.second, WriteBuffer::MINIMUM_SIZE);
		} else if (loption == "log_level") {
			if (kv.second.IsNull() || kv.second.type().id() != LogicalTypeId::VARCHAR) {
				throw InvalidInputException("'log_level' parameter must be a string");
			}
			options.log_level = ParseLogLevel(StringValue::Get(kv.second));
		} else {
			throw InvalidInputException("Unknown codec option '%s'", kv.first);
		}
	}
	return options;
}

} // namespace core

} // namespace ewkb
