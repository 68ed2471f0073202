#pragma once
#include "ewkb/common.hpp"
#include "ewkb/core/options.hpp"

namespace ewkb {

namespace core {

struct Log {
	static bool IsEnabled(const CodecOptions &options, LogLevel level) {
		return level != LogLevel::NONE && options.log_level != LogLevel::NONE && level >= options.log_level;
	}

	// Print a message through the DuckDB printer if the level passes the configured threshold
	static void Write(const CodecOptions &options, LogLevel level, const string &message);

	template <typename... ARGS>
	static void Write(const CodecOptions &options, LogLevel level, const string &fmt, ARGS... params) {
		if (!IsEnabled(options, level)) {
			return;
		}
		Write(options, level, StringUtil::Format(fmt, params...));
	}
};

} // namespace core

} // namespace ewkb
