#include "ewkb/common.hpp"
#include "ewkb/core/util/log.hpp"

namespace ewkb {

namespace core {

void Log::Write(const CodecOptions &options, LogLevel level, const string &message) {
	if (!IsEnabled(options, level)) {
		return;
	}
	auto prefix = StringUtil::Upper(CodecOptions::LogLevelToString(level));
	Printer::Print(StringUtil::Format("[ewkb %s] %s", prefix, message));
}

} // namespace core

} // namespace ewkb
