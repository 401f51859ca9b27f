#include "extsort/logging/logging.hpp"

#include "extsort/common/exception.hpp"
#include "extsort/common/string_util.hpp"

namespace extsort {

constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

const char *LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LOG_TRACE:
		return "TRACE";
	case LogLevel::LOG_DEBUG:
		return "DEBUG";
	case LogLevel::LOG_INFO:
		return "INFO";
	case LogLevel::LOG_WARN:
		return "WARN";
	case LogLevel::LOG_ERROR:
		return "ERROR";
	case LogLevel::LOG_FATAL:
		return "FATAL";
	default:
		throw NotImplementedException("Enum value of type LogLevel: '%d' not implemented", static_cast<int>(level));
	}
}

LogLevel StringToLogLevel(const string &level) {
	auto lower = StringUtil::Lower(level);
	if (lower == "trace") {
		return LogLevel::LOG_TRACE;
	} else if (lower == "debug") {
		return LogLevel::LOG_DEBUG;
	} else if (lower == "info") {
		return LogLevel::LOG_INFO;
	} else if (lower == "warn" || lower == "warning") {
		return LogLevel::LOG_WARN;
	} else if (lower == "error") {
		return LogLevel::LOG_ERROR;
	} else if (lower == "fatal") {
		return LogLevel::LOG_FATAL;
	}
	throw InvalidInputException("Unknown log level '%s'", level);
}

const char *LogContextScopeToString(LogContextScope scope) {
	switch (scope) {
	case LogContextScope::GLOBAL:
		return "GLOBAL";
	case LogContextScope::SORTER:
		return "SORTER";
	default:
		throw NotImplementedException("Enum value of type LogContextScope: '%d' not implemented",
		                              static_cast<int>(scope));
	}
}

LogConfig::LogConfig()
    : enabled(false), mode(LogMode::LEVEL_ONLY), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

bool LogConfig::IsConsistent() const {
	if (mode == LogMode::LEVEL_ONLY) {
		return enabled_log_types.empty() && disabled_log_types.empty();
	}
	if (mode == LogMode::DISABLE_SELECTED) {
		return enabled_log_types.empty() && !disabled_log_types.empty();
	}
	if (mode == LogMode::ENABLE_SELECTED) {
		return !enabled_log_types.empty() && disabled_log_types.empty();
	}
	return false;
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	return LogConfig(enabled, level, LogMode::LEVEL_ONLY, nullptr, nullptr);
}

LogConfig LogConfig::CreateFromEnabled(bool enabled, LogLevel level, const unordered_set<string> &enabled_log_types) {
	return LogConfig(enabled, level, LogMode::ENABLE_SELECTED, &enabled_log_types, nullptr);
}

LogConfig LogConfig::CreateFromDisabled(bool enabled, LogLevel level, const unordered_set<string> &disabled_log_types) {
	return LogConfig(enabled, level, LogMode::DISABLE_SELECTED, nullptr, &disabled_log_types);
}

LogConfig::LogConfig(bool enabled, LogLevel level_p, LogMode mode_p, const unordered_set<string> *enabled_log_types_p,
                     const unordered_set<string> *disabled_log_types_p)
    : enabled(enabled), mode(mode_p), level(level_p), storage(DEFAULT_LOG_STORAGE) {
	if (enabled_log_types_p) {
		enabled_log_types = *enabled_log_types_p;
	}
	if (disabled_log_types_p) {
		disabled_log_types = *disabled_log_types_p;
	}
}

} // namespace extsort
