//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

#include <chrono>

namespace extsort {

//! Log levels, ordered by severity
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

//! Log modes decide how log types are filtered on top of the level
enum class LogMode : uint8_t {
	//! Only filter on the log level
	LEVEL_ONLY = 0,
	//! Only log the types listed in enabled_log_types
	ENABLE_SELECTED = 1,
	//! Log everything except the types listed in disabled_log_types
	DISABLE_SELECTED = 2,
};

enum class LogContextScope : uint8_t { GLOBAL = 0, SORTER = 1 };

typedef std::chrono::system_clock::time_point log_timestamp_t;

EXTSORT_API const char *LogLevelToString(LogLevel level);
EXTSORT_API LogLevel StringToLogLevel(const string &level);
EXTSORT_API const char *LogContextScopeToString(LogContextScope scope);

struct LogConfig {
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";

	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *DEFAULT_LOG_STORAGE = IN_MEMORY_STORAGE_NAME;

	EXTSORT_API LogConfig();

	EXTSORT_API static LogConfig Create(bool enabled, LogLevel level);
	EXTSORT_API static LogConfig CreateFromEnabled(bool enabled, LogLevel level,
	                                               const unordered_set<string> &enabled_log_types);
	EXTSORT_API static LogConfig CreateFromDisabled(bool enabled, LogLevel level,
	                                                const unordered_set<string> &disabled_log_types);

	EXTSORT_API bool IsConsistent() const;

	bool enabled;
	LogMode mode;
	LogLevel level;
	string storage;

	unordered_set<string> enabled_log_types;
	unordered_set<string> disabled_log_types;

protected:
	LogConfig(bool enabled, LogLevel level, LogMode mode, const unordered_set<string> *enabled_log_types,
	          const unordered_set<string> *disabled_log_types);
};

struct LoggingContext {
	explicit LoggingContext(LogContextScope scope_p) : scope(scope_p) {
	}

	LogContextScope scope;
};

struct RegisteredLoggingContext {
	//! Unique identifier for this context
	idx_t context_id;
	//! Context information provided by the registering party
	LoggingContext context;
};

} // namespace extsort
