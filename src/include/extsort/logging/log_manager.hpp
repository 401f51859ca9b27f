//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/logging/log_storage.hpp"
#include "extsort/logging/logger.hpp"

namespace extsort {

// Holds the log configuration and storage, and hands out loggers. Can be shared between any number of sorters.
class LogManager {
	friend class ThreadSafeLogger;
	friend class MutableLogger;

public:
	EXTSORT_API explicit LogManager(LogConfig config = LogConfig());
	EXTSORT_API ~LogManager();

	//! Creates a logger for the given context. Returns a NopLogger if logging is disabled, unless mutable settings are
	//! requested.
	EXTSORT_API unique_ptr<Logger> CreateLogger(LoggingContext context, bool mutable_settings = false);

	EXTSORT_API RegisteredLoggingContext RegisterLoggingContext(LoggingContext &context);

	//! Makes a custom storage available to SetLogStorage under the given name
	EXTSORT_API bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage);

	//! The global logger follows every config change made through this LogManager
	EXTSORT_API Logger &GlobalLogger();

	EXTSORT_API void Flush();

	EXTSORT_API shared_ptr<LogStorage> GetLogStorage();

	EXTSORT_API void SetEnableLogging(bool enable);
	EXTSORT_API void SetLogMode(LogMode mode);
	EXTSORT_API void SetLogLevel(LogLevel level);
	EXTSORT_API void SetEnabledLogTypes(const unordered_set<string> &enabled_log_types);
	EXTSORT_API void SetDisabledLogTypes(const unordered_set<string> &disabled_log_types);
	EXTSORT_API void SetLogStorage(const string &storage_name);

	EXTSORT_API void TruncateLogStorage();

	EXTSORT_API LogConfig GetConfig();

protected:
	RegisteredLoggingContext RegisterLoggingContextInternal(LoggingContext &context);
	// This is to be called by the Loggers only, it does not verify log_level and log_type
	void WriteLogEntry(log_timestamp_t timestamp, const char *log_type, LogLevel log_level, const char *log_message,
	                   const RegisteredLoggingContext &context);
	shared_ptr<LogStorage> CreateStorage(const string &storage_name);

	mutex lock;
	LogConfig config;

	unique_ptr<Logger> global_logger;

	shared_ptr<LogStorage> log_storage;

	idx_t next_registered_logging_context_index = 0;

	// Any additional LogStorages registered (by extensions for example)
	unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace extsort
