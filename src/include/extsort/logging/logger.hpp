//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/string_util.hpp"
#include "extsort/logging/log_type.hpp"
#include "extsort/logging/logging.hpp"

#include <atomic>

namespace extsort {

class LogManager;

// Macro for logging with a log type class, e.g. EXTSORT_LOG(logger, SortLogType, "spill", 0, 100)
#define EXTSORT_LOG(SOURCE, LOG_TYPE_CLASS, ...)                                                                       \
	{                                                                                                                  \
		auto &logger_ref = extsort::Logger::Get(SOURCE);                                                               \
		if (logger_ref.ShouldLog(LOG_TYPE_CLASS::NAME, LOG_TYPE_CLASS::LEVEL)) {                                       \
			logger_ref.WriteLog(LOG_TYPE_CLASS::NAME, LOG_TYPE_CLASS::LEVEL,                                           \
			                    LOG_TYPE_CLASS::ConstructLogMessage(__VA_ARGS__));                                     \
		}                                                                                                              \
	}

// Main logging macro for free-form messages with printf style formatting
#define EXTSORT_LOG_INTERNAL(SOURCE, LOG_TYPE, LOG_LEVEL, ...)                                                          \
	{                                                                                                                  \
		auto &logger_ref = extsort::Logger::Get(SOURCE);                                                               \
		if (logger_ref.ShouldLog(LOG_TYPE, LOG_LEVEL)) {                                                               \
			logger_ref.WriteLog(LOG_TYPE, LOG_LEVEL, extsort::StringUtil::Format(__VA_ARGS__));                        \
		}                                                                                                              \
	}

#define EXTSORT_LOG_TRACE(SOURCE, ...)                                                                                 \
	EXTSORT_LOG_INTERNAL(SOURCE, extsort::DefaultLogType::NAME, extsort::LogLevel::LOG_TRACE, __VA_ARGS__)
#define EXTSORT_LOG_DEBUG(SOURCE, ...)                                                                                 \
	EXTSORT_LOG_INTERNAL(SOURCE, extsort::DefaultLogType::NAME, extsort::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define EXTSORT_LOG_INFO(SOURCE, ...)                                                                                  \
	EXTSORT_LOG_INTERNAL(SOURCE, extsort::DefaultLogType::NAME, extsort::LogLevel::LOG_INFO, __VA_ARGS__)
#define EXTSORT_LOG_WARN(SOURCE, ...)                                                                                  \
	EXTSORT_LOG_INTERNAL(SOURCE, extsort::DefaultLogType::NAME, extsort::LogLevel::LOG_WARN, __VA_ARGS__)
#define EXTSORT_LOG_ERROR(SOURCE, ...)                                                                                 \
	EXTSORT_LOG_INTERNAL(SOURCE, extsort::DefaultLogType::NAME, extsort::LogLevel::LOG_ERROR, __VA_ARGS__)

//! Main logging interface
class Logger {
public:
	EXTSORT_API explicit Logger(LogManager &manager) : manager(manager) {
	}

	EXTSORT_API virtual ~Logger() = default;

	//! Main Logger API
	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	EXTSORT_API void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	virtual void Flush() = 0;

	// Get the Logger to write log messages to
	EXTSORT_API static Logger &Get(Logger &logger) {
		return logger;
	}
	EXTSORT_API static Logger &Get(LogManager &manager);

	virtual bool IsThreadSafe() = 0;
	virtual bool IsMutable() {
		return false;
	};
	virtual void UpdateConfig(LogConfig &new_config) {
		throw InternalException("Cannot update the config of this logger!");
	}
	virtual const LogConfig &GetConfig() const = 0;

protected:
	LogManager &manager;
};

// Thread-safe logger, writes every entry straight through to the LogManager
class ThreadSafeLogger : public Logger {
public:
	EXTSORT_API explicit ThreadSafeLogger(const LogConfig &config_p, LoggingContext &context_p, LogManager &manager);
	EXTSORT_API explicit ThreadSafeLogger(const LogConfig &config_p, RegisteredLoggingContext context_p,
	                                      LogManager &manager);

	// Main Logger API
	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;

	void Flush() override;
	bool IsThreadSafe() override {
		return true;
	}
	const LogConfig &GetConfig() const override {
		return config;
	}

protected:
	//! Snapshot of the config taken when the logger was created
	const LogConfig config;
	const RegisteredLoggingContext context;
};

// Thread-safe Logger with mutable log settings
class MutableLogger : public Logger {
public:
	EXTSORT_API explicit MutableLogger(const LogConfig &config_p, LoggingContext &context_p, LogManager &manager);
	EXTSORT_API explicit MutableLogger(const LogConfig &config_p, RegisteredLoggingContext context_p,
	                                   LogManager &manager);

	// Main Logger API
	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;

	void Flush() override;
	bool IsThreadSafe() override {
		return true;
	}
	bool IsMutable() override {
		return true;
	}
	const LogConfig &GetConfig() const override {
		return config;
	}

	void UpdateConfig(LogConfig &new_config) override;

protected:
	// Atomics for lock-free log setting checks
	std::atomic<bool> enabled;
	std::atomic<LogMode> mode;
	std::atomic<LogLevel> level;

protected:
	LogConfig config;
	mutex lock;
	const RegisteredLoggingContext context;
};

// For when logging is disabled: NOPs everything
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override {};
	void Flush() override {
	}
	bool IsThreadSafe() override {
		return true;
	}
	const LogConfig &GetConfig() const override {
		return config;
	}

protected:
	const LogConfig config;
};

} // namespace extsort
