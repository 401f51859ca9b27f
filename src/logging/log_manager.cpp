#include "extsort/logging/log_manager.hpp"

#include "extsort/common/exception.hpp"
#include "extsort/common/helper.hpp"
#include "extsort/common/string_util.hpp"

namespace extsort {

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	log_storage = CreateStorage(config.storage);
	config.storage = StringUtil::Lower(config.storage);
	LoggingContext context(LogContextScope::GLOBAL);
	global_logger = CreateLogger(context, true);
}

LogManager::~LogManager() {
}

unique_ptr<Logger> LogManager::CreateLogger(LoggingContext context, bool mutable_settings) {
	unique_lock<mutex> lck(lock);

	auto registered_logging_context = RegisterLoggingContextInternal(context);

	if (mutable_settings) {
		return make_uniq<MutableLogger>(config, registered_logging_context, *this);
	}
	if (!config.enabled) {
		return make_uniq<NopLogger>(*this);
	}
	return make_uniq<ThreadSafeLogger>(config, registered_logging_context, *this);
}

RegisteredLoggingContext LogManager::RegisterLoggingContext(LoggingContext &context) {
	unique_lock<mutex> lck(lock);

	return RegisterLoggingContextInternal(context);
}

bool LogManager::RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage) {
	unique_lock<mutex> lck(lock);
	auto name_to_lower = StringUtil::Lower(name);
	if (name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME || name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		return false;
	}
	if (registered_log_storages.find(name_to_lower) != registered_log_storages.end()) {
		return false;
	}
	registered_log_storages.insert(std::make_pair(name_to_lower, std::move(storage)));
	return true;
}

Logger &LogManager::GlobalLogger() {
	return *global_logger;
}

void LogManager::Flush() {
	unique_lock<mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	unique_lock<mutex> lck(lock);
	return log_storage;
}

RegisteredLoggingContext LogManager::RegisterLoggingContextInternal(LoggingContext &context) {
	RegisteredLoggingContext result = {next_registered_logging_context_index, context};

	next_registered_logging_context_index += 1;

	if (next_registered_logging_context_index == DConstants::INVALID_INDEX) {
		throw InternalException("Ran out of available log context ids.");
	}

	return result;
}

void LogManager::WriteLogEntry(log_timestamp_t timestamp, const char *log_type, LogLevel log_level,
                               const char *log_message, const RegisteredLoggingContext &context) {
	unique_lock<mutex> lck(lock);
	log_storage->WriteLogEntry(timestamp, log_level, log_type, log_message, context);
}

void LogManager::SetEnableLogging(bool enable) {
	unique_lock<mutex> lck(lock);
	config.enabled = enable;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogMode(LogMode mode) {
	unique_lock<mutex> lck(lock);
	config.mode = mode;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogLevel(LogLevel level) {
	unique_lock<mutex> lck(lock);
	config.level = level;
	global_logger->UpdateConfig(config);
}

void LogManager::SetEnabledLogTypes(const unordered_set<string> &enabled_log_types) {
	unique_lock<mutex> lck(lock);
	config.enabled_log_types = enabled_log_types;
	global_logger->UpdateConfig(config);
}

void LogManager::SetDisabledLogTypes(const unordered_set<string> &disabled_log_types) {
	unique_lock<mutex> lck(lock);
	config.disabled_log_types = disabled_log_types;
	global_logger->UpdateConfig(config);
}

shared_ptr<LogStorage> LogManager::CreateStorage(const string &storage_name) {
	auto storage_name_to_lower = StringUtil::Lower(storage_name);
	if (storage_name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME) {
		return make_shared_ptr<InMemoryLogStorage>();
	} else if (storage_name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		return make_shared_ptr<StdOutLogStorage>();
	}
	auto entry = registered_log_storages.find(storage_name_to_lower);
	if (entry != registered_log_storages.end()) {
		return entry->second;
	}
	throw InvalidInputException("Log storage '%s' is not yet registered", storage_name);
}

void LogManager::SetLogStorage(const string &storage_name) {
	unique_lock<mutex> lck(lock);
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower) {
		return;
	}

	auto new_storage = CreateStorage(storage_name_to_lower);
	// Flush the old storage, we are going to replace it.
	log_storage->Flush();
	log_storage = std::move(new_storage);
	config.storage = storage_name_to_lower;
}

void LogManager::TruncateLogStorage() {
	unique_lock<mutex> lck(lock);
	log_storage->Truncate();
}

LogConfig LogManager::GetConfig() {
	unique_lock<mutex> lck(lock);
	return config;
}

} // namespace extsort
