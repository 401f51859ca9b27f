#include "extsort/logging/log_storage.hpp"

#include "extsort/common/exception.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace extsort {

vector<LogEntry> LogStorage::GetEntries() const {
	throw NotImplementedException("Not implemented for this LogStorage: GetEntries");
}

void LogStorage::Truncate() {
	throw NotImplementedException("Not implemented for this LogStorage: TruncateLogStorage");
}

string LogStorage::FormatEntry(const LogEntry &entry) {
	auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(entry.timestamp);
	auto micros = std::chrono::duration_cast<std::chrono::microseconds>(entry.timestamp - seconds).count();
	std::time_t time = std::chrono::system_clock::to_time_t(entry.timestamp);
	return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}\t{}\t{}\t{}\t{}\t{}", fmt::gmtime(time), micros,
	                   LogLevelToString(entry.level), LogContextScopeToString(entry.scope), entry.context_id,
	                   entry.log_type, entry.message);
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(log_timestamp_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message, const RegisteredLoggingContext &context) {
	LogEntry entry {timestamp, level, log_type, log_message, context.context_id, context.context.scope};
	fmt::print(stdout, "{}\n", FormatEntry(entry));
}

void StdOutLogStorage::Flush() {
	fflush(stdout);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(log_timestamp_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message, const RegisteredLoggingContext &context) {
	lock_guard<mutex> lck(lock);
	LogEntry entry {timestamp, level, log_type, log_message, context.context_id, context.context.scope};
	entries.push_back(std::move(entry));
}

void InMemoryLogStorage::Flush() {
	// NOP
}

vector<LogEntry> InMemoryLogStorage::GetEntries() const {
	lock_guard<mutex> lck(lock);
	return entries;
}

void InMemoryLogStorage::Truncate() {
	lock_guard<mutex> lck(lock);
	entries.clear();
}

} // namespace extsort
