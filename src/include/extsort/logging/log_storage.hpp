//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/logging/logging.hpp"

namespace extsort {

//! A single log entry as it was handed to the storage
struct LogEntry {
	log_timestamp_t timestamp;
	LogLevel level;
	string log_type;
	string message;
	idx_t context_id;
	LogContextScope scope;
};

//! Interface for writing log entries
class LogStorage {
public:
	EXTSORT_API explicit LogStorage() = default;
	EXTSORT_API virtual ~LogStorage() = default;

	//! WRITING
	EXTSORT_API virtual void WriteLogEntry(log_timestamp_t timestamp, LogLevel level, const string &log_type,
	                                       const string &log_message, const RegisteredLoggingContext &context) = 0;
	EXTSORT_API virtual void Flush() = 0;

	//! READING (OPTIONAL)
	EXTSORT_API virtual vector<LogEntry> GetEntries() const;
	EXTSORT_API virtual void Truncate();

	//! Renders an entry as a single tab separated line: timestamp, level, scope, context, type, message
	EXTSORT_API static string FormatEntry(const LogEntry &entry);

public:
	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
};

//! Writes every entry to stdout as soon as it arrives
class StdOutLogStorage : public LogStorage {
public:
	EXTSORT_API explicit StdOutLogStorage();
	EXTSORT_API ~StdOutLogStorage() override;

	//! LogStorage API: WRITING
	void WriteLogEntry(log_timestamp_t timestamp, LogLevel level, const string &log_type, const string &log_message,
	                   const RegisteredLoggingContext &context) override;
	void Flush() override;
};

//! Keeps every entry in memory so that it can be inspected later
class InMemoryLogStorage : public LogStorage {
public:
	EXTSORT_API explicit InMemoryLogStorage();
	EXTSORT_API ~InMemoryLogStorage() override;

	//! LogStorage API: WRITING
	void WriteLogEntry(log_timestamp_t timestamp, LogLevel level, const string &log_type, const string &log_message,
	                   const RegisteredLoggingContext &context) override;
	void Flush() override;

	//! LogStorage API: READING
	vector<LogEntry> GetEntries() const override;
	void Truncate() override;

protected:
	mutable mutex lock;
	vector<LogEntry> entries;
};

} // namespace extsort
