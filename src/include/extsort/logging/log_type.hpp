//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/logging/log_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/logging/logging.hpp"

namespace extsort {

//! Log type used by the EXTSORT_LOG_<LEVEL> macros for free-form messages
class DefaultLogType {
public:
	static constexpr const char *NAME = "";
	static constexpr LogLevel LEVEL = LogLevel::LOG_INFO;
};

//! Structured events emitted by the external sorter
class SortLogType {
public:
	static constexpr const char *NAME = "extsort.sort";
	static constexpr LogLevel LEVEL = LogLevel::LOG_DEBUG;

	//! An event that concerns a single segment (spill, open, retire)
	EXTSORT_API static string ConstructLogMessage(const string &op, idx_t segment, idx_t item_count, idx_t bytes);
	//! An event that concerns the whole sort (sort started, merge started, cleanup)
	EXTSORT_API static string ConstructLogMessage(const string &op, const string &detail);
};

} // namespace extsort
