//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/external_sort_config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"
#include "extsort/common/file_system.hpp"

namespace extsort {

class LogManager;

//! Options of an external sort
struct ExternalSortConfig {
	static constexpr const idx_t DEFAULT_SEGMENT_SIZE = 10000;
	static constexpr const idx_t DEFAULT_HEAP_MERGE_THRESHOLD = 20;
	static constexpr const idx_t DEFAULT_HEAP_REFILL_SIZE = 20;

public:
	EXTSORT_API ExternalSortConfig();

	//! Maximum number of records kept in memory before the buffer is spilled to a segment
	idx_t segment_size = DEFAULT_SEGMENT_SIZE;
	//! Directory in which the segments are written; empty means a fresh directory in the temp directory
	string sort_directory;
	//! Whether or not each buffer is sorted with multiple threads before it is spilled
	bool parallel_sort = false;
	//! Minimum number of segments at which the merge switches from a linear scan to a heap
	idx_t heap_merge_threshold = DEFAULT_HEAP_MERGE_THRESHOLD;
	//! Records decoded per segment refill while merging with a heap
	idx_t heap_refill_size = DEFAULT_HEAP_REFILL_SIZE;
	//! Worker threads used by the parallel sort
	idx_t thread_count;
	//! Name prefix of the temp directory
	string temp_directory_prefix = "extsort_";
	//! The file system segments are written to
	shared_ptr<FileSystem> file_system;
	//! Optional log manager, logging is disabled when not set
	shared_ptr<LogManager> log_manager;

public:
	//! Sets an option from its string representation, throws an InvalidConfigurationException on unknown names or
	//! values that cannot be parsed
	EXTSORT_API void SetOptionByName(const string &name, const string &value);
	//! Returns the string representation of an option
	EXTSORT_API string GetOptionByName(const string &name) const;
	//! The names accepted by SetOptionByName and GetOptionByName
	EXTSORT_API static vector<string> GetOptionNames();

	//! Throws an InvalidConfigurationException if the config cannot be used to sort
	EXTSORT_API void Verify() const;

	EXTSORT_API static idx_t GetSystemThreadCount();
};

} // namespace extsort
