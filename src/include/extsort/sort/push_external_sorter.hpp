//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/push_external_sorter.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/exception.hpp"
#include "extsort/common/helper.hpp"
#include "extsort/logging/log_manager.hpp"
#include "extsort/logging/logger.hpp"
#include "extsort/sort/external_sort_config.hpp"
#include "extsort/sort/parallel_sort.hpp"
#include "extsort/sort/sort_comparator.hpp"
#include "extsort/sort/sort_directory.hpp"
#include "extsort/sort/sort_segment.hpp"
#include "extsort/sort/sorted_iterator.hpp"

#include <algorithm>

namespace extsort {

//! Accumulates records pushed one at a time. Whenever more than segment_size records are buffered, the buffer is
//! sorted and written to a new segment file. Done() hands everything over to a SortedIterator.
//! Records must be default constructible, movable and encodable through SortCodec<T>.
template <class T>
class PushExternalSorter {
public:
	PushExternalSorter(ExternalSortConfig config_p, shared_ptr<const SortComparator<T>> comparator_p)
	    : config(std::move(config_p)), comparator(std::move(comparator_p)), count(0), failed(false),
	      finished(false) {
		config.Verify();
		if (!comparator) {
			throw InvalidInputException("PushExternalSorter requires a comparator");
		}
		log_manager = config.log_manager ? config.log_manager : make_shared_ptr<LogManager>();
		logger = log_manager->CreateLogger(LoggingContext(LogContextScope::SORTER));
		directory = make_uniq<SortDirectory>(*config.file_system, logger, config.sort_directory,
		                                     config.temp_directory_prefix);
	}

	//! Adds a record, spilling the buffer to disk once it holds more than segment_size records
	void Push(T item) {
		CheckUsable();
		buffer.push_back(std::move(item));
		count++;
		if (buffer.size() > config.segment_size) {
			Spill();
		}
	}

	template <class ITERATOR>
	void PushRange(ITERATOR begin, ITERATOR end) {
		for (auto it = begin; it != end; ++it) {
			Push(*it);
		}
	}

	template <class CONTAINER>
	void PushAll(const CONTAINER &items) {
		PushRange(items.begin(), items.end());
	}

	//! Finishes the sort. The sorter cannot be used afterwards.
	unique_ptr<SortedIterator<T>> Done() {
		CheckUsable();
		finished = true;
		vector<T> pass_through;
		if (segments.empty()) {
			SortBuffer();
			pass_through = std::move(buffer);
			buffer.clear();
		} else if (!buffer.empty()) {
			Spill();
		}
		EXTSORT_LOG(*logger, SortLogType, "finalize", segments.empty() ? "in_memory" : "external");
		return make_uniq<SortedIterator<T>>(log_manager, logger, std::move(directory), std::move(pass_through),
		                                    std::move(segments), count, comparator, config);
	}

	//! Number of records pushed so far
	idx_t Count() const {
		return count;
	}
	//! Number of segments written so far
	idx_t SegmentCount() const {
		return segments.size();
	}
	const ExternalSortConfig &GetConfig() const {
		return config;
	}

private:
	void CheckUsable() const {
		if (failed) {
			throw InvalidInputException("Cannot use the external sorter: a previous spill to disk failed");
		}
		if (finished) {
			throw InvalidInputException("Cannot use the external sorter after Done() has been called");
		}
	}

	void SortBuffer() {
		auto &less = *comparator;
		if (config.parallel_sort) {
			ParallelSort::Sort(buffer, less, config.thread_count);
		} else {
			std::sort(buffer.begin(), buffer.end(), [&less](const T &a, const T &b) { return less.LessThan(a, b); });
		}
	}

	void Spill() {
		try {
			SortBuffer();
			auto segment_index = segments.size();
			auto segment = SortSegment::Write(*config.file_system, segment_index,
			                                  directory->GetSegmentPath(segment_index), buffer.begin(), buffer.end());
			EXTSORT_LOG(*logger, SortLogType, "spill", segment_index, segment->Count(), segment->SizeInBytes());
			segments.push_back(std::move(segment));
			buffer.clear();
		} catch (...) {
			failed = true;
			throw;
		}
	}

private:
	ExternalSortConfig config;
	shared_ptr<const SortComparator<T>> comparator;
	shared_ptr<LogManager> log_manager;
	shared_ptr<Logger> logger;
	unique_ptr<SortDirectory> directory;
	vector<T> buffer;
	vector<unique_ptr<SortSegment>> segments;
	idx_t count;
	bool failed;
	bool finished;
};

} // namespace extsort
