//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/sorted_iterator.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/assert.hpp"
#include "extsort/common/error_data.hpp"
#include "extsort/logging/log_manager.hpp"
#include "extsort/sort/external_sort_config.hpp"
#include "extsort/sort/sort_comparator.hpp"
#include "extsort/sort/sort_directory.hpp"
#include "extsort/sort/sort_segment.hpp"

#include <algorithm>
#include <deque>

namespace extsort {

//! How the SortedIterator produces its output, fixed when the iterator is constructed
enum class SortedIteratorMode : uint8_t {
	//! Nothing was spilled, records come straight from the sorted in-memory buffer
	PASSTHROUGH = 0,
	//! Few segments: one cached head per segment, every fetch scans all heads
	LINEAR_SCAN = 1,
	//! Many segments: candidates of all segments are kept in a binary heap
	HEAP_MERGE = 2
};

enum class SortFetchResult : uint8_t { ITEM = 0, FINISHED = 1, ERROR = 2 };

EXTSORT_API const char *SortedIteratorModeToString(SortedIteratorMode mode);

//! Produces the sorted output of an external sort, one record at a time. The iterator owns the segment files and the
//! sort directory, both are released when it is destroyed (whether or not it was exhausted).
template <class T>
class SortedIterator {
public:
	struct HeapEntry {
		HeapEntry(T item_p, idx_t segment_p) : item(std::move(item_p)), segment(segment_p) {
		}

		T item;
		idx_t segment;
	};

	//! Reverses the comparator, the std heap functions build a max-heap
	struct HeapEntryCompare {
		explicit HeapEntryCompare(const SortComparator<T> &comparator_p) : comparator(&comparator_p) {
		}

		bool operator()(const HeapEntry &a, const HeapEntry &b) const {
			return comparator->LessThan(b.item, a.item);
		}

		const SortComparator<T> *comparator;
	};

	struct LinearScanHead {
		LinearScanHead() : has_item(false) {
		}

		T item;
		bool has_item;
	};

public:
	SortedIterator(shared_ptr<LogManager> log_manager_p, shared_ptr<Logger> logger_p,
	               unique_ptr<SortDirectory> directory_p, vector<T> pass_through_p,
	               vector<unique_ptr<SortSegment>> segments_p, idx_t count_p,
	               shared_ptr<const SortComparator<T>> comparator_p, const ExternalSortConfig &config)
	    : file_system(config.file_system), log_manager(std::move(log_manager_p)), logger(std::move(logger_p)),
	      directory(std::move(directory_p)), segments(std::move(segments_p)), count(count_p),
	      comparator(std::move(comparator_p)), pass_through(std::move(pass_through_p)), pass_through_position(0),
	      heap_compare(*comparator), heap_refill_size(config.heap_refill_size) {
		D_ASSERT(segments.empty() || pass_through.empty());
		if (segments.empty()) {
			mode = SortedIteratorMode::PASSTHROUGH;
		} else if (segments.size() < config.heap_merge_threshold) {
			mode = SortedIteratorMode::LINEAR_SCAN;
			InitializeLinearScan();
		} else {
			mode = SortedIteratorMode::HEAP_MERGE;
			InitializeHeapMerge();
		}
		EXTSORT_LOG(*logger, SortLogType, "merge", SortedIteratorModeToString(mode));
	}

	//! Total number of records the iterator produces
	idx_t SortedCount() const {
		return count;
	}
	//! Number of segments on disk, 0 if everything fit in memory
	idx_t DiskSegmentCount() const {
		return segments.size();
	}
	SortedIteratorMode Mode() const {
		return mode;
	}

	//! Fetches the next record. Returns ITEM and fills result, FINISHED once the output is exhausted, or ERROR and
	//! fills error when a segment could not be decoded. The records a segment produced before the failure are all
	//! returned before the error; the failed segment contributes nothing afterwards and fetching may continue.
	SortFetchResult Fetch(T &result, ErrorData &error) {
		if (!pending_errors.empty()) {
			error = std::move(pending_errors.front());
			pending_errors.pop_front();
			return SortFetchResult::ERROR;
		}
		switch (mode) {
		case SortedIteratorMode::PASSTHROUGH:
			return FetchPassThrough(result);
		case SortedIteratorMode::LINEAR_SCAN:
			return FetchLinearScan(result);
		case SortedIteratorMode::HEAP_MERGE:
			return FetchHeapMerge(result);
		default:
			throw InternalException("Unsupported SortedIteratorMode");
		}
	}

	//! Fetches the next record, returns false once the output is exhausted. Decode errors are thrown.
	bool Next(T &result) {
		ErrorData error;
		switch (Fetch(result, error)) {
		case SortFetchResult::ITEM:
			return true;
		case SortFetchResult::FINISHED:
			return false;
		default:
			error.Throw();
		}
	}

	//! Drains the iterator into a vector, throwing on the first decode error
	vector<T> ToVector() {
		vector<T> result;
		T item;
		while (Next(item)) {
			result.push_back(std::move(item));
		}
		return result;
	}

private:
	SortFetchResult FetchPassThrough(T &result) {
		if (pass_through_position >= pass_through.size()) {
			return SortFetchResult::FINISHED;
		}
		result = std::move(pass_through[pass_through_position++]);
		return SortFetchResult::ITEM;
	}

	//===--------------------------------------------------------------------===//
	// Linear Scan
	//===--------------------------------------------------------------------===//
	void InitializeLinearScan() {
		heads.resize(segments.size());
		for (idx_t segment_idx = 0; segment_idx < segments.size(); segment_idx++) {
			ReadHead(segment_idx);
		}
	}

	//! Decodes the next record of a segment into its head slot, a decode failure is queued as a pending error
	void ReadHead(idx_t segment_idx) {
		auto &head = heads[segment_idx];
		try {
			head.has_item = segments[segment_idx]->Read(head.item);
			if (!head.has_item) {
				EXTSORT_LOG(*logger, SortLogType, "segment_exhausted", segment_idx,
				            segments[segment_idx]->ReadCount(), segments[segment_idx]->SizeInBytes());
			}
		} catch (std::exception &ex) {
			head.has_item = false;
			RetireSegment(segment_idx, ErrorData(ex));
		}
	}

	SortFetchResult FetchLinearScan(T &result) {
		// the first minimum wins ties
		idx_t smallest = DConstants::INVALID_INDEX;
		for (idx_t segment_idx = 0; segment_idx < heads.size(); segment_idx++) {
			if (!heads[segment_idx].has_item) {
				continue;
			}
			if (smallest == DConstants::INVALID_INDEX ||
			    comparator->LessThan(heads[segment_idx].item, heads[smallest].item)) {
				smallest = segment_idx;
			}
		}
		if (smallest == DConstants::INVALID_INDEX) {
			return SortFetchResult::FINISHED;
		}
		result = std::move(heads[smallest].item);
		ReadHead(smallest);
		return SortFetchResult::ITEM;
	}

	//===--------------------------------------------------------------------===//
	// Heap Merge
	//===--------------------------------------------------------------------===//
	void InitializeHeapMerge() {
		live_counts.resize(segments.size(), 0);
		segment_done.resize(segments.size(), false);
		segment_errors.resize(segments.size());
		RefillDepletedSegments();
	}

	//! Refills every segment that has no candidates left in the heap and is not done yet
	void RefillDepletedSegments() {
		for (idx_t segment_idx = 0; segment_idx < segments.size(); segment_idx++) {
			if (live_counts[segment_idx] == 0 && !segment_done[segment_idx]) {
				RefillSegment(segment_idx);
			}
		}
	}

	void RefillSegment(idx_t segment_idx) {
		auto &segment = *segments[segment_idx];
		try {
			for (idx_t read = 0; read < heap_refill_size; read++) {
				T item;
				if (!segment.Read(item)) {
					segment_done[segment_idx] = true;
					EXTSORT_LOG(*logger, SortLogType, "segment_exhausted", segment_idx, segment.ReadCount(),
					            segment.SizeInBytes());
					break;
				}
				heap.emplace_back(std::move(item), segment_idx);
				std::push_heap(heap.begin(), heap.end(), heap_compare);
				live_counts[segment_idx]++;
			}
		} catch (std::exception &ex) {
			segment_done[segment_idx] = true;
			segment_errors[segment_idx] = ErrorData(ex);
		}
		if (live_counts[segment_idx] == 0 && segment_errors[segment_idx].HasError()) {
			// nothing of this segment is left in the heap: the error is next in line
			RetireSegment(segment_idx, std::move(segment_errors[segment_idx]));
			segment_errors[segment_idx].Reset();
		}
	}

	SortFetchResult FetchHeapMerge(T &result) {
		if (heap.empty()) {
			return SortFetchResult::FINISHED;
		}
		std::pop_heap(heap.begin(), heap.end(), heap_compare);
		auto segment_idx = heap.back().segment;
		result = std::move(heap.back().item);
		heap.pop_back();

		D_ASSERT(live_counts[segment_idx] > 0);
		live_counts[segment_idx]--;
		if (live_counts[segment_idx] == 0) {
			if (segment_errors[segment_idx].HasError()) {
				RetireSegment(segment_idx, std::move(segment_errors[segment_idx]));
				segment_errors[segment_idx].Reset();
			} else {
				RefillDepletedSegments();
			}
		}
		return SortFetchResult::ITEM;
	}

	void RetireSegment(idx_t segment_idx, ErrorData error) {
		EXTSORT_LOG_WARN(*logger, "Failed to decode record %llu of segment %llu: %s",
		                 segments[segment_idx]->ReadCount() + 1, segment_idx, error.Message());
		pending_errors.push_back(std::move(error));
	}

private:
	//! The directory and the segment readers refer to the file system
	shared_ptr<FileSystem> file_system;
	//! Keeps the log manager alive for as long as the logger is used
	shared_ptr<LogManager> log_manager;
	shared_ptr<Logger> logger;
	//! Destroyed after the segments, so that every file is closed before the directory is removed
	unique_ptr<SortDirectory> directory;
	vector<unique_ptr<SortSegment>> segments;
	idx_t count;
	shared_ptr<const SortComparator<T>> comparator;
	SortedIteratorMode mode;

	//! Errors that are returned before any further record
	std::deque<ErrorData> pending_errors;

	//! PASSTHROUGH
	vector<T> pass_through;
	idx_t pass_through_position;

	//! LINEAR_SCAN
	vector<LinearScanHead> heads;

	//! HEAP_MERGE
	vector<HeapEntry> heap;
	HeapEntryCompare heap_compare;
	idx_t heap_refill_size;
	vector<idx_t> live_counts;
	vector<bool> segment_done;
	vector<ErrorData> segment_errors;
};

} // namespace extsort
