//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/parallel_sort.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"
#include "extsort/common/helper.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>

namespace extsort {

//! Sorts a vector with multiple threads: the vector is cut into contiguous ranges that are sorted independently,
//! after which neighbouring ranges are merged pairwise until one sorted range remains
class ParallelSort {
public:
	//! Ranges smaller than this are not worth a thread of their own
	static constexpr const idx_t MINIMUM_PARALLEL_SIZE = 4096;

	template <class T, class COMPARATOR>
	static void Sort(vector<T> &data, const COMPARATOR &comparator, idx_t thread_count) {
		auto less = [&comparator](const T &a, const T &b) { return comparator(a, b); };
		auto range_count = GetRangeCount(data.size(), thread_count);
		if (range_count <= 1) {
			std::sort(data.begin(), data.end(), less);
			return;
		}
		vector<idx_t> bounds;
		for (idx_t range = 0; range <= range_count; range++) {
			bounds.push_back(data.size() * range / range_count);
		}

		// sort every range on its own
		vector<std::function<void()>> tasks;
		for (idx_t range = 0; range < range_count; range++) {
			auto begin = data.begin() + static_cast<std::ptrdiff_t>(bounds[range]);
			auto end = data.begin() + static_cast<std::ptrdiff_t>(bounds[range + 1]);
			tasks.push_back([begin, end, less]() { std::sort(begin, end, less); });
		}
		RunTasks(tasks);

		// merge neighbouring ranges, doubling the width of the sorted ranges every round
		for (idx_t width = 1; width < range_count; width *= 2) {
			tasks.clear();
			for (idx_t range = 0; range + width < range_count; range += 2 * width) {
				auto begin = data.begin() + static_cast<std::ptrdiff_t>(bounds[range]);
				auto middle = data.begin() + static_cast<std::ptrdiff_t>(bounds[range + width]);
				auto end = data.begin() + static_cast<std::ptrdiff_t>(bounds[MinValue(range + 2 * width, range_count)]);
				tasks.push_back([begin, middle, end, less]() { std::inplace_merge(begin, middle, end, less); });
			}
			RunTasks(tasks);
		}
	}

	//! Number of ranges the data is split into, 1 means sort on the calling thread
	EXTSORT_API static idx_t GetRangeCount(idx_t count, idx_t thread_count);
	//! Runs each task on its own thread and waits for all of them. If any task throws, the first exception (in task
	//! order) is rethrown once every thread has been joined.
	EXTSORT_API static void RunTasks(vector<std::function<void()>> &tasks);
};

} // namespace extsort
