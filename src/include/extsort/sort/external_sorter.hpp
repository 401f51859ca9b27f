//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/external_sorter.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/helper.hpp"
#include "extsort/sort/external_sort_config.hpp"
#include "extsort/sort/push_external_sorter.hpp"
#include "extsort/sort/sort_comparator.hpp"
#include "extsort/sort/sorted_iterator.hpp"

#include <iterator>

namespace extsort {

//! Entry point of the library. Holds the configuration and creates sorts from it, either one-shot over an input range
//! or incrementally through a PushExternalSorter.
class ExternalSorter {
public:
	EXTSORT_API ExternalSorter();
	EXTSORT_API explicit ExternalSorter(ExternalSortConfig config);

	EXTSORT_API ExternalSorter &WithSegmentSize(idx_t segment_size);
	EXTSORT_API ExternalSorter &WithSortDirectory(const string &directory);
	EXTSORT_API ExternalSorter &WithParallelSort(bool parallel_sort = true);
	EXTSORT_API ExternalSorter &WithHeapMergeThreshold(idx_t threshold);
	EXTSORT_API ExternalSorter &WithHeapRefillSize(idx_t refill_size);
	EXTSORT_API ExternalSorter &WithThreads(idx_t thread_count);
	EXTSORT_API ExternalSorter &WithTempDirectoryPrefix(const string &prefix);
	EXTSORT_API ExternalSorter &WithLogManager(shared_ptr<LogManager> log_manager);
	EXTSORT_API ExternalSorter &WithFileSystem(shared_ptr<FileSystem> file_system);

	EXTSORT_API void SetOptionByName(const string &name, const string &value);
	EXTSORT_API const ExternalSortConfig &GetConfig() const;

public:
	//===--------------------------------------------------------------------===//
	// Incremental sorts
	//===--------------------------------------------------------------------===//
	template <class T>
	unique_ptr<PushExternalSorter<T>> PusherWith(shared_ptr<const SortComparator<T>> comparator) const {
		return make_uniq<PushExternalSorter<T>>(config, std::move(comparator));
	}

	template <class T>
	unique_ptr<PushExternalSorter<T>> Pusher() const {
		return PusherWith<T>(make_shared_ptr<NaturalComparator<T>>());
	}

	template <class T>
	unique_ptr<PushExternalSorter<T>> PusherBy(typename FunctionComparator<T>::less_function_t less) const {
		return PusherWith<T>(make_shared_ptr<FunctionComparator<T>>(std::move(less)));
	}

	template <class T, class KEY_FUNC>
	unique_ptr<PushExternalSorter<T>> PusherByKey(KEY_FUNC key) const {
		return PusherWith<T>(make_shared_ptr<KeyComparator<T, KEY_FUNC>>(std::move(key)));
	}

	//===--------------------------------------------------------------------===//
	// One-shot sorts
	//===--------------------------------------------------------------------===//
	template <class ITERATOR>
	unique_ptr<SortedIterator<typename std::iterator_traits<ITERATOR>::value_type>>
	SortWith(ITERATOR begin, ITERATOR end,
	         shared_ptr<const SortComparator<typename std::iterator_traits<ITERATOR>::value_type>> comparator) const {
		typedef typename std::iterator_traits<ITERATOR>::value_type T;
		auto sorter = PusherWith<T>(std::move(comparator));
		sorter->PushRange(begin, end);
		return sorter->Done();
	}

	template <class CONTAINER>
	unique_ptr<SortedIterator<typename CONTAINER::value_type>>
	SortWith(const CONTAINER &items, shared_ptr<const SortComparator<typename CONTAINER::value_type>> comparator) const {
		return SortWith(items.begin(), items.end(), std::move(comparator));
	}

	//! Sorts with operator<
	template <class ITERATOR>
	unique_ptr<SortedIterator<typename std::iterator_traits<ITERATOR>::value_type>> Sort(ITERATOR begin,
	                                                                                     ITERATOR end) const {
		typedef typename std::iterator_traits<ITERATOR>::value_type T;
		return SortWith(begin, end, make_shared_ptr<NaturalComparator<T>>());
	}

	template <class CONTAINER>
	unique_ptr<SortedIterator<typename CONTAINER::value_type>> Sort(const CONTAINER &items) const {
		return Sort(items.begin(), items.end());
	}

	//! Sorts with a "less than" function
	template <class ITERATOR>
	unique_ptr<SortedIterator<typename std::iterator_traits<ITERATOR>::value_type>>
	SortBy(ITERATOR begin, ITERATOR end,
	       typename FunctionComparator<typename std::iterator_traits<ITERATOR>::value_type>::less_function_t less)
	    const {
		typedef typename std::iterator_traits<ITERATOR>::value_type T;
		return SortWith(begin, end, make_shared_ptr<FunctionComparator<T>>(std::move(less)));
	}

	template <class CONTAINER>
	unique_ptr<SortedIterator<typename CONTAINER::value_type>>
	SortBy(const CONTAINER &items,
	       typename FunctionComparator<typename CONTAINER::value_type>::less_function_t less) const {
		return SortBy(items.begin(), items.end(), std::move(less));
	}

	//! Sorts by the natural order of a key derived from each record
	template <class ITERATOR, class KEY_FUNC>
	unique_ptr<SortedIterator<typename std::iterator_traits<ITERATOR>::value_type>>
	SortByKey(ITERATOR begin, ITERATOR end, KEY_FUNC key) const {
		typedef typename std::iterator_traits<ITERATOR>::value_type T;
		return SortWith(begin, end, make_shared_ptr<KeyComparator<T, KEY_FUNC>>(std::move(key)));
	}

	template <class CONTAINER, class KEY_FUNC>
	unique_ptr<SortedIterator<typename CONTAINER::value_type>> SortByKey(const CONTAINER &items, KEY_FUNC key) const {
		return SortByKey(items.begin(), items.end(), std::move(key));
	}

private:
	ExternalSortConfig config;
};

} // namespace extsort
