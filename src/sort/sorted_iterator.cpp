#include "extsort/sort/sorted_iterator.hpp"

namespace extsort {

const char *SortedIteratorModeToString(SortedIteratorMode mode) {
	switch (mode) {
	case SortedIteratorMode::PASSTHROUGH:
		return "passthrough";
	case SortedIteratorMode::LINEAR_SCAN:
		return "linear_scan";
	case SortedIteratorMode::HEAP_MERGE:
		return "heap_merge";
	default:
		throw InternalException("Unsupported SortedIteratorMode");
	}
}

} // namespace extsort
