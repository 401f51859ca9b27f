//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/sort_comparator.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

#include <functional>

namespace extsort {

//! A strict weak ordering over records. Implementations must be free of side effects: the same comparator is used
//! concurrently by the parallel sort workers.
template <class T>
class SortComparator {
public:
	virtual ~SortComparator() {
	}

	//! Returns true if a sorts before b
	virtual bool LessThan(const T &a, const T &b) const = 0;

	bool operator()(const T &a, const T &b) const {
		return LessThan(a, b);
	}
};

//! Orders records with operator<
template <class T>
class NaturalComparator : public SortComparator<T> {
public:
	bool LessThan(const T &a, const T &b) const override {
		return a < b;
	}
};

//! Orders records with an arbitrary "less than" function
template <class T>
class FunctionComparator : public SortComparator<T> {
public:
	typedef std::function<bool(const T &, const T &)> less_function_t;

	explicit FunctionComparator(less_function_t less_p) : less(std::move(less_p)) {
	}

	bool LessThan(const T &a, const T &b) const override {
		return less(a, b);
	}

private:
	less_function_t less;
};

//! Orders records by the natural order of a key derived from each record
template <class T, class KEY_FUNC>
class KeyComparator : public SortComparator<T> {
public:
	explicit KeyComparator(KEY_FUNC key_p) : key(std::move(key_p)) {
	}

	bool LessThan(const T &a, const T &b) const override {
		return key(a) < key(b);
	}

private:
	KEY_FUNC key;
};

} // namespace extsort
