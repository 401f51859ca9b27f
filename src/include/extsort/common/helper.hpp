//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

#include <cstring>
#include <type_traits>

namespace extsort {

template <class T, class... ARGS>
unique_ptr<T> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<T>(new T(std::forward<ARGS>(args)...));
}

template <class DATA_TYPE>
inline unsafe_unique_array<DATA_TYPE> make_unsafe_uniq_array(size_t n) { // NOLINT: mimic std style
	return unsafe_unique_array<DATA_TYPE>(new DATA_TYPE[n]);
}

template <class T, class... ARGS>
shared_ptr<T> make_shared_ptr(ARGS &&...args) { // NOLINT: mimic std style
	return std::make_shared<T>(std::forward<ARGS>(args)...);
}

template <class T>
T MaxValue(T a, T b) {
	return a > b ? a : b;
}

template <class T>
T MinValue(T a, T b) {
	return a < b ? a : b;
}

template <class T>
const T Load(const_data_ptr_t ptr) {
	T ret;
	memcpy(&ret, ptr, sizeof(ret)); // NOLINT
	return ret;
}

template <class T>
void Store(const T &val, data_ptr_t ptr) {
	memcpy(ptr, (void *)&val, sizeof(val)); // NOLINT
}

} // namespace extsort
