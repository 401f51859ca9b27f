//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/constants.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace extsort {

//! inline std directives that we use frequently
using std::move;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::unordered_map;
using std::unordered_set;
using std::vector;
using std::lock_guard;
using std::unique_lock;

//! Owning array without bounds checks, for raw byte buffers
template <class T>
using unsafe_unique_array = std::unique_ptr<T[]>;

#ifndef EXTSORT_API
#define EXTSORT_API
#endif

//! Index type, used for all counts and offsets
typedef uint64_t idx_t;

//! Type used for raw bytes
typedef uint8_t data_t;
typedef data_t *data_ptr_t;
typedef const data_t *const_data_ptr_t;

struct DConstants {
	//! The value used to signify an invalid index entry
	static constexpr const idx_t INVALID_INDEX = idx_t(-1);
};

//! The size of the buffer used by the buffered file reader and writer
static constexpr const idx_t FILE_BUFFER_SIZE = 4096;

template <class SRC>
data_ptr_t data_ptr_cast(SRC *src) {
	return reinterpret_cast<data_ptr_t>(src);
}

template <class SRC>
const_data_ptr_t const_data_ptr_cast(const SRC *src) {
	return reinterpret_cast<const_data_ptr_t>(src);
}

} // namespace extsort
