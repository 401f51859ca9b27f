//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/serializer/read_stream.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

#include <type_traits>

namespace extsort {

class ReadStream {
public:
	// Delete copy constructor
	ReadStream(const ReadStream &) = delete;

	ReadStream() = default;
	virtual ~ReadStream() = default;

	//! Reads a set amount of data from the stream into the specified buffer and moves the stream forward accordingly.
	//! Throws a SerializationException if the stream ends before read_size bytes could be read.
	virtual void ReadData(data_ptr_t buffer, idx_t read_size) = 0;

	//! Returns true if every byte of the stream has been consumed
	virtual bool Finished() = 0;

	//! Reads a type from the stream and moves the stream forward sizeof(T) bytes
	//! The type must be a standard layout type
	template <class T>
	T Read() {
		static_assert(std::is_standard_layout<T>(), "Read element must be a standard layout data type");
		T value;
		ReadData(data_ptr_cast(&value), sizeof(T));
		return value;
	}
};

} // namespace extsort
