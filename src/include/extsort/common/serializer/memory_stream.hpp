//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/serializer/memory_stream.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/serializer/read_stream.hpp"
#include "extsort/common/serializer/write_stream.hpp"

namespace extsort {

//! A growable in-memory buffer that can be written to and read back from
class MemoryStream : public WriteStream, public ReadStream {
public:
	EXTSORT_API explicit MemoryStream(idx_t capacity = 512);

	//! Write data to the stream.
	//! Grows the buffer as needed
	EXTSORT_API void WriteData(const_data_ptr_t buffer, idx_t write_size) override;

	//! Read data from the stream.
	//! Throws if the read would exceed the written data
	EXTSORT_API void ReadData(data_ptr_t buffer, idx_t read_size) override;

	//! Returns true once the read position has reached the end of the written data
	EXTSORT_API bool Finished() override;

	//! Rewind the stream to the start, keeping the written data
	EXTSORT_API void Rewind();

	//! Get the number of bytes written to the stream
	EXTSORT_API idx_t GetSize() const;

	//! Get the current read position in the stream
	EXTSORT_API idx_t GetPosition() const;

private:
	vector<data_t> data;
	idx_t position;
};

} // namespace extsort
