//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/serializer/buffered_file_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"
#include "extsort/common/serializer/read_stream.hpp"

namespace extsort {

class BufferedFileReader : public ReadStream {
public:
	EXTSORT_API BufferedFileReader(FileSystem &fs, const char *path, FileLockType lock_type = FileLockType::READ_LOCK);

	FileSystem &fs;
	unsafe_unique_array<data_t> data;
	idx_t offset;
	idx_t read_data;
	unique_ptr<FileHandle> handle;

public:
	EXTSORT_API void ReadData(data_ptr_t buffer, idx_t read_size) override;
	//! Returns true if the underlying file has been fully read to completion
	EXTSORT_API bool Finished() override;
	idx_t FileSize() {
		return file_size;
	}

private:
	idx_t file_size;
	idx_t total_read;
};

} // namespace extsort
