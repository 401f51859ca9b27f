//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/serializer/buffered_file_writer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"
#include "extsort/common/serializer/write_stream.hpp"

namespace extsort {

//! Writes to a file through an internal buffer of FILE_BUFFER_SIZE bytes
class BufferedFileWriter : public WriteStream {
public:
	static constexpr FileOpenFlags DEFAULT_OPEN_FLAGS =
	    FileOpenFlags(FileOpenFlags::FILE_FLAGS_WRITE | FileOpenFlags::FILE_FLAGS_FILE_CREATE);

	//! Opens the file at path for writing, all writes go through the buffer until it fills up or Flush is called
	EXTSORT_API BufferedFileWriter(FileSystem &fs, const string &path, FileOpenFlags open_flags = DEFAULT_OPEN_FLAGS);

	FileSystem &fs;
	string path;
	unsafe_unique_array<data_t> data;
	idx_t offset;
	idx_t total_written;
	unique_ptr<FileHandle> handle;

public:
	EXTSORT_API void WriteData(const_data_ptr_t buffer, idx_t write_size) override;
	//! Flush all changes to the file and then close the file
	EXTSORT_API void Close();
	//! Flush the buffer to the file (without sync)
	EXTSORT_API void Flush();
	EXTSORT_API idx_t GetTotalWritten();
};

} // namespace extsort
