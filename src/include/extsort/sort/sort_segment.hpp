//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/sort_segment.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"
#include "extsort/common/serializer/buffered_file_reader.hpp"
#include "extsort/common/serializer/buffered_file_writer.hpp"
#include "extsort/common/helper.hpp"
#include "extsort/sort/sort_codec.hpp"

#include <iterator>

namespace extsort {

//! A sorted run of records on disk. Segments are written once by SortSegment::Write and are read sequentially
//! afterwards, the read handle stays open for the lifetime of the segment.
class SortSegment {
public:
	EXTSORT_API SortSegment(FileSystem &fs, idx_t index, string path, idx_t count, idx_t size_in_bytes);

	//! Encodes [begin, end) into a new file at path, truncating any existing file, and returns the opened segment
	template <class ITERATOR>
	static unique_ptr<SortSegment> Write(FileSystem &fs, idx_t index, const string &path, ITERATOR begin,
	                                     ITERATOR end) {
		BufferedFileWriter writer(fs, path, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
		idx_t count = 0;
		for (auto it = begin; it != end; ++it) {
			SortCodec<typename std::iterator_traits<ITERATOR>::value_type>::Encode(*it, writer);
			count++;
		}
		writer.Close();
		return make_uniq<SortSegment>(fs, index, path, count, writer.GetTotalWritten());
	}

	//! Decodes the next record, returns false once the segment is exhausted
	template <class T>
	bool Read(T &result) {
		if (!SortCodec<T>::Decode(*reader, result)) {
			return false;
		}
		read_count++;
		return true;
	}

	idx_t GetIndex() const {
		return index;
	}
	const string &GetPath() const {
		return path;
	}
	//! Number of records written to the segment
	idx_t Count() const {
		return count;
	}
	//! Number of records decoded so far
	idx_t ReadCount() const {
		return read_count;
	}
	idx_t SizeInBytes() const {
		return size_in_bytes;
	}

private:
	idx_t index;
	string path;
	idx_t count;
	idx_t size_in_bytes;
	idx_t read_count;
	unique_ptr<BufferedFileReader> reader;
};

} // namespace extsort
