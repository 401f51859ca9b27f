//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/sort_directory.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"
#include "extsort/storage/temporary_directory_handle.hpp"

namespace extsort {

class Logger;

//! The directory segment files of one sort are written to. Nothing touches the file system until GetPath() is called
//! for the first time. A caller supplied directory is created if it does not exist and is never removed; otherwise a
//! fresh temporary directory is created and removed again, with all segment files in it, when this object is
//! destroyed.
class SortDirectory {
public:
	EXTSORT_API SortDirectory(FileSystem &fs, shared_ptr<Logger> logger, string caller_directory,
	                          string temp_directory_prefix);
	EXTSORT_API ~SortDirectory();

	//! Returns the directory, creating it first if this is the first call
	EXTSORT_API const string &GetPath();
	//! Path of the segment file with the given index
	EXTSORT_API string GetSegmentPath(idx_t segment_index);

	//! Whether or not GetPath() has been called
	bool IsCreated() const {
		return created;
	}
	//! Whether or not the directory is removed on destruction
	bool IsTemporary() const {
		return caller_directory.empty();
	}

private:
	FileSystem &fs;
	shared_ptr<Logger> logger;
	string caller_directory;
	string temp_directory_prefix;
	unique_ptr<TemporaryDirectoryHandle> temp_directory;
	string path;
	bool created;
};

} // namespace extsort
