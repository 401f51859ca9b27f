//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/storage/temporary_directory_handle.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"

namespace extsort {

//! Owns a directory on disk: the directory is created if it does not exist yet, and removed together with
//! everything in it when the handle is destroyed
class TemporaryDirectoryHandle {
public:
	//! Takes ownership of the given directory, creating it if needed
	EXTSORT_API TemporaryDirectoryHandle(FileSystem &fs, string path_p);
	//! Creates a fresh, uniquely named directory in the file system's temp directory
	EXTSORT_API static unique_ptr<TemporaryDirectoryHandle> Create(FileSystem &fs, const string &prefix);
	EXTSORT_API ~TemporaryDirectoryHandle();

	const string &GetPath() const {
		return temp_directory;
	}

private:
	FileSystem &fs;
	string temp_directory;
};

} // namespace extsort
