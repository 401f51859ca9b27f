//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/local_file_system.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/file_system.hpp"

namespace extsort {

class LocalFileSystem : public FileSystem {
public:
	unique_ptr<FileHandle> OpenFile(const string &path, FileOpenFlags flags) override;

	//! Read nr_bytes from the specified file into the buffer, moving the file pointer forward by nr_bytes. Returns the
	//! amount of bytes read.
	int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	//! Write nr_bytes from the buffer into the file, moving the file pointer forward by nr_bytes.
	int64_t Write(FileHandle &handle, void *buffer, int64_t nr_bytes) override;

	//! Returns the file size of a file handle, returns -1 on error
	int64_t GetFileSize(FileHandle &handle) override;

	//! Check if a directory exists
	bool DirectoryExists(const string &directory) override;
	//! Create a directory if it does not exist
	void CreateDirectory(const string &directory) override;
	//! Recursively remove a directory and all files in it
	void RemoveDirectory(const string &directory) override;
	//! List files in a directory, invoking the callback method for each one with (filename, is_dir)
	bool ListFiles(const string &directory, const std::function<void(const string &, bool)> &callback) override;
	//! Check if a file exists
	bool FileExists(const string &filename) override;
	//! Remove a file from disk
	void RemoveFile(const string &filename) override;

	//! Creates a fresh directory named <temp dir>/<prefix>XXXXXX through mkdtemp
	string CreateTemporaryDirectory(const string &prefix) override;

	string GetName() const override {
		return "LocalFileSystem";
	}
};

} // namespace extsort
