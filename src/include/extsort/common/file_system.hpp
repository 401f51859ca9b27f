//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/file_system.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"
#include "extsort/common/exception.hpp"

#include <functional>

#undef CreateDirectory
#undef MoveFile
#undef RemoveDirectory

namespace extsort {

class FileSystem;

enum class FileLockType : uint8_t { NO_LOCK = 0, READ_LOCK = 1, WRITE_LOCK = 2 };

class FileOpenFlags {
public:
	static constexpr idx_t FILE_FLAGS_READ = idx_t(1 << 0);
	static constexpr idx_t FILE_FLAGS_WRITE = idx_t(1 << 1);
	static constexpr idx_t FILE_FLAGS_FILE_CREATE = idx_t(1 << 2);
	static constexpr idx_t FILE_FLAGS_FILE_CREATE_NEW = idx_t(1 << 3);
	static constexpr idx_t FILE_FLAGS_NULL_IF_NOT_EXISTS = idx_t(1 << 4);

public:
	FileOpenFlags() = default;
	constexpr FileOpenFlags(idx_t flags) : flags(flags) { // NOLINT: allow implicit conversion
	}
	constexpr FileOpenFlags(FileLockType lock) : lock(lock) { // NOLINT: allow implicit conversion
	}
	constexpr FileOpenFlags(idx_t flags, FileLockType lock) : flags(flags), lock(lock) {
	}

	FileOpenFlags operator|(FileOpenFlags b) const {
		FileOpenFlags result;
		result.flags = flags | b.flags;
		if (lock != FileLockType::NO_LOCK && b.lock != FileLockType::NO_LOCK) {
			throw InternalException("Cannot merge file open flags that both have a lock set");
		}
		result.lock = lock != FileLockType::NO_LOCK ? lock : b.lock;
		return result;
	}
	FileOpenFlags &operator|=(FileOpenFlags b) {
		*this = *this | b;
		return *this;
	}

	//! Verifies that the flag combination is valid, throws an InvalidInputException otherwise
	EXTSORT_API void Verify();

	inline bool OpenForReading() const {
		return flags & FILE_FLAGS_READ;
	}
	inline bool OpenForWriting() const {
		return flags & FILE_FLAGS_WRITE;
	}
	inline bool CreateFileIfNotExists() const {
		return flags & FILE_FLAGS_FILE_CREATE;
	}
	inline bool OverwriteExistingFile() const {
		return flags & FILE_FLAGS_FILE_CREATE_NEW;
	}
	inline bool ReturnNullIfNotExists() const {
		return flags & FILE_FLAGS_NULL_IF_NOT_EXISTS;
	}
	inline FileLockType Lock() const {
		return lock;
	}

private:
	idx_t flags = 0;
	FileLockType lock = FileLockType::NO_LOCK;
};

class FileFlags {
public:
	//! Open file with read access
	static constexpr FileOpenFlags FILE_FLAGS_READ = FileOpenFlags(FileOpenFlags::FILE_FLAGS_READ);
	//! Open file with write access
	static constexpr FileOpenFlags FILE_FLAGS_WRITE = FileOpenFlags(FileOpenFlags::FILE_FLAGS_WRITE);
	//! Create file if not exists, can only be used together with WRITE
	static constexpr FileOpenFlags FILE_FLAGS_FILE_CREATE = FileOpenFlags(FileOpenFlags::FILE_FLAGS_FILE_CREATE);
	//! Always create a new file. If a file exists, the file is truncated. Cannot be used together with CREATE.
	static constexpr FileOpenFlags FILE_FLAGS_FILE_CREATE_NEW =
	    FileOpenFlags(FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);
	//! Return NULL if the file does not exist instead of throwing an error
	static constexpr FileOpenFlags FILE_FLAGS_NULL_IF_NOT_EXISTS =
	    FileOpenFlags(FileOpenFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS);
};

struct FileHandle {
public:
	EXTSORT_API FileHandle(FileSystem &file_system, string path, FileOpenFlags flags);
	FileHandle(const FileHandle &) = delete;
	EXTSORT_API virtual ~FileHandle();

	// Read at [nr_bytes] bytes into [buffer], and return the amount of bytes read.
	EXTSORT_API int64_t Read(void *buffer, idx_t nr_bytes);
	EXTSORT_API int64_t Write(void *buffer, idx_t nr_bytes);
	EXTSORT_API idx_t GetFileSize();

	//! Closes the file handle.
	EXTSORT_API virtual void Close() = 0;

	string GetPath() const {
		return path;
	}

	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
	template <class TARGET>
	const TARGET &Cast() const {
		return reinterpret_cast<const TARGET &>(*this);
	}

public:
	FileSystem &file_system;
	string path;
	FileOpenFlags flags;
};

class FileSystem {
public:
	EXTSORT_API virtual ~FileSystem();

public:
	EXTSORT_API static unique_ptr<FileSystem> CreateLocal();

	EXTSORT_API virtual unique_ptr<FileHandle> OpenFile(const string &path, FileOpenFlags flags);

	//! Read nr_bytes from the specified file into the buffer, moving the file pointer forward by nr_bytes. Returns the
	//! amount of bytes read.
	EXTSORT_API virtual int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes);
	//! Write nr_bytes from the buffer into the file, moving the file pointer forward by nr_bytes.
	EXTSORT_API virtual int64_t Write(FileHandle &handle, void *buffer, int64_t nr_bytes);

	//! Returns the file size of a file handle, returns -1 on error
	EXTSORT_API virtual int64_t GetFileSize(FileHandle &handle);

	//! Check if a directory exists
	EXTSORT_API virtual bool DirectoryExists(const string &directory);
	//! Create a directory if it does not exist
	EXTSORT_API virtual void CreateDirectory(const string &directory);
	//! Recursively remove a directory and all files in it
	EXTSORT_API virtual void RemoveDirectory(const string &directory);
	//! List files in a directory, invoking the callback method for each one with (filename, is_dir)
	EXTSORT_API virtual bool ListFiles(const string &directory,
	                                   const std::function<void(const string &, bool)> &callback);
	//! Check if a file exists
	EXTSORT_API virtual bool FileExists(const string &filename);
	//! Remove a file from disk
	EXTSORT_API virtual void RemoveFile(const string &filename);

	//! Returns the directory in which temporary directories are created
	EXTSORT_API virtual string GetTempDirectory();
	//! Creates a new, uniquely named directory inside GetTempDirectory() and returns its path
	EXTSORT_API virtual string CreateTemporaryDirectory(const string &prefix);

	//! Path separator for path
	EXTSORT_API virtual string PathSeparator(const string &path);
	//! Join two paths together
	EXTSORT_API string JoinPath(const string &a, const string &path);

	//! Return the name of the filesytem. Used for forming diagnosis messages.
	EXTSORT_API virtual string GetName() const = 0;
};

} // namespace extsort
