#include "extsort/common/file_system.hpp"

#include "extsort/common/exception.hpp"
#include "extsort/common/helper.hpp"
#include "extsort/common/local_file_system.hpp"
#include "extsort/common/string_util.hpp"

#include <cstdlib>

namespace extsort {

constexpr FileOpenFlags FileFlags::FILE_FLAGS_READ;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_WRITE;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_FILE_CREATE;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_FILE_CREATE_NEW;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS;

void FileOpenFlags::Verify() {
	bool is_read = flags & FileOpenFlags::FILE_FLAGS_READ;
	bool is_write = flags & FileOpenFlags::FILE_FLAGS_WRITE;
	bool is_create =
	    (flags & FileOpenFlags::FILE_FLAGS_FILE_CREATE) || (flags & FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);

	// require either READ or WRITE (or both)
	if (!is_read && !is_write) {
		throw InvalidInputException("READ, WRITE or both should be specified when opening a file");
	}
	// CREATE flags require writing
	if (!is_write && is_create) {
		throw InvalidInputException("CREATE flags can only be used when opening a file for writing");
	}
	// cannot combine CREATE and CREATE_NEW flags
	if ((flags & FileOpenFlags::FILE_FLAGS_FILE_CREATE) && (flags & FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW)) {
		throw InvalidInputException("CREATE and CREATE_NEW flags cannot be combined");
	}
}

unique_ptr<FileSystem> FileSystem::CreateLocal() {
	return make_uniq<LocalFileSystem>();
}

FileSystem::~FileSystem() {
}

string FileSystem::PathSeparator(const string &path) {
	return "/";
}

string FileSystem::JoinPath(const string &a, const string &b) {
	if (a.empty()) {
		return b;
	}
	auto separator = PathSeparator(a);
	if (StringUtil::EndsWith(a, separator)) {
		return a + b;
	}
	return a + separator + b;
}

unique_ptr<FileHandle> FileSystem::OpenFile(const string &path, FileOpenFlags flags) {
	throw NotImplementedException("%s: OpenFile is not implemented!", GetName());
}

int64_t FileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	throw NotImplementedException("%s: Read is not implemented!", GetName());
}

int64_t FileSystem::Write(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	throw NotImplementedException("%s: Write is not implemented!", GetName());
}

int64_t FileSystem::GetFileSize(FileHandle &handle) {
	throw NotImplementedException("%s: GetFileSize is not implemented!", GetName());
}

bool FileSystem::DirectoryExists(const string &directory) {
	throw NotImplementedException("%s: DirectoryExists is not implemented!", GetName());
}

void FileSystem::CreateDirectory(const string &directory) {
	throw NotImplementedException("%s: CreateDirectory is not implemented!", GetName());
}

void FileSystem::RemoveDirectory(const string &directory) {
	throw NotImplementedException("%s: RemoveDirectory is not implemented!", GetName());
}

bool FileSystem::ListFiles(const string &directory, const std::function<void(const string &, bool)> &callback) {
	throw NotImplementedException("%s: ListFiles is not implemented!", GetName());
}

bool FileSystem::FileExists(const string &filename) {
	throw NotImplementedException("%s: FileExists is not implemented!", GetName());
}

void FileSystem::RemoveFile(const string &filename) {
	throw NotImplementedException("%s: RemoveFile is not implemented!", GetName());
}

string FileSystem::GetTempDirectory() {
	const char *tmp = std::getenv("TMPDIR");
	if (tmp && tmp[0] != '\0') {
		return string(tmp);
	}
	return "/tmp";
}

string FileSystem::CreateTemporaryDirectory(const string &prefix) {
	throw NotImplementedException("%s: CreateTemporaryDirectory is not implemented!", GetName());
}

FileHandle::FileHandle(FileSystem &file_system, string path_p, FileOpenFlags flags)
    : file_system(file_system), path(std::move(path_p)), flags(flags) {
}

FileHandle::~FileHandle() {
}

int64_t FileHandle::Read(void *buffer, idx_t nr_bytes) {
	return file_system.Read(*this, buffer, static_cast<int64_t>(nr_bytes));
}

int64_t FileHandle::Write(void *buffer, idx_t nr_bytes) {
	return file_system.Write(*this, buffer, static_cast<int64_t>(nr_bytes));
}

idx_t FileHandle::GetFileSize() {
	auto size = file_system.GetFileSize(*this);
	if (size < 0) {
		throw IOException("Could not get file size of file \"%s\"", path);
	}
	return static_cast<idx_t>(size);
}

} // namespace extsort
