#include "extsort/common/local_file_system.hpp"

#include "extsort/common/exception.hpp"
#include "extsort/common/helper.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace extsort {

// somehow sometimes this is missing
#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

struct UnixFileHandle : public FileHandle {
public:
	UnixFileHandle(FileSystem &file_system, string path, int fd, FileOpenFlags flags)
	    : FileHandle(file_system, std::move(path), flags), fd(fd) {
	}
	~UnixFileHandle() override {
		UnixFileHandle::Close();
	}

	int fd;

public:
	void Close() override {
		if (fd != -1) {
			close(fd);
			fd = -1;
		}
	};
};

bool LocalFileSystem::FileExists(const string &filename) {
	if (!filename.empty()) {
		auto normalized_file = filename.c_str();
		if (access(normalized_file, 0) == 0) {
			struct stat status;
			stat(normalized_file, &status);
			if (S_ISREG(status.st_mode)) {
				return true;
			}
		}
	}
	// if any condition fails
	return false;
}

unique_ptr<FileHandle> LocalFileSystem::OpenFile(const string &path, FileOpenFlags flags) {
	flags.Verify();

	int open_flags = 0;
	bool open_read = flags.OpenForReading();
	bool open_write = flags.OpenForWriting();
	if (open_read && open_write) {
		open_flags = O_RDWR;
	} else if (open_read) {
		open_flags = O_RDONLY;
	} else {
		open_flags = O_WRONLY;
	}
	open_flags |= O_CLOEXEC;
	if (open_write) {
		if (flags.CreateFileIfNotExists()) {
			open_flags |= O_CREAT;
		} else if (flags.OverwriteExistingFile()) {
			open_flags |= O_CREAT | O_TRUNC;
		}
	}

	int fd = open(path.c_str(), open_flags, 0666);
	if (fd == -1) {
		if (flags.ReturnNullIfNotExists() && errno == ENOENT) {
			return nullptr;
		}
		throw IOException({{"errno", std::to_string(errno)}}, "Cannot open file \"%s\": %s", path, strerror(errno));
	}

	if (flags.Lock() != FileLockType::NO_LOCK) {
		struct flock fl;
		memset(&fl, 0, sizeof fl);
		fl.l_type = flags.Lock() == FileLockType::READ_LOCK ? F_RDLCK : F_WRLCK;
		fl.l_whence = SEEK_SET;
		fl.l_start = 0;
		fl.l_len = 0;
		int rc = fcntl(fd, F_SETLK, &fl);
		if (rc == -1) {
			int retained_errno = errno;
			close(fd);
			throw IOException({{"errno", std::to_string(retained_errno)}}, "Could not set lock on file \"%s\": %s",
			                  path, strerror(retained_errno));
		}
	}
	return make_uniq<UnixFileHandle>(*this, path, fd, flags);
}

int64_t LocalFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	int fd = handle.Cast<UnixFileHandle>().fd;
	int64_t bytes_read = read(fd, buffer, static_cast<size_t>(nr_bytes));
	if (bytes_read == -1) {
		throw IOException({{"errno", std::to_string(errno)}}, "Could not read from file \"%s\": %s", handle.path,
		                  strerror(errno));
	}
	return bytes_read;
}

int64_t LocalFileSystem::Write(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	int fd = handle.Cast<UnixFileHandle>().fd;
	auto write_buffer = data_ptr_cast(buffer);

	auto bytes_to_write = nr_bytes;
	while (bytes_to_write > 0) {
		auto bytes_to_write_this_call = MinValue<idx_t>(idx_t(INT32_MAX), idx_t(bytes_to_write));
		int64_t current_bytes_written = write(fd, write_buffer, bytes_to_write_this_call);
		if (current_bytes_written <= 0) {
			throw IOException({{"errno", std::to_string(errno)}}, "Could not write file \"%s\": %s", handle.path,
			                  strerror(errno));
		}
		write_buffer += current_bytes_written;
		bytes_to_write -= current_bytes_written;
	}
	return nr_bytes;
}

int64_t LocalFileSystem::GetFileSize(FileHandle &handle) {
	int fd = handle.Cast<UnixFileHandle>().fd;
	struct stat s;
	if (fstat(fd, &s) == -1) {
		throw IOException({{"errno", std::to_string(errno)}}, "Failed to get file size for file \"%s\": %s",
		                  handle.path, strerror(errno));
	}
	return s.st_size;
}

bool LocalFileSystem::DirectoryExists(const string &directory) {
	if (!directory.empty()) {
		auto normalized_dir = directory.c_str();
		if (access(normalized_dir, 0) == 0) {
			struct stat status;
			stat(normalized_dir, &status);
			if (S_ISDIR(status.st_mode)) {
				return true;
			}
		}
	}
	// if any condition fails
	return false;
}

void LocalFileSystem::CreateDirectory(const string &directory) {
	struct stat st;

	auto normalized_dir = directory.c_str();
	if (stat(normalized_dir, &st) != 0) {
		/* Directory does not exist. EEXIST for race condition */
		if (mkdir(normalized_dir, 0755) != 0 && errno != EEXIST) {
			throw IOException({{"errno", std::to_string(errno)}}, "Failed to create directory \"%s\": %s", directory,
			                  strerror(errno));
		}
	} else if (!S_ISDIR(st.st_mode)) {
		throw IOException({{"errno", std::to_string(errno)}},
		                  "Failed to create directory \"%s\": path exists but is not a directory!", directory);
	}
}

static int RemoveDirectoryRecursive(const string &path) {
	DIR *d = opendir(path.c_str());
	if (!d) {
		return -1;
	}
	int r = 0;
	struct dirent *p;
	while (!r && (p = readdir(d))) {
		/* Skip the names "." and ".." as we don't want to recurse on them. */
		if (!strcmp(p->d_name, ".") || !strcmp(p->d_name, "..")) {
			continue;
		}
		string child = path + "/" + p->d_name;
		struct stat statbuf;
		r = -1;
		if (!lstat(child.c_str(), &statbuf)) {
			if (S_ISDIR(statbuf.st_mode)) {
				r = RemoveDirectoryRecursive(child);
			} else {
				r = unlink(child.c_str());
			}
		}
	}
	closedir(d);
	if (!r) {
		r = rmdir(path.c_str());
	}
	return r;
}

void LocalFileSystem::RemoveDirectory(const string &directory) {
	if (RemoveDirectoryRecursive(directory) != 0) {
		throw IOException({{"errno", std::to_string(errno)}}, "Could not remove directory \"%s\": %s", directory,
		                  strerror(errno));
	}
}

void LocalFileSystem::RemoveFile(const string &filename) {
	if (std::remove(filename.c_str()) != 0) {
		throw IOException({{"errno", std::to_string(errno)}}, "Could not remove file \"%s\": %s", filename,
		                  strerror(errno));
	}
}

bool LocalFileSystem::ListFiles(const string &directory, const std::function<void(const string &, bool)> &callback) {
	auto dir = opendir(directory.c_str());
	if (!dir) {
		return false;
	}

	// RAII wrapper around DIR to automatically free on exceptions in callback
	std::unique_ptr<DIR, std::function<void(DIR *)>> dir_unique_ptr(dir, [](DIR *d) { closedir(d); });

	struct dirent *ent;
	// loop over all files in the directory
	while ((ent = readdir(dir)) != nullptr) {
		string name = string(ent->d_name);
		// skip . .. and empty files
		if (name.empty() || name == "." || name == "..") {
			continue;
		}
		// now stat the file to figure out if it is a regular file or directory
		string full_path = JoinPath(directory, name);
		struct stat status;
		auto res = stat(full_path.c_str(), &status);
		if (res != 0) {
			continue;
		}
		if (!S_ISREG(status.st_mode) && !S_ISDIR(status.st_mode)) {
			// not a file or directory: skip
			continue;
		}
		// invoke callback
		callback(name, S_ISDIR(status.st_mode));
	}
	return true;
}

string LocalFileSystem::CreateTemporaryDirectory(const string &prefix) {
	auto base = GetTempDirectory();
	if (!DirectoryExists(base)) {
		throw IOException("Temporary directory \"%s\" does not exist", base);
	}
	auto name_template = JoinPath(base, prefix + "XXXXXX");
	vector<char> buffer(name_template.begin(), name_template.end());
	buffer.push_back('\0');
	if (!mkdtemp(buffer.data())) {
		throw IOException({{"errno", std::to_string(errno)}}, "Failed to create temporary directory in \"%s\": %s",
		                  base, strerror(errno));
	}
	return string(buffer.data());
}

} // namespace extsort
