#include "extsort/storage/temporary_directory_handle.hpp"

#include "extsort/common/assert.hpp"
#include "extsort/common/helper.hpp"

namespace extsort {

TemporaryDirectoryHandle::TemporaryDirectoryHandle(FileSystem &fs, string path_p)
    : fs(fs), temp_directory(std::move(path_p)) {
	D_ASSERT(!temp_directory.empty());
	if (!fs.DirectoryExists(temp_directory)) {
		fs.CreateDirectory(temp_directory);
	}
}

unique_ptr<TemporaryDirectoryHandle> TemporaryDirectoryHandle::Create(FileSystem &fs, const string &prefix) {
	auto path = fs.CreateTemporaryDirectory(prefix);
	return make_uniq<TemporaryDirectoryHandle>(fs, std::move(path));
}

TemporaryDirectoryHandle::~TemporaryDirectoryHandle() {
	if (temp_directory.empty() || !fs.DirectoryExists(temp_directory)) {
		return;
	}
	try {
		fs.RemoveDirectory(temp_directory);
	} catch (std::exception &ex) { // NOLINT
		// best effort: the directory is left behind
	}
}

} // namespace extsort
