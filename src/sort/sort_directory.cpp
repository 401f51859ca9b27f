#include "extsort/sort/sort_directory.hpp"

#include "extsort/common/helper.hpp"
#include "extsort/logging/logger.hpp"

namespace extsort {

SortDirectory::SortDirectory(FileSystem &fs, shared_ptr<Logger> logger_p, string caller_directory_p,
                             string temp_directory_prefix_p)
    : fs(fs), logger(std::move(logger_p)), caller_directory(std::move(caller_directory_p)),
      temp_directory_prefix(std::move(temp_directory_prefix_p)), created(false) {
}

SortDirectory::~SortDirectory() {
	if (temp_directory) {
		EXTSORT_LOG(*logger, SortLogType, "remove_directory", path);
		temp_directory.reset();
	}
}

const string &SortDirectory::GetPath() {
	if (created) {
		return path;
	}
	if (caller_directory.empty()) {
		temp_directory = TemporaryDirectoryHandle::Create(fs, temp_directory_prefix);
		path = temp_directory->GetPath();
		EXTSORT_LOG(*logger, SortLogType, "create_temp_directory", path);
	} else {
		if (!fs.DirectoryExists(caller_directory)) {
			fs.CreateDirectory(caller_directory);
		}
		path = caller_directory;
		EXTSORT_LOG(*logger, SortLogType, "use_directory", path);
	}
	created = true;
	return path;
}

string SortDirectory::GetSegmentPath(idx_t segment_index) {
	return fs.JoinPath(GetPath(), std::to_string(segment_index));
}

} // namespace extsort
