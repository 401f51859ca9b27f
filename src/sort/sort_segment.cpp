#include "extsort/sort/sort_segment.hpp"

namespace extsort {

SortSegment::SortSegment(FileSystem &fs, idx_t index, string path_p, idx_t count, idx_t size_in_bytes)
    : index(index), path(std::move(path_p)), count(count), size_in_bytes(size_in_bytes), read_count(0) {
	reader = make_uniq<BufferedFileReader>(fs, path.c_str());
}

} // namespace extsort
