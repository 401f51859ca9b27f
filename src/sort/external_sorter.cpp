#include "extsort/sort/external_sorter.hpp"

namespace extsort {

ExternalSorter::ExternalSorter() {
}

ExternalSorter::ExternalSorter(ExternalSortConfig config_p) : config(std::move(config_p)) {
}

ExternalSorter &ExternalSorter::WithSegmentSize(idx_t segment_size) {
	config.segment_size = segment_size;
	return *this;
}

ExternalSorter &ExternalSorter::WithSortDirectory(const string &directory) {
	config.sort_directory = directory;
	return *this;
}

ExternalSorter &ExternalSorter::WithParallelSort(bool parallel_sort) {
	config.parallel_sort = parallel_sort;
	return *this;
}

ExternalSorter &ExternalSorter::WithHeapMergeThreshold(idx_t threshold) {
	config.heap_merge_threshold = threshold;
	return *this;
}

ExternalSorter &ExternalSorter::WithHeapRefillSize(idx_t refill_size) {
	config.heap_refill_size = refill_size;
	return *this;
}

ExternalSorter &ExternalSorter::WithThreads(idx_t thread_count) {
	config.thread_count = thread_count;
	return *this;
}

ExternalSorter &ExternalSorter::WithTempDirectoryPrefix(const string &prefix) {
	config.temp_directory_prefix = prefix;
	return *this;
}

ExternalSorter &ExternalSorter::WithLogManager(shared_ptr<LogManager> log_manager) {
	config.log_manager = std::move(log_manager);
	return *this;
}

ExternalSorter &ExternalSorter::WithFileSystem(shared_ptr<FileSystem> file_system) {
	config.file_system = std::move(file_system);
	return *this;
}

void ExternalSorter::SetOptionByName(const string &name, const string &value) {
	config.SetOptionByName(name, value);
}

const ExternalSortConfig &ExternalSorter::GetConfig() const {
	return config;
}

} // namespace extsort
