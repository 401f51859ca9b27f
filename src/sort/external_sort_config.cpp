#include "extsort/sort/external_sort_config.hpp"

#include "extsort/common/exception.hpp"
#include "extsort/common/string_util.hpp"
#include "extsort/logging/log_manager.hpp"

#include <cerrno>
#include <cstdlib>
#include <thread>

namespace extsort {

constexpr const idx_t ExternalSortConfig::DEFAULT_SEGMENT_SIZE;
constexpr const idx_t ExternalSortConfig::DEFAULT_HEAP_MERGE_THRESHOLD;
constexpr const idx_t ExternalSortConfig::DEFAULT_HEAP_REFILL_SIZE;

static const char *const internal_options[] = {"segment_size",
                                               "sort_directory",
                                               "parallel_sort",
                                               "heap_merge_threshold",
                                               "heap_refill_size",
                                               "threads",
                                               "temp_directory_prefix",
                                               nullptr};

static idx_t ParseUnsigned(const string &name, const string &input) {
	auto value = input;
	StringUtil::Trim(value);
	if (value.empty()) {
		throw InvalidConfigurationException("Option \"%s\" expects an unsigned integer, got an empty value", name);
	}
	for (auto c : value) {
		if (!StringUtil::CharacterIsDigit(c)) {
			throw InvalidConfigurationException("Option \"%s\" expects an unsigned integer, got \"%s\"", name, input);
		}
	}
	errno = 0;
	char *end = nullptr;
	auto result = std::strtoull(value.c_str(), &end, 10);
	if (errno == ERANGE || *end != '\0') {
		throw InvalidConfigurationException("Option \"%s\": \"%s\" is out of range", name, input);
	}
	return static_cast<idx_t>(result);
}

static bool ParseBoolean(const string &name, const string &input) {
	auto value = StringUtil::Lower(input);
	StringUtil::Trim(value);
	if (value == "true" || value == "1" || value == "on" || value == "t") {
		return true;
	}
	if (value == "false" || value == "0" || value == "off" || value == "f") {
		return false;
	}
	throw InvalidConfigurationException("Option \"%s\" expects a boolean, got \"%s\"", name, input);
}

ExternalSortConfig::ExternalSortConfig()
    : thread_count(GetSystemThreadCount()), file_system(FileSystem::CreateLocal()) {
}

idx_t ExternalSortConfig::GetSystemThreadCount() {
	auto count = std::thread::hardware_concurrency();
	return count == 0 ? 1 : static_cast<idx_t>(count);
}

void ExternalSortConfig::SetOptionByName(const string &name, const string &value) {
	auto lname = StringUtil::Lower(name);
	if (lname == "segment_size") {
		segment_size = ParseUnsigned(lname, value);
	} else if (lname == "sort_directory") {
		sort_directory = value;
	} else if (lname == "parallel_sort") {
		parallel_sort = ParseBoolean(lname, value);
	} else if (lname == "heap_merge_threshold") {
		heap_merge_threshold = ParseUnsigned(lname, value);
	} else if (lname == "heap_refill_size") {
		heap_refill_size = ParseUnsigned(lname, value);
	} else if (lname == "threads") {
		thread_count = ParseUnsigned(lname, value);
	} else if (lname == "temp_directory_prefix") {
		temp_directory_prefix = value;
	} else {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\", expected one of: %s", name,
		                                    StringUtil::Join(GetOptionNames(), ", "));
	}
}

string ExternalSortConfig::GetOptionByName(const string &name) const {
	auto lname = StringUtil::Lower(name);
	if (lname == "segment_size") {
		return std::to_string(segment_size);
	} else if (lname == "sort_directory") {
		return sort_directory;
	} else if (lname == "parallel_sort") {
		return parallel_sort ? "true" : "false";
	} else if (lname == "heap_merge_threshold") {
		return std::to_string(heap_merge_threshold);
	} else if (lname == "heap_refill_size") {
		return std::to_string(heap_refill_size);
	} else if (lname == "threads") {
		return std::to_string(thread_count);
	} else if (lname == "temp_directory_prefix") {
		return temp_directory_prefix;
	}
	throw InvalidConfigurationException("Unrecognized configuration option \"%s\", expected one of: %s", name,
	                                    StringUtil::Join(GetOptionNames(), ", "));
}

vector<string> ExternalSortConfig::GetOptionNames() {
	vector<string> result;
	for (idx_t index = 0; internal_options[index]; index++) {
		result.emplace_back(internal_options[index]);
	}
	return result;
}

void ExternalSortConfig::Verify() const {
	if (segment_size == 0) {
		throw InvalidConfigurationException("segment_size must be at least 1");
	}
	if (heap_merge_threshold == 0) {
		throw InvalidConfigurationException("heap_merge_threshold must be at least 1");
	}
	if (heap_refill_size == 0) {
		throw InvalidConfigurationException("heap_refill_size must be at least 1");
	}
	if (thread_count == 0) {
		throw InvalidConfigurationException("threads must be at least 1");
	}
	if (!file_system) {
		throw InvalidConfigurationException("A file system is required to sort");
	}
	if (sort_directory.empty() && temp_directory_prefix.find('/') != string::npos) {
		throw InvalidConfigurationException("temp_directory_prefix \"%s\" cannot contain a path separator",
		                                    temp_directory_prefix);
	}
}

} // namespace extsort
