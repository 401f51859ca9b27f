#include "extsort/logging/log_type.hpp"

#include "extsort/common/string_util.hpp"

namespace extsort {

constexpr const char *DefaultLogType::NAME;
constexpr LogLevel DefaultLogType::LEVEL;
constexpr const char *SortLogType::NAME;
constexpr LogLevel SortLogType::LEVEL;

//===--------------------------------------------------------------------===//
// SortLogType
//===--------------------------------------------------------------------===//
string SortLogType::ConstructLogMessage(const string &op, idx_t segment, idx_t item_count, idx_t bytes) {
	return StringUtil::Format("{\"op\":\"%s\",\"segment\":\"%llu\",\"items\":\"%llu\",\"bytes\":\"%llu\"}", op,
	                          segment, item_count, bytes);
}

string SortLogType::ConstructLogMessage(const string &op, const string &detail) {
	return StringUtil::Format("{\"op\":\"%s\",\"detail\":\"%s\"}", op, detail);
}

} // namespace extsort
