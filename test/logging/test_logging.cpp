#include "catch2/catch.hpp"
#include "extsort.hpp"
#include "test_helpers.hpp"

using namespace extsort;
using namespace std;

#define TEST_ALL_LOG_MACROS(SOURCE)                                                                                    \
	EXTSORT_LOG_TRACE(SOURCE, "log-a-lot: '%s'", "trace");                                                             \
	EXTSORT_LOG_DEBUG(SOURCE, "log-a-lot: '%s'", "debug");                                                             \
	EXTSORT_LOG_INFO(SOURCE, "log-a-lot: '%s'", "info");                                                               \
	EXTSORT_LOG_WARN(SOURCE, "log-a-lot: '%s'", "warn");                                                               \
	EXTSORT_LOG_ERROR(SOURCE, "log-a-lot: '%s'", "error");

static vector<string> Messages(LogManager &log_manager) {
	vector<string> result;
	for (auto &entry : log_manager.GetLogStorage()->GetEntries()) {
		result.push_back(entry.message);
	}
	return result;
}

static idx_t CountMessagesContaining(LogManager &log_manager, const string &needle) {
	idx_t count = 0;
	for (auto &message : Messages(log_manager)) {
		if (StringUtil::Contains(message, needle)) {
			count++;
		}
	}
	return count;
}

TEST_CASE("Log levels", "[logging]") {
	REQUIRE(StringToLogLevel("debug") == LogLevel::LOG_DEBUG);
	REQUIRE(StringToLogLevel("WARNING") == LogLevel::LOG_WARN);
	REQUIRE(string(LogLevelToString(LogLevel::LOG_ERROR)) == "ERROR");
	REQUIRE_THROWS_AS(StringToLogLevel("loud"), InvalidInputException);
}

TEST_CASE("Logging is disabled by default", "[logging]") {
	LogManager log_manager;
	REQUIRE(!log_manager.GetConfig().enabled);
	TEST_ALL_LOG_MACROS(log_manager);
	REQUIRE(log_manager.GetLogStorage()->GetEntries().empty());

	auto logger = log_manager.CreateLogger(LoggingContext(LogContextScope::SORTER));
	REQUIRE(!logger->ShouldLog(SortLogType::NAME, LogLevel::LOG_FATAL));
}

TEST_CASE("The global logger follows the log level", "[logging]") {
	LogManager log_manager(LogConfig::Create(true, LogLevel::LOG_WARN));
	TEST_ALL_LOG_MACROS(log_manager);
	REQUIRE(Messages(log_manager) == vector<string>({"log-a-lot: 'warn'", "log-a-lot: 'error'"}));

	log_manager.TruncateLogStorage();
	log_manager.SetLogLevel(LogLevel::LOG_TRACE);
	TEST_ALL_LOG_MACROS(log_manager);
	REQUIRE(Messages(log_manager).size() == 5);

	log_manager.TruncateLogStorage();
	log_manager.SetEnableLogging(false);
	TEST_ALL_LOG_MACROS(log_manager);
	REQUIRE(Messages(log_manager).empty());
}

TEST_CASE("Enable and disable selected log types", "[logging]") {
	LogManager log_manager(LogConfig::CreateFromEnabled(true, LogLevel::LOG_TRACE, {SortLogType::NAME}));
	auto logger = log_manager.CreateLogger(LoggingContext(LogContextScope::SORTER));
	EXTSORT_LOG(*logger, SortLogType, "spill", 0, 10, 80);
	EXTSORT_LOG_INFO(*logger, "free-form message");
	auto entries = log_manager.GetLogStorage()->GetEntries();
	REQUIRE(entries.size() == 1);
	REQUIRE(entries[0].log_type == SortLogType::NAME);
	REQUIRE(entries[0].level == LogLevel::LOG_DEBUG);
	REQUIRE(entries[0].scope == LogContextScope::SORTER);
	REQUIRE(entries[0].message == "{\"op\":\"spill\",\"segment\":\"0\",\"items\":\"10\",\"bytes\":\"80\"}");

	LogManager disabled_sort(LogConfig::CreateFromDisabled(true, LogLevel::LOG_TRACE, {SortLogType::NAME}));
	auto other_logger = disabled_sort.CreateLogger(LoggingContext(LogContextScope::SORTER));
	EXTSORT_LOG(*other_logger, SortLogType, "spill", 0, 10, 80);
	EXTSORT_LOG_INFO(*other_logger, "free-form message");
	REQUIRE(Messages(disabled_sort) == vector<string>({"free-form message"}));
}

TEST_CASE("Log entries are formatted as a single line", "[logging]") {
	LogManager log_manager(LogConfig::Create(true, LogLevel::LOG_INFO));
	EXTSORT_LOG_WARN(log_manager, "disk is %d%% full", 90);
	auto entries = log_manager.GetLogStorage()->GetEntries();
	REQUIRE(entries.size() == 1);
	auto line = LogStorage::FormatEntry(entries[0]);
	REQUIRE(StringUtil::Contains(line, "\tWARN\tGLOBAL\t"));
	REQUIRE(StringUtil::EndsWith(line, "disk is 90% full"));
	REQUIRE(line.find('\n') == string::npos);
}

TEST_CASE("Custom log storages can be registered", "[logging]") {
	LogManager log_manager(LogConfig::Create(true, LogLevel::LOG_INFO));
	auto storage = make_shared_ptr<InMemoryLogStorage>();
	REQUIRE(log_manager.RegisterLogStorage("custom", storage));
	REQUIRE(!log_manager.RegisterLogStorage("custom", storage));
	REQUIRE(!log_manager.RegisterLogStorage("memory", storage));
	log_manager.SetLogStorage("custom");
	EXTSORT_LOG_INFO(log_manager, "into the custom storage");
	REQUIRE(storage->GetEntries().size() == 1);
	REQUIRE_THROWS_AS(log_manager.SetLogStorage("nonexistent"), InvalidInputException);
}

TEST_CASE("The external sorter logs its work", "[logging][sort]") {
	auto log_manager = make_shared_ptr<LogManager>(LogConfig::Create(true, LogLevel::LOG_DEBUG));
	ExternalSorter sorter;
	sorter.WithSegmentSize(10).WithLogManager(log_manager);

	vector<int64_t> input;
	for (int64_t i = 0; i < 35; i++) {
		input.push_back(35 - i);
	}
	auto iterator = sorter.Sort(input);
	REQUIRE(iterator->DiskSegmentCount() == 4);

	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"create_temp_directory\"") == 1);
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"spill\"") == 4);
	// every full spill holds 11 integers of 8 bytes
	REQUIRE(CountMessagesContaining(*log_manager, "\"items\":\"11\",\"bytes\":\"88\"") == 3);
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"finalize\",\"detail\":\"external\"") == 1);
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"merge\",\"detail\":\"linear_scan\"") == 1);

	int64_t value;
	while (iterator->Next(value)) {
	}
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"segment_exhausted\"") == 4);
	iterator.reset();
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"remove_directory\"") == 1);

	for (auto &entry : log_manager->GetLogStorage()->GetEntries()) {
		REQUIRE(entry.log_type == SortLogType::NAME);
		REQUIRE(entry.scope == LogContextScope::SORTER);
	}
}

TEST_CASE("Sorting in memory does not log spills", "[logging][sort]") {
	auto log_manager = make_shared_ptr<LogManager>(LogConfig::Create(true, LogLevel::LOG_DEBUG));
	ExternalSorter sorter;
	sorter.WithLogManager(log_manager);
	vector<int64_t> input {3, 1, 2};
	auto iterator = sorter.Sort(input);
	REQUIRE(CountMessagesContaining(*log_manager, "\"op\":\"spill\"") == 0);
	REQUIRE(CountMessagesContaining(*log_manager, "\"detail\":\"in_memory\"") == 1);
	REQUIRE(CountMessagesContaining(*log_manager, "\"detail\":\"passthrough\"") == 1);
}
