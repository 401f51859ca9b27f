#include "catch2/catch.hpp"
#include "extsort.hpp"
#include "test_helpers.hpp"

using namespace extsort;
using namespace std;

TEST_CASE("Default sort configuration", "[sort][config]") {
	ExternalSortConfig config;
	REQUIRE(config.segment_size == 10000);
	REQUIRE(config.heap_merge_threshold == 20);
	REQUIRE(config.heap_refill_size == 20);
	REQUIRE(config.sort_directory.empty());
	REQUIRE(!config.parallel_sort);
	REQUIRE(config.thread_count >= 1);
	REQUIRE(config.temp_directory_prefix == "extsort_");
	REQUIRE(config.file_system);
	REQUIRE(!config.log_manager);
	REQUIRE_NOTHROW(config.Verify());
}

TEST_CASE("Set and get options by name", "[sort][config]") {
	ExternalSortConfig config;
	config.SetOptionByName("segment_size", "123");
	config.SetOptionByName("SORT_DIRECTORY", "/some/where");
	config.SetOptionByName("parallel_sort", "On");
	config.SetOptionByName("heap_merge_threshold", " 5 ");
	config.SetOptionByName("heap_refill_size", "7");
	config.SetOptionByName("threads", "3");
	config.SetOptionByName("temp_directory_prefix", "mysort_");

	REQUIRE(config.segment_size == 123);
	REQUIRE(config.sort_directory == "/some/where");
	REQUIRE(config.parallel_sort);
	REQUIRE(config.heap_merge_threshold == 5);
	REQUIRE(config.heap_refill_size == 7);
	REQUIRE(config.thread_count == 3);
	REQUIRE(config.temp_directory_prefix == "mysort_");

	REQUIRE(config.GetOptionByName("segment_size") == "123");
	REQUIRE(config.GetOptionByName("sort_directory") == "/some/where");
	REQUIRE(config.GetOptionByName("parallel_sort") == "true");
	REQUIRE(config.GetOptionByName("Heap_Merge_Threshold") == "5");
	REQUIRE(config.GetOptionByName("heap_refill_size") == "7");
	REQUIRE(config.GetOptionByName("threads") == "3");
	REQUIRE(config.GetOptionByName("temp_directory_prefix") == "mysort_");

	// every option name round-trips
	for (auto &name : ExternalSortConfig::GetOptionNames()) {
		auto value = config.GetOptionByName(name);
		REQUIRE_NOTHROW(config.SetOptionByName(name, value));
		REQUIRE(config.GetOptionByName(name) == value);
	}
	REQUIRE(ExternalSortConfig::GetOptionNames().size() == 7);
}

TEST_CASE("Boolean option values", "[sort][config]") {
	ExternalSortConfig config;
	for (auto value : {"true", "TRUE", "1", "on", "t"}) {
		config.parallel_sort = false;
		config.SetOptionByName("parallel_sort", value);
		REQUIRE(config.parallel_sort);
	}
	for (auto value : {"false", "False", "0", "off", "f"}) {
		config.parallel_sort = true;
		config.SetOptionByName("parallel_sort", value);
		REQUIRE(!config.parallel_sort);
	}
}

TEST_CASE("Invalid options are rejected", "[sort][config]") {
	ExternalSortConfig config;
	REQUIRE_THROWS_AS(config.SetOptionByName("segment_count", "10"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.GetOptionByName("segment_count"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("segment_size", "-1"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("segment_size", "ten"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("segment_size", ""), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("segment_size", "99999999999999999999999"),
	                  InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOptionByName("parallel_sort", "maybe"), InvalidConfigurationException);
	// failed assignments leave the config untouched
	REQUIRE(config.segment_size == ExternalSortConfig::DEFAULT_SEGMENT_SIZE);
	REQUIRE(!config.parallel_sort);

	try {
		config.SetOptionByName("unknown_option", "1");
		FAIL("expected an exception");
	} catch (InvalidConfigurationException &ex) {
		REQUIRE(StringUtil::Contains(ex.what(), "unknown_option"));
		REQUIRE(StringUtil::Contains(ex.what(), "segment_size"));
	}
}

TEST_CASE("Verify the sort configuration", "[sort][config]") {
	ExternalSortConfig config;
	config.segment_size = 0;
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.segment_size = 1;
	config.heap_merge_threshold = 0;
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.heap_merge_threshold = 1;
	config.heap_refill_size = 0;
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.heap_refill_size = 1;
	config.thread_count = 0;
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.thread_count = 1;
	config.temp_directory_prefix = "nested/prefix_";
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.temp_directory_prefix = "prefix_";
	config.file_system.reset();
	REQUIRE_THROWS_AS(config.Verify(), InvalidConfigurationException);
	config.file_system = FileSystem::CreateLocal();
	REQUIRE_NOTHROW(config.Verify());
}

TEST_CASE("The external sorter forwards its settings", "[sort][config]") {
	auto log_manager = make_shared_ptr<LogManager>();
	ExternalSorter sorter;
	sorter.WithSegmentSize(42)
	    .WithSortDirectory("sorted")
	    .WithParallelSort()
	    .WithHeapMergeThreshold(3)
	    .WithHeapRefillSize(4)
	    .WithThreads(2)
	    .WithTempDirectoryPrefix("prefix_")
	    .WithLogManager(log_manager);
	auto &config = sorter.GetConfig();
	REQUIRE(config.segment_size == 42);
	REQUIRE(config.sort_directory == "sorted");
	REQUIRE(config.parallel_sort);
	REQUIRE(config.heap_merge_threshold == 3);
	REQUIRE(config.heap_refill_size == 4);
	REQUIRE(config.thread_count == 2);
	REQUIRE(config.temp_directory_prefix == "prefix_");
	REQUIRE(config.log_manager == log_manager);

	sorter.SetOptionByName("segment_size", "7");
	REQUIRE(sorter.GetConfig().segment_size == 7);

	// sorters created from the front-end copy its configuration
	auto pusher = sorter.Pusher<int32_t>();
	sorter.WithSegmentSize(1000);
	REQUIRE(pusher->GetConfig().segment_size == 7);
}
