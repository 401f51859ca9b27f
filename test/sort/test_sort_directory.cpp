#include "catch2/catch.hpp"
#include "extsort.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <unistd.h>

using namespace extsort;
using namespace std;

static string UniquePrefix(const string &name) {
	return StringUtil::Format("extsort_test_%d_%s_", static_cast<int64_t>(getpid()), name);
}

static vector<int64_t> Numbers(int64_t count) {
	vector<int64_t> result;
	for (int64_t i = 0; i < count; i++) {
		result.push_back((i * 37) % count);
	}
	return result;
}

TEST_CASE("The temporary directory lives as long as the iterator", "[sort][directory]") {
	auto prefix = UniquePrefix("lifetime");
	REQUIRE(TestListTemporaryDirectories(prefix).empty());

	ExternalSorter sorter;
	sorter.WithSegmentSize(10).WithTempDirectoryPrefix(prefix);
	auto iterator = sorter.Sort(Numbers(100));
	REQUIRE(iterator->DiskSegmentCount() > 0);

	auto directories = TestListTemporaryDirectories(prefix);
	REQUIRE(directories.size() == 1);
	// one file per segment, named after the segment index
	auto files = TestListFiles(directories[0]);
	REQUIRE(files.size() == iterator->DiskSegmentCount());
	REQUIRE(std::find(files.begin(), files.end(), "0") != files.end());

	int64_t value;
	idx_t count = 0;
	while (iterator->Next(value)) {
		count++;
	}
	REQUIRE(count == 100);
	// exhausting the iterator does not remove the directory yet
	REQUIRE(TestListTemporaryDirectories(prefix).size() == 1);

	iterator.reset();
	REQUIRE(TestListTemporaryDirectories(prefix).empty());
}

TEST_CASE("Dropping an iterator early removes the temporary directory", "[sort][directory]") {
	auto prefix = UniquePrefix("early_drop");
	ExternalSorter sorter;
	sorter.WithSegmentSize(5).WithTempDirectoryPrefix(prefix);

	SECTION("linear scan") {
		auto iterator = sorter.Sort(Numbers(30));
		REQUIRE(iterator->Mode() == SortedIteratorMode::LINEAR_SCAN);
		int64_t value;
		REQUIRE(iterator->Next(value));
		REQUIRE(value == 0);
		REQUIRE(TestListTemporaryDirectories(prefix).size() == 1);
		iterator.reset();
		REQUIRE(TestListTemporaryDirectories(prefix).empty());
	}
	SECTION("heap merge") {
		auto iterator = sorter.Sort(Numbers(300));
		REQUIRE(iterator->Mode() == SortedIteratorMode::HEAP_MERGE);
		REQUIRE(TestListTemporaryDirectories(prefix).size() == 1);
		iterator.reset();
		REQUIRE(TestListTemporaryDirectories(prefix).empty());
	}
	SECTION("sorter dropped before finishing") {
		auto pusher = sorter.Pusher<int64_t>();
		pusher->PushAll(Numbers(20));
		REQUIRE(pusher->SegmentCount() == 3);
		REQUIRE(TestListTemporaryDirectories(prefix).size() == 1);
		pusher.reset();
		REQUIRE(TestListTemporaryDirectories(prefix).empty());
	}
}

TEST_CASE("Every sort gets its own temporary directory", "[sort][directory]") {
	auto prefix = UniquePrefix("concurrent");
	ExternalSorter sorter;
	sorter.WithSegmentSize(10).WithTempDirectoryPrefix(prefix);
	auto first = sorter.Sort(Numbers(50));
	auto second = sorter.Sort(Numbers(70));
	REQUIRE(TestListTemporaryDirectories(prefix).size() == 2);

	first.reset();
	REQUIRE(TestListTemporaryDirectories(prefix).size() == 1);
	int64_t value;
	idx_t count = 0;
	while (second->Next(value)) {
		count++;
	}
	REQUIRE(count == 70);
	second.reset();
	REQUIRE(TestListTemporaryDirectories(prefix).empty());
}

TEST_CASE("Segment files stay in a caller supplied directory", "[sort][directory]") {
	auto directory = TestCreatePath("caller_directory");
	TestDeleteDirectory(directory);
	auto fs = FileSystem::CreateLocal();

	{
		ExternalSorter sorter;
		sorter.WithSegmentSize(10).WithSortDirectory(directory);
		auto iterator = sorter.Sort(Numbers(35));
		// 3 spills of 11 items and a final segment of 2
		REQUIRE(iterator->DiskSegmentCount() == 4);
		REQUIRE(fs->DirectoryExists(directory));
		int64_t value;
		REQUIRE(iterator->Next(value));
	}

	// the directory was created on the first spill and is left in place with all segment files
	REQUIRE(fs->DirectoryExists(directory));
	REQUIRE(TestListFiles(directory) == vector<string>({"0", "1", "2", "3"}));

	// a second sort into the same directory overwrites the segment files
	{
		ExternalSorter sorter;
		sorter.WithSegmentSize(10).WithSortDirectory(directory);
		auto iterator = sorter.Sort(Numbers(15));
		REQUIRE(iterator->DiskSegmentCount() == 2);
		vector<int64_t> result;
		int64_t value;
		while (iterator->Next(value)) {
			result.push_back(value);
		}
		REQUIRE(result.size() == 15);
		REQUIRE(std::is_sorted(result.begin(), result.end()));
	}
	REQUIRE(TestListFiles(directory) == vector<string>({"0", "1", "2", "3"}));
	TestDeleteDirectory(directory);
}

TEST_CASE("Segment file sizes follow the codec", "[sort][directory]") {
	auto directory = TestCreatePath("segment_sizes");
	TestDeleteDirectory(directory);

	ExternalSorter sorter;
	sorter.WithSegmentSize(3).WithSortDirectory(directory);
	vector<int32_t> input {4, 3, 2, 1, 0};
	auto iterator = sorter.Sort(input);
	REQUIRE(iterator->DiskSegmentCount() == 2);

	// four 4-byte integers in the first segment, one in the second
	auto fs = FileSystem::CreateLocal();
	auto first = fs->OpenFile(fs->JoinPath(directory, "0"), FileFlags::FILE_FLAGS_READ);
	REQUIRE(first->GetFileSize() == 4 * sizeof(int32_t));
	auto second = fs->OpenFile(fs->JoinPath(directory, "1"), FileFlags::FILE_FLAGS_READ);
	REQUIRE(second->GetFileSize() == sizeof(int32_t));

	// the first segment holds the first four pushed values, sorted
	BufferedFileReader reader(*fs, first->GetPath().c_str());
	vector<int32_t> contents;
	int32_t value;
	while (SortCodec<int32_t>::Decode(reader, value)) {
		contents.push_back(value);
	}
	REQUIRE(contents == vector<int32_t>({1, 2, 3, 4}));

	iterator.reset();
	first.reset();
	second.reset();
	TestDeleteDirectory(directory);
}
