#include "catch2/catch.hpp"
#include "extsort.hpp"
#include "test_helpers.hpp"

using namespace extsort;
using namespace std;

namespace {

//! A record that can be written in a way that fails to decode again
struct FaultyRecord {
	static constexpr const uint8_t CORRUPT_MARKER = 0xFF;

	FaultyRecord() : value(0), corrupt(false) {
	}
	FaultyRecord(int64_t value_p, bool corrupt_p = false) : value(value_p), corrupt(corrupt_p) { // NOLINT
	}

	int64_t value;
	bool corrupt;

	void Encode(WriteStream &target) const {
		target.Write<int64_t>(value);
		target.Write<uint8_t>(corrupt ? uint8_t(CORRUPT_MARKER) : uint8_t(0));
	}
	static bool Decode(ReadStream &source, FaultyRecord &result) {
		if (source.Finished()) {
			return false;
		}
		result.value = source.Read<int64_t>();
		result.corrupt = false;
		if (source.Read<uint8_t>() == CORRUPT_MARKER) {
			throw SerializationException("Corrupt record with value %lld", result.value);
		}
		return true;
	}

	bool operator<(const FaultyRecord &other) const {
		return value < other.value;
	}
};

//! Fetches everything, recording errors as the string "error"
vector<string> FetchAll(SortedIterator<FaultyRecord> &iterator, vector<ErrorData> &errors) {
	vector<string> result;
	while (true) {
		FaultyRecord record;
		ErrorData error;
		auto fetch_result = iterator.Fetch(record, error);
		if (fetch_result == SortFetchResult::FINISHED) {
			break;
		}
		if (fetch_result == SortFetchResult::ERROR) {
			REQUIRE(error.HasError());
			errors.push_back(error);
			result.push_back("error");
		} else {
			result.push_back(std::to_string(record.value));
		}
	}
	return result;
}

} // namespace

TEST_CASE("A corrupt record is reported after the records that precede it", "[sort][error]") {
	ExternalSorter sorter;
	sorter.WithSegmentSize(1);
	auto pusher = sorter.Pusher<FaultyRecord>();
	pusher->Push(FaultyRecord(1));
	pusher->Push(FaultyRecord(2, true));
	auto iterator = pusher->Done();
	REQUIRE(iterator->DiskSegmentCount() == 1);

	FaultyRecord record;
	ErrorData error;
	REQUIRE(iterator->Fetch(record, error) == SortFetchResult::ITEM);
	REQUIRE(record.value == 1);
	REQUIRE(iterator->Fetch(record, error) == SortFetchResult::ERROR);
	REQUIRE(error.HasError());
	REQUIRE(error.Type() == ExceptionType::SERIALIZATION);
	REQUIRE(StringUtil::Contains(error.Message(), "Corrupt record with value 2"));
	// the failed segment contributes nothing more
	REQUIRE(iterator->Fetch(record, error) == SortFetchResult::FINISHED);
	REQUIRE(iterator->Fetch(record, error) == SortFetchResult::FINISHED);
}

TEST_CASE("Decode errors while merging", "[sort][error]") {
	// segment 0 holds 1, 3 and a corrupt 5; segment 1 holds 2, 4 and 6
	auto run_sort = [](idx_t heap_merge_threshold, idx_t heap_refill_size, SortedIteratorMode expected_mode) {
		ExternalSorter sorter;
		sorter.WithSegmentSize(2).WithHeapMergeThreshold(heap_merge_threshold).WithHeapRefillSize(heap_refill_size);
		auto pusher = sorter.Pusher<FaultyRecord>();
		pusher->PushAll(vector<FaultyRecord> {FaultyRecord(5, true), FaultyRecord(1), FaultyRecord(3)});
		pusher->PushAll(vector<FaultyRecord> {FaultyRecord(6), FaultyRecord(2), FaultyRecord(4)});
		auto iterator = pusher->Done();
		REQUIRE(iterator->DiskSegmentCount() == 2);
		REQUIRE(iterator->Mode() == expected_mode);
		REQUIRE(iterator->SortedCount() == 6);

		vector<ErrorData> errors;
		auto result = FetchAll(*iterator, errors);
		REQUIRE(result == vector<string>({"1", "2", "3", "error", "4", "6"}));
		REQUIRE(errors.size() == 1);
		REQUIRE(errors[0].Type() == ExceptionType::SERIALIZATION);
	};

	SECTION("linear scan") {
		run_sort(ExternalSortConfig::DEFAULT_HEAP_MERGE_THRESHOLD, 20, SortedIteratorMode::LINEAR_SCAN);
	}
	SECTION("heap merge, refilling one record at a time") {
		run_sort(1, 1, SortedIteratorMode::HEAP_MERGE);
	}
	SECTION("heap merge, refilling many records at a time") {
		run_sort(1, 20, SortedIteratorMode::HEAP_MERGE);
	}
}

TEST_CASE("A corrupt first record is reported by the first fetch", "[sort][error]") {
	ExternalSorter sorter;
	sorter.WithSegmentSize(1);
	auto pusher = sorter.Pusher<FaultyRecord>();
	pusher->PushAll(vector<FaultyRecord> {FaultyRecord(0, true), FaultyRecord(1)});
	pusher->PushAll(vector<FaultyRecord> {FaultyRecord(3), FaultyRecord(2)});

	// constructing the iterator decodes the first record of every segment, the failure is deferred
	auto iterator = pusher->Done();
	REQUIRE(iterator->DiskSegmentCount() == 2);

	vector<ErrorData> errors;
	auto result = FetchAll(*iterator, errors);
	REQUIRE(result == vector<string>({"error", "2", "3"}));
}

TEST_CASE("Next throws decode errors", "[sort][error]") {
	ExternalSorter sorter;
	sorter.WithSegmentSize(1);
	auto pusher = sorter.Pusher<FaultyRecord>();
	pusher->PushAll(vector<FaultyRecord> {FaultyRecord(7), FaultyRecord(8, true)});
	auto iterator = pusher->Done();

	FaultyRecord record;
	REQUIRE(iterator->Next(record));
	REQUIRE(record.value == 7);
	bool thrown = false;
	try {
		iterator->Next(record);
	} catch (Exception &ex) {
		thrown = true;
		REQUIRE(ex.GetType() == ExceptionType::SERIALIZATION);
	}
	REQUIRE(thrown);
	// iteration can continue after the error
	REQUIRE(!iterator->Next(record));
}

TEST_CASE("A failed spill makes the sorter unusable", "[sort][error]") {
	// a regular file where the sort directory should be makes every spill fail
	auto blocker = TestCreatePath("spill_blocker");
	TestDeleteFile(blocker);
	{
		auto fs = FileSystem::CreateLocal();
		BufferedFileWriter writer(*fs, blocker);
		writer.Write<int32_t>(42);
		writer.Close();
	}

	ExternalSorter sorter;
	sorter.WithSegmentSize(2).WithSortDirectory(blocker);
	auto pusher = sorter.Pusher<int64_t>();
	pusher->Push(1);
	pusher->Push(2);
	REQUIRE_THROWS_AS(pusher->Push(3), IOException);
	REQUIRE(pusher->SegmentCount() == 0);
	REQUIRE_THROWS_AS(pusher->Push(4), InvalidInputException);
	REQUIRE_THROWS_AS(pusher->Done(), InvalidInputException);

	vector<int64_t> input {3, 2, 1};
	REQUIRE_THROWS_AS(sorter.Sort(input), IOException);
	TestDeleteFile(blocker);
}

TEST_CASE("Errors raised by the comparator propagate out of the parallel sort", "[sort][error][parallel]") {
	auto input = TestRandomNumbers(4 * ParallelSort::MINIMUM_PARALLEL_SIZE, 99);
	auto comparator = [](const int64_t &a, const int64_t &b) -> bool {
		if (a == b) {
			throw InvalidInputException("Duplicate value %lld", a);
		}
		return a < b;
	};
	// sorting the same value twice guarantees an equal comparison
	auto duplicates = input;
	input.insert(input.end(), duplicates.begin(), duplicates.end());

	ExternalSorter sorter;
	sorter.WithSegmentSize(input.size()).WithParallelSort().WithThreads(4);
	REQUIRE_THROWS_AS(sorter.SortBy(input, comparator), InvalidInputException);
}
