#include "extsort.hpp"
#include "extsort/common/string_util.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <random>

using namespace extsort;

struct BenchmarkConfiguration {
	idx_t repetitions = 3;
	uint32_t seed = 42;
	bool log = false;
	//! Only run benchmarks whose name contains this string
	string filter;
	ExternalSortConfig sort_config;
};

enum class InputOrder : uint8_t { SORTED, REVERSED, RANDOM };

struct BenchmarkCase {
	string name;
	idx_t item_count;
	InputOrder order;
	idx_t segment_size;
	bool parallel;
};

static void print_help() {
	fmt::print(stderr, "Usage: extsort_benchmark [options]\n");
	fmt::print(stderr, "              --filter=[name]      Only run benchmarks whose name contains this string\n");
	fmt::print(stderr, "              --repeat=[count]     Number of times the sort is repeated\n");
	fmt::print(stderr, "              --seed=[seed]        Seed of the random input\n");
	fmt::print(stderr, "              --log                Print the sorter's log to stdout\n");
	fmt::print(stderr, "              --[option]=[value]   Any sort option: {}\n",
	           StringUtil::Join(ExternalSortConfig::GetOptionNames(), ", "));
}

static idx_t parse_count(const string &name, const string &value) {
	char *end = nullptr;
	auto result = std::strtoull(value.c_str(), &end, 10);
	if (value.empty() || *end != '\0') {
		throw InvalidInputException("Option \"%s\" expects a number, got \"%s\"", name, value);
	}
	return static_cast<idx_t>(result);
}

static BenchmarkConfiguration parse_arguments(const int arg_counter, char const *const *arg_values) {
	BenchmarkConfiguration configuration;
	for (int arg_index = 1; arg_index < arg_counter; ++arg_index) {
		string arg = arg_values[arg_index];
		if (arg == "--help" || arg == "-h") {
			print_help();
			exit(0);
		}
		if (arg == "--log") {
			configuration.log = true;
			continue;
		}
		if (!StringUtil::StartsWith(arg, "--") || arg.find('=') == string::npos) {
			throw InvalidInputException("Unrecognized argument \"%s\"", arg);
		}
		auto separator = arg.find('=');
		auto name = arg.substr(2, separator - 2);
		auto value = arg.substr(separator + 1);
		if (name == "filter") {
			configuration.filter = value;
		} else if (name == "repeat") {
			configuration.repetitions = parse_count(name, value);
		} else if (name == "seed") {
			configuration.seed = static_cast<uint32_t>(parse_count(name, value));
		} else {
			configuration.sort_config.SetOptionByName(name, value);
		}
	}
	return configuration;
}

static double elapsed_seconds(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static const char *input_order_to_string(InputOrder order) {
	switch (order) {
	case InputOrder::SORTED:
		return "sorted";
	case InputOrder::REVERSED:
		return "reversed";
	case InputOrder::RANDOM:
		return "random";
	default:
		throw InternalException("Unknown input order %d", static_cast<int>(order));
	}
}

static vector<BenchmarkCase> get_benchmark_cases() {
	vector<BenchmarkCase> result;
	const InputOrder orders[] = {InputOrder::SORTED, InputOrder::REVERSED, InputOrder::RANDOM};
	const idx_t small_counts[] = {1000, 100000};
	for (auto count : small_counts) {
		for (auto order : orders) {
			// segments of a tenth of the input force ten spills
			auto name = StringUtil::Format("%s_%llu", input_order_to_string(order), count);
			result.push_back(BenchmarkCase {name, count, order, count / 10, false});
		}
	}
	const idx_t segment_sizes[] = {10000, 100000};
	for (auto segment_size : segment_sizes) {
		for (int parallel = 0; parallel < 2; parallel++) {
			auto name = StringUtil::Format("random_1000000_segment_%llu%s", segment_size,
			                               parallel ? "_parallel" : "");
			result.push_back(BenchmarkCase {name, 1000000, InputOrder::RANDOM, segment_size, parallel != 0});
		}
	}
	return result;
}

static vector<int64_t> generate_input(const BenchmarkCase &benchmark, uint32_t seed) {
	vector<int64_t> input;
	input.reserve(benchmark.item_count);
	std::mt19937_64 engine(seed);
	for (idx_t i = 0; i < benchmark.item_count; i++) {
		switch (benchmark.order) {
		case InputOrder::SORTED:
			input.push_back(static_cast<int64_t>(i));
			break;
		case InputOrder::REVERSED:
			input.push_back(static_cast<int64_t>(benchmark.item_count - i));
			break;
		case InputOrder::RANDOM:
			input.push_back(static_cast<int64_t>(engine()));
			break;
		}
	}
	return input;
}

static void verify_output(SortedIterator<int64_t> &iterator, idx_t expected_count) {
	int64_t previous = std::numeric_limits<int64_t>::min();
	int64_t value;
	idx_t count = 0;
	while (iterator.Next(value)) {
		if (value < previous) {
			throw InternalException("Sorted output is out of order at position %llu", count);
		}
		previous = value;
		count++;
	}
	if (count != expected_count) {
		throw InternalException("Sorted output has %llu items, expected %llu", count, expected_count);
	}
}

static void run_benchmark(const BenchmarkConfiguration &configuration, const BenchmarkCase &benchmark,
                          shared_ptr<LogManager> log_manager) {
	auto input = generate_input(benchmark, configuration.seed);

	ExternalSorter sorter(configuration.sort_config);
	sorter.WithSegmentSize(benchmark.segment_size).WithParallelSort(benchmark.parallel);
	if (log_manager) {
		sorter.WithLogManager(std::move(log_manager));
	}

	for (idx_t run = 0; run < configuration.repetitions; run++) {
		// baseline: sort the whole input in memory
		auto baseline_input = input;
		auto start = std::chrono::steady_clock::now();
		std::sort(baseline_input.begin(), baseline_input.end());
		auto baseline_time = elapsed_seconds(start);

		start = std::chrono::steady_clock::now();
		auto iterator = sorter.Sort(input);
		auto spill_time = elapsed_seconds(start);
		verify_output(*iterator, input.size());
		auto total_time = elapsed_seconds(start);

		fmt::print("{}\t{}\t{}\t{}\t{:.4f}\t{:.4f}\t{:.4f}\n", benchmark.name, run, iterator->DiskSegmentCount(),
		           SortedIteratorModeToString(iterator->Mode()), baseline_time, spill_time, total_time);
	}
}

int main(int argc, char **argv) {
	try {
		auto configuration = parse_arguments(argc, argv);
		configuration.sort_config.Verify();

		shared_ptr<LogManager> log_manager;
		if (configuration.log) {
			auto log_config = LogConfig::Create(true, LogLevel::LOG_DEBUG);
			log_config.storage = LogConfig::STDOUT_STORAGE_NAME;
			log_manager = make_shared_ptr<LogManager>(log_config);
		}

		fmt::print("name\trun\tsegments\tmode\tstd_sort\tspill\ttotal\n");
		for (auto &benchmark : get_benchmark_cases()) {
			if (!configuration.filter.empty() && !StringUtil::Contains(benchmark.name, configuration.filter)) {
				continue;
			}
			run_benchmark(configuration, benchmark, log_manager);
		}
	} catch (std::exception &ex) {
		ErrorData error(ex);
		fmt::print(stderr, "{}\n", error.Message());
		return 1;
	}
	return 0;
}
