#include "extsort/sort/parallel_sort.hpp"

#include <exception>
#include <thread>

namespace extsort {

constexpr const idx_t ParallelSort::MINIMUM_PARALLEL_SIZE;

idx_t ParallelSort::GetRangeCount(idx_t count, idx_t thread_count) {
	if (thread_count <= 1) {
		return 1;
	}
	return MaxValue<idx_t>(1, MinValue<idx_t>(thread_count, count / MINIMUM_PARALLEL_SIZE));
}

void ParallelSort::RunTasks(vector<std::function<void()>> &tasks) {
	vector<std::exception_ptr> errors(tasks.size());
	vector<std::thread> threads;
	threads.reserve(tasks.size());
	try {
		for (idx_t task_idx = 0; task_idx < tasks.size(); task_idx++) {
			threads.emplace_back([&tasks, &errors, task_idx]() {
				try {
					tasks[task_idx]();
				} catch (...) {
					errors[task_idx] = std::current_exception();
				}
			});
		}
	} catch (...) {
		// could not start a thread: wait for the ones that did start before propagating
		for (auto &thread : threads) {
			thread.join();
		}
		throw;
	}
	for (auto &thread : threads) {
		thread.join();
	}
	for (auto &error : errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}
}

} // namespace extsort
