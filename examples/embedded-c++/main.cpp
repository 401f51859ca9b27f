#include "extsort.hpp"

#include <iostream>
#include <string>

using namespace extsort;

//! A record that knows how to write itself to a segment file
struct Employee {
	Employee() : id(0), salary(0) {
	}
	Employee(int32_t id_p, std::string name_p, int64_t salary_p) : id(id_p), name(std::move(name_p)), salary(salary_p) {
	}

	int32_t id;
	std::string name;
	int64_t salary;

	void Encode(WriteStream &target) const {
		target.Write<int32_t>(id);
		SortCodec<std::string>::Encode(name, target);
		target.Write<int64_t>(salary);
	}
	static bool Decode(ReadStream &source, Employee &result) {
		if (source.Finished()) {
			return false;
		}
		result.id = source.Read<int32_t>();
		if (!SortCodec<std::string>::Decode(source, result.name)) {
			throw SerializationException("Employee record %d ends before its name", result.id);
		}
		result.salary = source.Read<int64_t>();
		return true;
	}
};

int main() {
	try {
		const char *names[] = {"Alice", "Bob", "Carol", "David", "Eve", "Frank", "Grace", "Heidi"};
		std::vector<Employee> employees;
		for (int32_t i = 0; i < 100000; i++) {
			employees.emplace_back(i, names[i % 8], 40000 + (i * 7919) % 60000);
		}

		// keep at most 10000 employees in memory, everything else goes to segment files
		ExternalSorter sorter;
		sorter.WithSegmentSize(10000).WithParallelSort();

		std::cout << "=== Top earners ===" << std::endl;
		auto by_salary = sorter.SortBy(employees, [](const Employee &a, const Employee &b) {
			return a.salary > b.salary || (a.salary == b.salary && a.id < b.id);
		});
		std::cout << by_salary->DiskSegmentCount() << " segments, "
		          << SortedIteratorModeToString(by_salary->Mode()) << std::endl;
		Employee employee;
		for (int i = 0; i < 5 && by_salary->Next(employee); i++) {
			std::cout << employee.id << "\t" << employee.name << "\t" << employee.salary << std::endl;
		}

		std::cout << "\n=== First names alphabetically ===" << std::endl;
		auto by_name = sorter.SortByKey(employees, [](const Employee &e) { return e.name; });
		for (int i = 0; i < 5 && by_name->Next(employee); i++) {
			std::cout << employee.id << "\t" << employee.name << std::endl;
		}

		std::cout << "\n=== Streaming salaries ===" << std::endl;
		auto pusher = sorter.Pusher<int64_t>();
		for (auto &e : employees) {
			pusher->Push(e.salary);
		}
		auto salaries = pusher->Done();
		int64_t lowest;
		if (salaries->Next(lowest)) {
			std::cout << "Lowest salary: " << lowest << " of " << salaries->SortedCount() << std::endl;
		}
	} catch (const std::exception &ex) {
		std::cerr << "Error: " << ex.what() << std::endl;
		return 1;
	}
	return 0;
}
