//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/error_data.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/exception.hpp"

namespace extsort {

//! ErrorData holds a captured error so that it can be passed around as a value and rethrown later
class ErrorData {
public:
	//! Not initialized, default constructor
	EXTSORT_API ErrorData();
	//! From an extsort exception: keeps type, message and extra info
	EXTSORT_API explicit ErrorData(const Exception &ex); // NOLINT
	//! From any std::exception, extsort exceptions keep their type and extra info
	EXTSORT_API explicit ErrorData(const std::exception &ex); // NOLINT
	//! From a raw type and message
	EXTSORT_API ErrorData(ExceptionType type, const string &raw_message);

public:
	//! Throw the error
	[[noreturn]] EXTSORT_API void Throw(const string &prepended_message = "") const;
	//! Get the internal exception type of the error
	EXTSORT_API const ExceptionType &Type() const;
	//! The message prefixed with the exception type
	EXTSORT_API const string &Message() const {
		return final_message;
	}
	EXTSORT_API const string &RawMessage() const {
		return raw_message;
	}
	EXTSORT_API bool operator==(const ErrorData &other) const;
	inline bool HasError() const {
		return initialized;
	}
	const unordered_map<string, string> &ExtraInfo() const {
		return extra_info;
	}
	//! Resets the error to the uninitialized state
	EXTSORT_API void Reset();

private:
	//! Whether this ErrorData contains an exception or not
	bool initialized;
	//! The ExceptionType of the preserved exception
	ExceptionType type;
	//! The message the exception was constructed with (does not contain the Exception Type)
	string raw_message;
	//! The message prefixed with the exception type
	string final_message;
	//! Extra exception info
	unordered_map<string, string> extra_info;

private:
	string ConstructFinalMessage() const;
};

} // namespace extsort
