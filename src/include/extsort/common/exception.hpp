//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"

#include <stdexcept>

namespace extsort {

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,              // invalid type
	SERIALIZATION = 1,        // serialize/deserialize error
	NOT_IMPLEMENTED = 2,      // method not implemented
	IO = 3,                   // IO exception
	INTERNAL = 4,             // Internal exceptions indicate something is wrong internally
	INVALID_INPUT = 5,        // Input or arguments error
	OUT_OF_MEMORY = 6,        // out of memory
	INVALID_CONFIGURATION = 7 // An invalid configuration was detected
};

enum class ExceptionFormatValueType : uint8_t {
	FORMAT_VALUE_TYPE_DOUBLE,
	FORMAT_VALUE_TYPE_INTEGER,
	FORMAT_VALUE_TYPE_STRING
};

struct ExceptionFormatValue {
	EXTSORT_API ExceptionFormatValue(double dbl_val);   // NOLINT
	EXTSORT_API ExceptionFormatValue(int64_t int_val);  // NOLINT
	EXTSORT_API ExceptionFormatValue(uint64_t int_val); // NOLINT
	EXTSORT_API ExceptionFormatValue(string str_val);   // NOLINT

	ExceptionFormatValueType type;

	double dbl_val = 0;
	int64_t int_val = 0;
	uint64_t uint_val = 0;
	bool is_unsigned = false;
	string str_val;

public:
	template <class T>
	static ExceptionFormatValue CreateFormatValue(T value) {
		return int64_t(value);
	}
	static string Format(const string &msg, std::vector<ExceptionFormatValue> &values);
};

template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(float value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(double value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(string value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const char *value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(char *value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(unsigned long value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(unsigned long long value);

class Exception : public std::runtime_error {
public:
	EXTSORT_API Exception(ExceptionType exception_type, const string &message);
	EXTSORT_API Exception(const unordered_map<string, string> &extra_info, ExceptionType exception_type,
	                      const string &message);

public:
	EXTSORT_API static string ExceptionTypeToString(ExceptionType type);
	EXTSORT_API static ExceptionType StringToExceptionType(const string &type);

	ExceptionType GetType() const {
		return type;
	}
	//! The message without the "<Type> Error: " prefix
	const string &RawMessage() const {
		return raw_message;
	}
	const unordered_map<string, string> &ExtraInfo() const {
		return extra_info;
	}

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		const std::size_t num_args = sizeof...(ARGS);
		if (num_args == 0) {
			return msg;
		}
		std::vector<ExceptionFormatValue> values;
		return ConstructMessageRecursive(msg, values, params...);
	}

	EXTSORT_API static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values);

	template <class T, typename... ARGS>
	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values, T param,
	                                        ARGS... params) {
		values.push_back(ExceptionFormatValue::CreateFormatValue<T>(param));
		return ConstructMessageRecursive(msg, values, params...);
	}

private:
	static string ConstructFinalMessage(ExceptionType type, const string &message);

	ExceptionType type;
	string raw_message;
	unordered_map<string, string> extra_info;
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class IOException : public Exception {
public:
	EXTSORT_API explicit IOException(const string &msg);
	EXTSORT_API explicit IOException(const unordered_map<string, string> &extra_info, const string &msg);

	template <typename... ARGS>
	explicit IOException(const string &msg, ARGS... params) : IOException(ConstructMessage(msg, params...)) {
	}
	template <typename... ARGS>
	explicit IOException(const unordered_map<string, string> &extra_info, const string &msg, ARGS... params)
	    : IOException(extra_info, ConstructMessage(msg, params...)) {
	}
};

class SerializationException : public Exception {
public:
	EXTSORT_API explicit SerializationException(const string &msg);

	template <typename... ARGS>
	explicit SerializationException(const string &msg, ARGS... params)
	    : SerializationException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	EXTSORT_API explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	EXTSORT_API explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	EXTSORT_API explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class InvalidConfigurationException : public Exception {
public:
	EXTSORT_API explicit InvalidConfigurationException(const string &msg);

	template <typename... ARGS>
	explicit InvalidConfigurationException(const string &msg, ARGS... params)
	    : InvalidConfigurationException(ConstructMessage(msg, params...)) {
	}
};

} // namespace extsort
