#include "extsort/common/exception.hpp"

#include <fmt/args.h>
#include <fmt/format.h>
#include <fmt/printf.h>

namespace extsort {

ExceptionFormatValue::ExceptionFormatValue(double dbl_val)
    : type(ExceptionFormatValueType::FORMAT_VALUE_TYPE_DOUBLE), dbl_val(dbl_val) {
}
ExceptionFormatValue::ExceptionFormatValue(int64_t int_val)
    : type(ExceptionFormatValueType::FORMAT_VALUE_TYPE_INTEGER), int_val(int_val) {
}
ExceptionFormatValue::ExceptionFormatValue(uint64_t uint_val)
    : type(ExceptionFormatValueType::FORMAT_VALUE_TYPE_INTEGER), uint_val(uint_val), is_unsigned(true) {
}
ExceptionFormatValue::ExceptionFormatValue(string str_val)
    : type(ExceptionFormatValueType::FORMAT_VALUE_TYPE_STRING), str_val(std::move(str_val)) {
}

template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(float value) {
	return ExceptionFormatValue(static_cast<double>(value));
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(double value) {
	return ExceptionFormatValue(value);
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(string value) {
	return ExceptionFormatValue(std::move(value));
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const char *value) {
	return ExceptionFormatValue(string(value));
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(char *value) {
	return ExceptionFormatValue(string(value));
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(unsigned long value) {
	return ExceptionFormatValue(static_cast<uint64_t>(value));
}
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(unsigned long long value) {
	return ExceptionFormatValue(static_cast<uint64_t>(value));
}

string ExceptionFormatValue::Format(const string &msg, std::vector<ExceptionFormatValue> &values) {
	try {
		fmt::dynamic_format_arg_store<fmt::printf_context> format_args;
		for (auto &val : values) {
			switch (val.type) {
			case ExceptionFormatValueType::FORMAT_VALUE_TYPE_DOUBLE:
				format_args.push_back(val.dbl_val);
				break;
			case ExceptionFormatValueType::FORMAT_VALUE_TYPE_INTEGER:
				if (val.is_unsigned) {
					format_args.push_back(val.uint_val);
				} else {
					format_args.push_back(val.int_val);
				}
				break;
			case ExceptionFormatValueType::FORMAT_VALUE_TYPE_STRING:
				format_args.push_back(val.str_val);
				break;
			}
		}
		return fmt::vsprintf(fmt::string_view(msg), format_args);
	} catch (std::exception &ex) { // LCOV_EXCL_START
		throw InternalException(std::string("Primary exception: ") + msg +
		                        "\nSecondary exception in ExceptionFormatValue: " + ex.what());
	} // LCOV_EXCL_STOP
}

} // namespace extsort
