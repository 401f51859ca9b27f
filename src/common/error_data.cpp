#include "extsort/common/error_data.hpp"

#include "extsort/common/assert.hpp"

#include <new>

namespace extsort {

ErrorData::ErrorData() : initialized(false), type(ExceptionType::INVALID) {
}

ErrorData::ErrorData(const Exception &ex)
    : initialized(true), type(ex.GetType()), raw_message(ex.RawMessage()), extra_info(ex.ExtraInfo()) {
	final_message = ConstructFinalMessage();
}

ErrorData::ErrorData(const std::exception &ex) : initialized(true), type(ExceptionType::INVALID) {
	auto extsort_ex = dynamic_cast<const Exception *>(&ex);
	if (extsort_ex) {
		type = extsort_ex->GetType();
		raw_message = extsort_ex->RawMessage();
		extra_info = extsort_ex->ExtraInfo();
	} else if (dynamic_cast<const std::bad_alloc *>(&ex)) {
		type = ExceptionType::OUT_OF_MEMORY;
		raw_message = "Allocation failure";
	} else {
		raw_message = ex.what();
	}
	final_message = ConstructFinalMessage();
}

ErrorData::ErrorData(ExceptionType type, const string &message)
    : initialized(true), type(type), raw_message(message), final_message(ConstructFinalMessage()) {
}

string ErrorData::ConstructFinalMessage() const {
	return Exception::ExceptionTypeToString(type) + " Error: " + raw_message;
}

void ErrorData::Throw(const string &prepended_message) const {
	D_ASSERT(initialized);
	if (!prepended_message.empty()) {
		string new_message = prepended_message + raw_message;
		throw Exception(extra_info, type, new_message);
	} else {
		throw Exception(extra_info, type, raw_message);
	}
}

const ExceptionType &ErrorData::Type() const {
	D_ASSERT(initialized);
	return this->type;
}

bool ErrorData::operator==(const ErrorData &other) const {
	if (initialized != other.initialized) {
		return false;
	}
	if (type != other.type) {
		return false;
	}
	return raw_message == other.raw_message;
}

void ErrorData::Reset() {
	initialized = false;
	type = ExceptionType::INVALID;
	raw_message.clear();
	final_message.clear();
	extra_info.clear();
}

} // namespace extsort
