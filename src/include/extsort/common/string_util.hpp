//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"
#include "extsort/common/exception.hpp"

namespace extsort {

/**
 * String Utility Functions
 * Note that these are not the most efficient implementations (i.e., they copy
 * memory) and therefore they should only be used for debug messages and other
 * such things.
 */
class StringUtil {
public:
	static bool CharacterIsSpace(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}
	static bool CharacterIsDigit(char c) {
		return c >= '0' && c <= '9';
	}
	static char CharacterToLower(char c) {
		if (c >= 'A' && c <= 'Z') {
			return static_cast<char>(c - ('A' - 'a'));
		}
		return c;
	}

	//! Returns true if the needle string exists in the haystack
	EXTSORT_API static bool Contains(const string &haystack, const string &needle);

	//! Returns true if the target string starts with the given prefix
	EXTSORT_API static bool StartsWith(string str, string prefix);

	//! Returns true if the target string <b>ends</b> with the given suffix.
	EXTSORT_API static bool EndsWith(const string &str, const string &suffix);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	EXTSORT_API static string Join(const vector<string> &input, const string &separator);

	//! Convert a string to lowercase
	EXTSORT_API static string Lower(const string &str);

	//! Case insensitive equals
	EXTSORT_API static bool CIEquals(const string &l1, const string &l2);

	//! Format a string using printf semantics
	template <typename... ARGS>
	static string Format(const string fmt_str, ARGS... params) {
		return Exception::ConstructMessage(fmt_str, params...);
	}

	//! Remove the whitespace char in the left end of the string
	EXTSORT_API static void LTrim(string &str);
	//! Remove the whitespace char in the right end of the string
	EXTSORT_API static void RTrim(string &str);
	//! Remove the whitespace char in the left and right end of the string
	EXTSORT_API static void Trim(string &str);

	//! Convert a number of bytes into a human readable string (e.g. 10.0 MiB)
	EXTSORT_API static string BytesToHumanReadableString(idx_t bytes, idx_t multiplier = 1024);
};

} // namespace extsort
