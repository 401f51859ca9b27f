//===----------------------------------------------------------------------===//
//                         ExtSort
//
// extsort/sort/sort_codec.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extsort/common/constants.hpp"
#include "extsort/common/exception.hpp"
#include "extsort/common/helper.hpp"
#include "extsort/common/serializer/read_stream.hpp"
#include "extsort/common/serializer/write_stream.hpp"

#include <limits>
#include <type_traits>
#include <utility>

namespace extsort {

//! SortCodec<T> turns a record into bytes and back. Decode returns false when the stream ends cleanly on a record
//! boundary, and throws (SerializationException or IOException) when a record is partial or malformed.
//!
//! The primary template forwards to the record type itself, which then has to provide:
//!   void Encode(WriteStream &target) const;
//!   static bool Decode(ReadStream &source, T &result);
template <class T, class ENABLE = void>
struct SortCodec {
	static void Encode(const T &item, WriteStream &target) {
		item.Encode(target);
	}
	static bool Decode(ReadStream &source, T &result) {
		return T::Decode(source, result);
	}
};

//! Fixed width, native byte order
template <class T>
struct SortCodec<T, typename std::enable_if<std::is_arithmetic<T>::value>::type> {
	static void Encode(const T &item, WriteStream &target) {
		target.Write<T>(item);
	}
	static bool Decode(ReadStream &source, T &result) {
		if (source.Finished()) {
			return false;
		}
		result = source.Read<T>();
		return true;
	}
};

//! uint32 length prefix followed by the raw bytes
template <>
struct SortCodec<string> {
	//! The bytes are read in chunks of this size, a corrupt length prefix fails before it is allocated in full
	static constexpr const idx_t DECODE_CHUNK_SIZE = 65536;

	static void Encode(const string &item, WriteStream &target) {
		if (item.size() > std::numeric_limits<uint32_t>::max()) {
			throw InvalidInputException("Cannot encode a string of %llu bytes: strings are limited to 4GB",
			                            static_cast<idx_t>(item.size()));
		}
		target.Write<uint32_t>(static_cast<uint32_t>(item.size()));
		target.WriteData(const_data_ptr_cast(item.data()), item.size());
	}
	static bool Decode(ReadStream &source, string &result) {
		if (source.Finished()) {
			return false;
		}
		idx_t remaining = source.Read<uint32_t>();
		result.clear();
		while (remaining > 0) {
			auto chunk_size = MinValue<idx_t>(remaining, DECODE_CHUNK_SIZE);
			auto offset = result.size();
			result.resize(offset + chunk_size);
			source.ReadData(data_ptr_cast(&result[offset]), chunk_size);
			remaining -= chunk_size;
		}
		return true;
	}
};

//! first then second; running out of data between the two halves is a partial record
template <class A, class B>
struct SortCodec<std::pair<A, B>> {
	static void Encode(const std::pair<A, B> &item, WriteStream &target) {
		SortCodec<A>::Encode(item.first, target);
		SortCodec<B>::Encode(item.second, target);
	}
	static bool Decode(ReadStream &source, std::pair<A, B> &result) {
		if (!SortCodec<A>::Decode(source, result.first)) {
			return false;
		}
		if (!SortCodec<B>::Decode(source, result.second)) {
			throw SerializationException("Partial record: stream ended between the two halves of a pair");
		}
		return true;
	}
};

} // namespace extsort
