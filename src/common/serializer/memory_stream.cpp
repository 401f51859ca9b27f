#include "extsort/common/serializer/memory_stream.hpp"

#include "extsort/common/exception.hpp"

#include <cstring>

namespace extsort {

MemoryStream::MemoryStream(idx_t capacity) : position(0) {
	data.reserve(capacity);
}

void MemoryStream::WriteData(const_data_ptr_t source, idx_t write_size) {
	data.insert(data.end(), source, source + write_size);
}

void MemoryStream::ReadData(data_ptr_t destination, idx_t read_size) {
	if (position + read_size > data.size()) {
		throw SerializationException("Failed to deserialize: not enough data in buffer to fulfill read request");
	}
	if (read_size > 0) {
		memcpy(destination, data.data() + position, read_size);
	}
	position += read_size;
}

bool MemoryStream::Finished() {
	return position >= data.size();
}

void MemoryStream::Rewind() {
	position = 0;
}

idx_t MemoryStream::GetSize() const {
	return data.size();
}

idx_t MemoryStream::GetPosition() const {
	return position;
}

} // namespace extsort
