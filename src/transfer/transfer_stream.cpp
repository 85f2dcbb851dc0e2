#include "remotefs/transfer/transfer_stream.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/helper.hpp"

namespace remotefs {

MemoryTransferStream::MemoryTransferStream(const_data_ptr_t data_p, idx_t size_p)
    : data(data_p), size(size_p), position(0), closed(false) {
}

MemoryTransferStream::MemoryTransferStream(string data_p)
    : owned_data(std::move(data_p)), data(const_data_ptr_cast(owned_data.c_str())), size(owned_data.size()),
      position(0), closed(false) {
}

idx_t MemoryTransferStream::Read(data_ptr_t buffer, idx_t nr_bytes) {
	if (closed) {
		throw IOException("Cannot read from a closed stream");
	}
	auto to_read = MinValue<idx_t>(nr_bytes, size - position);
	if (to_read > 0) {
		memcpy(buffer, data + position, to_read);
		position += to_read;
	}
	return to_read;
}

void MemoryTransferStream::Close() {
	closed = true;
}

} // namespace remotefs
