//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/transfer/transfer_stream.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

//! A short-lived byte stream produced (or consumed) by a single transfer operation
class TransferStream {
public:
	virtual ~TransferStream() {
	}

	//! Read up to nr_bytes into the buffer, returns the number of bytes read (0 once the stream is exhausted)
	virtual idx_t Read(data_ptr_t buffer, idx_t nr_bytes) = 0;
	//! Release the underlying transfer. Implementations also release it on destruction.
	virtual void Close() = 0;

public:
	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
};

//! A stream over a block of memory. Either borrows the memory or owns a copy of it.
class MemoryTransferStream : public TransferStream {
public:
	//! Borrow the given buffer, which must outlive the stream
	MemoryTransferStream(const_data_ptr_t data, idx_t size);
	//! Take ownership of the given bytes
	explicit MemoryTransferStream(string data);

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override;
	void Close() override;

	idx_t GetPosition() const {
		return position;
	}
	idx_t GetSize() const {
		return size;
	}
	bool IsClosed() const {
		return closed;
	}

private:
	string owned_data;
	const_data_ptr_t data;
	idx_t size;
	idx_t position;
	bool closed;
};

} // namespace remotefs
