//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/buffered_handle_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/byte_source.hpp"

namespace remotefs {

class RemoteFileHandle;

//! Reads the byte stream of a handle in fixed-size chunks. Every refill is a single Read on the handle.
class BufferedHandleReader : public ByteSource {
public:
	BufferedHandleReader(RemoteFileHandle &handle, idx_t buffer_size);

	char Peek() override;
	char Get() override;
	bool Finished() override;
	idx_t Position() const override {
		return position;
	}

	//! Read the next line without the trailing newline (and carriage return). Returns false at the end of input.
	bool ReadLine(string &result);
	//! Rewind the handle to the start of the file and drop all buffered bytes
	void Reset();

	const string &GetPath() const;

private:
	bool Refill();

private:
	RemoteFileHandle &handle;
	idx_t buffer_size;
	unique_ptr<data_t[]> buffer;
	idx_t buffer_count;
	idx_t buffer_offset;
	idx_t position;
	bool end_of_file;
};

} // namespace remotefs
