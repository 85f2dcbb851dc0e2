//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/byte_source.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

//! A forward-only source of bytes with a single byte of lookahead.
//! Peek and Get return '\0' once the source is exhausted.
class ByteSource {
public:
	virtual ~ByteSource() {
	}

	//! Returns the next byte without consuming it
	virtual char Peek() = 0;
	//! Returns and consumes the next byte
	virtual char Get() = 0;
	//! Whether or not all bytes have been consumed
	virtual bool Finished() = 0;
	//! The number of bytes consumed so far
	virtual idx_t Position() const = 0;
};

//! ByteSource over an in-memory string
class StringByteSource : public ByteSource {
public:
	explicit StringByteSource(const string &data_p) : data(data_p), position(0) {
	}

	char Peek() override {
		return position < data.size() ? data[position] : '\0';
	}
	char Get() override {
		return position < data.size() ? data[position++] : '\0';
	}
	bool Finished() override {
		return position >= data.size();
	}
	idx_t Position() const override {
		return position;
	}

private:
	const string &data;
	idx_t position;
};

} // namespace remotefs
