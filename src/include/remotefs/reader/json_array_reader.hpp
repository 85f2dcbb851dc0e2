//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/json_array_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/reader/json_stream_decoder.hpp"
#include "remotefs/reader/sequential_reader.hpp"

#include <exception>

namespace remotefs {

//! Yields the elements of a top-level JSON array one at a time, without decoding the whole array
class JSONArrayReader : public SequentialReader {
public:
	//! The decoder must be positioned before the opening '[' of the array
	explicit JSONArrayReader(unique_ptr<JSONStreamDecoder> decoder);

	bool Next() override;
	void ScanInto(const ScanTarget &target) override;

	//! The number of elements scanned so far
	idx_t ElementCount() const {
		return element_count;
	}

private:
	unique_ptr<JSONStreamDecoder> decoder;
	//! whether the opening bracket was consumed
	bool opened;
	//! whether a ',' or ']' is expected before the next element
	bool needs_separator;
	bool element_ready;
	bool finished;
	idx_t element_count;
	std::exception_ptr lookahead_error;
};

} // namespace remotefs
