//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/json_object_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/reader/json_stream_decoder.hpp"
#include "remotefs/reader/sequential_reader.hpp"

namespace remotefs {

//! Decodes a single top-level JSON value in one Scan. Next() is true until a Scan has been attempted.
class JSONObjectReader : public SequentialReader {
public:
	//! The decoder must be positioned at the start of the file
	explicit JSONObjectReader(unique_ptr<JSONStreamDecoder> decoder);

	bool Next() override;
	void ScanInto(const ScanTarget &target) override;

private:
	unique_ptr<JSONStreamDecoder> decoder;
	bool scanned;
};

} // namespace remotefs
