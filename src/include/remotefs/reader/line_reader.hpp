//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/line_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/reader/buffered_handle_reader.hpp"
#include "remotefs/reader/sequential_reader.hpp"

#include <exception>

namespace remotefs {

//! Yields the lines of a text file. Only string targets can be scanned.
class LineReader : public SequentialReader {
public:
	explicit LineReader(unique_ptr<BufferedHandleReader> reader);

	bool Next() override;
	void ScanInto(const ScanTarget &target) override;

private:
	unique_ptr<BufferedHandleReader> reader;
	string current_line;
	bool line_ready;
	bool finished;
	std::exception_ptr lookahead_error;
};

} // namespace remotefs
