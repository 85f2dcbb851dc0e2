//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/json_stream_decoder.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/json/json_parser.hpp"
#include "remotefs/reader/buffered_handle_reader.hpp"

namespace remotefs {

//! Decodes JSON values one at a time from the byte stream of a handle
class JSONStreamDecoder {
public:
	JSONStreamDecoder(RemoteFileHandle &handle, idx_t buffer_size);

	//! Classify the next token without consuming it, returns '\0' at the end of the input
	char PeekToken() {
		return parser.PeekToken();
	}
	//! Consume the given structural character if it is the next token
	bool MatchToken(char c) {
		return parser.MatchToken(c);
	}
	//! Decode the next complete value
	JsonValue Decode() {
		return parser.ParseValue();
	}
	[[noreturn]] void Error(const string &msg) {
		parser.Error(msg);
	}

	const string &GetPath() const {
		return reader.GetPath();
	}

private:
	BufferedHandleReader reader;
	JsonParser parser;
};

} // namespace remotefs
