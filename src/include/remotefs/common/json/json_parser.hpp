//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/json/json_parser.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/byte_source.hpp"
#include "remotefs/common/json/json_value.hpp"

namespace remotefs {

//! Recursive descent JSON parser that pulls its input from a ByteSource one byte at a time, so that a document can
//! be decoded value by value without materializing the whole input
class JsonParser {
public:
	static constexpr const idx_t MAX_RECURSION_DEPTH = 1000;

public:
	explicit JsonParser(ByteSource &source);

	//! Parse the next value from the source
	JsonValue ParseValue();
	//! Skip whitespace and return the next significant character without consuming it ('\0' at the end of input)
	char PeekToken();
	//! Skip whitespace and consume the given character if it is next
	bool MatchToken(char c);
	//! Skip whitespace, returns true if the source has been exhausted
	bool AtEnd();

	[[noreturn]] void Error(const string &msg);

private:
	char Next();
	char Peek();
	bool Match(char c);
	bool Match(const char *str);
	void MatchWhiteSpace();
	bool MatchToken(const char *str);

	JsonValue ParseValueInternal();
	string ParseString();
	JsonValue ParseNumber(char first);
	uint32_t ParseHexQuad();
	static void AppendUTF8(string &target, uint32_t codepoint);

private:
	ByteSource &source;
	idx_t line;
	idx_t recursion_depth;
};

} // namespace remotefs
