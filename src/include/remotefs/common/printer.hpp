//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/printer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/string_util.hpp"

namespace remotefs {

enum class OutputStream : uint8_t { STREAM_STDOUT = 1, STREAM_STDERR = 2 };

//! Printer is a static class that allows printing to logs or stdout/stderr
class Printer {
public:
	//! Print the object to the stream
	static void Print(OutputStream stream, const string &str);
	//! Print the object to stderr
	static void Print(const string &str);
	//! Print the formatted object to the stream
	template <typename... ARGS>
	static void PrintF(OutputStream stream, const string &str, ARGS... params) {
		Printer::Print(stream, StringUtil::Format(str, params...));
	}
	//! Print the formatted object to stderr
	template <typename... ARGS>
	static void PrintF(const string &str, ARGS... params) {
		Printer::PrintF(OutputStream::STREAM_STDERR, str, std::forward<ARGS>(params)...);
	}
	//! Directly prints the string to stdout without a newline
	static void RawPrint(OutputStream stream, const string &str);
	//! Flush an output stream
	static void Flush(OutputStream stream);
	//! Whether or not we are printing to a terminal
	static bool IsTerminal(OutputStream stream);
};

} // namespace remotefs
