#include "remotefs/common/printer.hpp"

#include <stdio.h>

#ifndef REMOTEFS_DISABLE_PRINT
#include <unistd.h>
#endif

namespace remotefs {

void Printer::RawPrint(OutputStream stream, const string &str) {
#ifndef REMOTEFS_DISABLE_PRINT
	fprintf(stream == OutputStream::STREAM_STDERR ? stderr : stdout, "%s", str.c_str());
#endif
}

// LCOV_EXCL_START
void Printer::Print(OutputStream stream, const string &str) {
	Printer::RawPrint(stream, str);
	Printer::RawPrint(stream, "\n");
}
void Printer::Flush(OutputStream stream) {
#ifndef REMOTEFS_DISABLE_PRINT
	fflush(stream == OutputStream::STREAM_STDERR ? stderr : stdout);
#endif
}

void Printer::Print(const string &str) {
	Printer::Print(OutputStream::STREAM_STDERR, str);
}

bool Printer::IsTerminal(OutputStream stream) {
#ifndef REMOTEFS_DISABLE_PRINT
	return isatty(stream == OutputStream::STREAM_STDERR ? 2 : 1);
#else
	throw InternalException("IsTerminal called while printing is disabled");
#endif
}
// LCOV_EXCL_STOP

} // namespace remotefs
