//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/format_reader_factory.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/reader/sequential_reader.hpp"

namespace remotefs {

class RemoteFileHandle;

//! Picks the sequential reader for a file. Files without the configured JSON extension are read line by line.
//! JSON files are classified by their first token: an array is streamed element by element, any other value is
//! decoded as a whole from a fresh stream.
class FormatReaderFactory {
public:
	//! Open a reader over the whole file, the handle is rewound to its start first
	static unique_ptr<SequentialReader> Open(RemoteFileHandle &handle);

	//! Whether the path is read as JSON under the given extension
	static bool IsJSONPath(const string &path, const string &json_extension);
	//! Whether c can start a JSON value
	static bool IsValueStart(char c);
};

} // namespace remotefs
