#include "remotefs/reader/format_reader_factory.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/common/string_util.hpp"
#include "remotefs/logging/logger.hpp"
#include "remotefs/reader/json_array_reader.hpp"
#include "remotefs/reader/json_object_reader.hpp"
#include "remotefs/reader/line_reader.hpp"
#include "remotefs/remote/remote_file_system.hpp"

namespace remotefs {

bool FormatReaderFactory::IsJSONPath(const string &path, const string &json_extension) {
	return !json_extension.empty() && StringUtil::EndsWith(path, json_extension);
}

bool FormatReaderFactory::IsValueStart(char c) {
	switch (c) {
	case '{':
	case '[':
	case '"':
	case 't':
	case 'f':
	case 'n':
	case '-':
		return true;
	default:
		return StringUtil::CharacterIsDigit(c);
	}
}

unique_ptr<SequentialReader> FormatReaderFactory::Open(RemoteFileHandle &handle) {
	// text and array readers continue from the current position of the handle
	auto &config = handle.file_system.GetConfig();
	if (!IsJSONPath(handle.GetPath(), config.json_extension)) {
		return make_uniq<LineReader>(make_uniq<BufferedHandleReader>(handle, config.read_buffer_size));
	}

	auto decoder = make_uniq<JSONStreamDecoder>(handle, config.read_buffer_size);
	char token = '\0';
	try {
		// the peek leaves the token in the buffer, the decoder has not consumed anything yet
		token = decoder->PeekToken();
		if (!IsValueStart(token)) {
			if (token == '\0') {
				decoder->Error("unexpected end of input, expected a JSON value");
			}
			decoder->Error(StringUtil::Format("unexpected character '%s', expected a JSON value", string(1, token)));
		}
	} catch (std::exception &ex) {
		ErrorData error(ex);
		REMOTEFS_LOG_ERROR(handle, "failed to decode JSON token from \"%s\": %s", handle.GetPath(), error.Message());
		throw;
	}
	if (token == '[') {
		return make_uniq<JSONArrayReader>(std::move(decoder));
	}
	// a single value is decoded in one go, so start over with a fresh stream instead of resuming this one
	handle.Reset();
	decoder = make_uniq<JSONStreamDecoder>(handle, config.read_buffer_size);
	return make_uniq<JSONObjectReader>(std::move(decoder));
}

} // namespace remotefs
