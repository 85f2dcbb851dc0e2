#include "remotefs/reader/json_array_reader.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

JSONArrayReader::JSONArrayReader(unique_ptr<JSONStreamDecoder> decoder_p)
    : SequentialReader(FormatToken::ARRAY), decoder(std::move(decoder_p)), opened(false), needs_separator(false),
      element_ready(false), finished(false), element_count(0) {
}

bool JSONArrayReader::Next() {
	if (element_ready) {
		return true;
	}
	if (finished) {
		return false;
	}
	try {
		if (!opened) {
			if (!decoder->MatchToken('[')) {
				decoder->Error("expected '[' at the start of the array");
			}
			opened = true;
			if (decoder->MatchToken(']')) {
				finished = true;
				return false;
			}
		} else if (needs_separator) {
			if (decoder->MatchToken(']')) {
				finished = true;
				return false;
			}
			if (!decoder->MatchToken(',')) {
				decoder->Error("expected ',' or ']' after an array element");
			}
			needs_separator = false;
		}
		element_ready = true;
		return true;
	} catch (std::exception &ex) {
		// reported by the next Scan
		lookahead_error = std::current_exception();
		element_ready = true;
		return true;
	}
}

void JSONArrayReader::ScanInto(const ScanTarget &target) {
	if (!Next()) {
		throw IOException("Cannot scan \"%s\": end of JSON array reached", decoder->GetPath());
	}
	element_ready = false;
	if (lookahead_error) {
		finished = true;
		auto error = lookahead_error;
		lookahead_error = nullptr;
		std::rethrow_exception(error);
	}
	JsonValue value;
	try {
		value = decoder->Decode();
	} catch (std::exception &ex) {
		// the decoder cannot resume after a structural error
		finished = true;
		throw;
	}
	needs_separator = true;
	element_count++;
	target.Assign(value);
}

} // namespace remotefs
