#include "remotefs/reader/json_object_reader.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

JSONObjectReader::JSONObjectReader(unique_ptr<JSONStreamDecoder> decoder_p)
    : SequentialReader(FormatToken::OBJECT), decoder(std::move(decoder_p)), scanned(false) {
}

bool JSONObjectReader::Next() {
	return !scanned;
}

void JSONObjectReader::ScanInto(const ScanTarget &target) {
	if (scanned) {
		throw IOException("Cannot scan \"%s\": the JSON value was already decoded", decoder->GetPath());
	}
	scanned = true;
	auto value = decoder->Decode();
	target.Assign(value);
}

} // namespace remotefs
