#include "remotefs/common/enums/format_token.hpp"
#include "remotefs/common/enums/seek_whence.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

string SeekWhenceToString(SeekWhence whence) {
	switch (whence) {
	case SeekWhence::START:
		return "START";
	case SeekWhence::CURRENT:
		return "CURRENT";
	case SeekWhence::END:
		return "END";
	default:
		return "UNKNOWN(" + std::to_string(static_cast<int>(whence)) + ")";
	}
}

string FormatTokenToString(FormatToken token) {
	switch (token) {
	case FormatToken::ARRAY:
		return "ARRAY";
	case FormatToken::OBJECT:
		return "OBJECT";
	case FormatToken::TEXT:
		return "TEXT";
	default:
		throw InternalException("Unrecognized FormatToken %d", static_cast<int>(token));
	}
}

} // namespace remotefs
