#include "remotefs/reader/scan_target.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

string &ScanTarget::GetText() const {
	if (type != ScanTargetType::TEXT) {
		throw InternalException("ScanTarget::GetText called on a %s target", ScanTargetTypeToString(type));
	}
	return *reinterpret_cast<string *>(target);
}

string ScanTargetTypeToString(ScanTargetType type) {
	switch (type) {
	case ScanTargetType::TEXT:
		return "TEXT";
	case ScanTargetType::JSON_VALUE:
		return "JSON_VALUE";
	case ScanTargetType::DESERIALIZABLE:
		return "DESERIALIZABLE";
	default:
		throw InternalException("Unrecognized ScanTargetType %d", static_cast<int>(type));
	}
}

} // namespace remotefs
