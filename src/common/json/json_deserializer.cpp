#include "remotefs/common/json/json_deserializer.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace remotefs {

JsonDeserializer::JsonDeserializer(const JsonValue &value_p, string path_p) : value(value_p), path(std::move(path_p)) {
}

void JsonDeserializer::VerifyKind(JsonKind expected) const {
	if (value.GetType() != expected) {
		throw SerializationException("Failed to deserialize %s: expected %s but got %s", path,
		                             JsonKindToString(expected), JsonKindToString(value.GetType()));
	}
}

const JsonValue *JsonDeserializer::FindProperty(const string &tag) {
	VerifyKind(JsonKind::OBJECT);
	return value.FindCaseInsensitive(tag);
}

bool JsonDeserializer::HasProperty(const string &tag) {
	auto entry = FindProperty(tag);
	return entry && !entry->IsNull();
}

string JsonDeserializer::ReadString() {
	VerifyKind(JsonKind::STRING);
	return value.As<string>();
}

bool JsonDeserializer::ReadBoolean() {
	VerifyKind(JsonKind::BOOLEAN);
	return value.As<bool>();
}

double JsonDeserializer::ReadDouble() {
	VerifyKind(JsonKind::NUMBER);
	return value.As<double>();
}

[[noreturn]] static void ThrowOutOfRange(const string &path, const JsonValue &value) {
	throw SerializationException("Failed to deserialize %s: number %s is out of range for the target type", path,
	                             value.ToString());
}

double JsonDeserializer::ReadWholeNumber() {
	auto number = ReadDouble();
	if (std::trunc(number) != number) {
		throw SerializationException("Failed to deserialize %s: number %s is not an integer", path,
		                             value.ToString());
	}
	return number;
}

int64_t JsonDeserializer::ReadSignedInteger(int64_t min) {
	VerifyKind(JsonKind::NUMBER);
	// two's complement: max is -(min + 1)
	auto max = -(min + 1);
	if (value.IsInteger()) {
		// integer literals are parsed exactly, a double cannot hold every 64-bit value
		errno = 0;
		auto result = std::strtoll(value.GetNumberText().c_str(), nullptr, 10);
		if (errno == ERANGE || result < min || result > max) {
			ThrowOutOfRange(path, value);
		}
		return static_cast<int64_t>(result);
	}
	auto number = ReadWholeNumber();
	// -min is exactly representable as a double, max is not for 64-bit targets
	if (number < static_cast<double>(min) || number >= -static_cast<double>(min)) {
		ThrowOutOfRange(path, value);
	}
	return static_cast<int64_t>(number);
}

uint64_t JsonDeserializer::ReadUnsignedInteger(uint64_t max) {
	VerifyKind(JsonKind::NUMBER);
	if (value.IsInteger()) {
		auto &text = value.GetNumberText();
		if (text[0] == '-') {
			if (value.As<double>() != 0) {
				ThrowOutOfRange(path, value);
			}
			return 0;
		}
		errno = 0;
		auto result = std::strtoull(text.c_str(), nullptr, 10);
		if (errno == ERANGE || result > max) {
			ThrowOutOfRange(path, value);
		}
		return static_cast<uint64_t>(result);
	}
	auto number = ReadWholeNumber();
	if (number < 0 || number >= static_cast<double>(max) + 1.0) {
		ThrowOutOfRange(path, value);
	}
	return static_cast<uint64_t>(number);
}

} // namespace remotefs
