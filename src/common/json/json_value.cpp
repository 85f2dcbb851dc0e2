#include "remotefs/common/json/json_value.hpp"
#include "remotefs/common/json/json_parser.hpp"
#include "remotefs/common/string_util.hpp"

#include "fmt/format.h"

#include <cmath>
#include <cstdlib>

namespace remotefs {

constexpr const idx_t JsonParser::MAX_RECURSION_DEPTH;

string JsonKindToString(JsonKind kind) {
	switch (kind) {
	case JsonKind::NULLVALUE:
		return "NULL";
	case JsonKind::BOOLEAN:
		return "BOOLEAN";
	case JsonKind::NUMBER:
		return "NUMBER";
	case JsonKind::STRING:
		return "STRING";
	case JsonKind::ARRAY:
		return "ARRAY";
	case JsonKind::OBJECT:
		return "OBJECT";
	default:
		throw InternalException("Unrecognized JSON kind %d", static_cast<int>(kind));
	}
}

//------------------------------------------------------
// JsonParser
//------------------------------------------------------
JsonParser::JsonParser(ByteSource &source_p) : source(source_p), line(1), recursion_depth(0) {
}

void JsonParser::Error(const string &msg) {
	throw SerializationException("JsonParser: Error at line %d, (byte position: %d): %s", line, source.Position(),
	                             msg);
}

char JsonParser::Next() {
	auto c = source.Get();
	if (c == '\n') {
		line++;
	}
	return c;
}

char JsonParser::Peek() {
	return source.Peek();
}

bool JsonParser::Match(char c) {
	if (Peek() == c) {
		Next();
		return true;
	}
	return false;
}

// the source cannot be rewound, so a partial match of a literal is an error in the document
bool JsonParser::Match(const char *str) {
	while (*str) {
		if (*str != Peek()) {
			return false;
		}
		Next();
		str++;
	}
	return true;
}

void JsonParser::MatchWhiteSpace() {
	while (true) {
		auto c = Peek();
		if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
			break;
		}
		Next();
	}
}

bool JsonParser::MatchToken(const char *str) {
	MatchWhiteSpace();
	return Match(str);
}

bool JsonParser::MatchToken(char c) {
	MatchWhiteSpace();
	return Match(c);
}

char JsonParser::PeekToken() {
	MatchWhiteSpace();
	return Peek();
}

bool JsonParser::AtEnd() {
	MatchWhiteSpace();
	return source.Finished();
}

JsonValue JsonParser::ParseValue() {
	recursion_depth++;
	if (recursion_depth > MAX_RECURSION_DEPTH) {
		Error(StringUtil::Format("Recursion depth exceeded maximum depth of %d", MAX_RECURSION_DEPTH));
	}
	auto result = ParseValueInternal();
	recursion_depth--;
	return result;
}

JsonValue JsonParser::ParseValueInternal() {
	MatchWhiteSpace();
	auto c = Next();
	switch (c) {
	case '{': {
		JsonValue obj(JsonKind::OBJECT);
		if (MatchToken('}')) {
			return obj;
		}
		while (true) {
			if (!MatchToken('"')) {
				Error("Expected string key in object");
			}
			auto key = ParseString();
			if (!MatchToken(":")) {
				Error("Expected colon after key in object");
			}
			auto value = ParseValue();
			obj.Emplace(key, std::move(value));
			if (!MatchToken(',')) {
				break;
			}
		}
		if (!MatchToken('}')) {
			Error("Expected closing brace after object");
		}
		return obj;
	}
	case '[': {
		JsonValue arr(JsonKind::ARRAY);
		if (MatchToken(']')) {
			return arr;
		}
		while (true) {
			auto value = ParseValue();
			arr.Emplace(std::move(value));
			if (!MatchToken(',')) {
				break;
			}
		}
		if (!MatchToken(']')) {
			Error("Expected closing bracket after array");
		}
		return arr;
	}
	case 'n': {
		if (!Match("ull")) {
			Error("Found 'n' but expected 'null'");
		}
		return JsonValue(JsonKind::NULLVALUE);
	}
	case 't': {
		if (!Match("rue")) {
			Error("Found 't' but expected 'true'");
		}
		return JsonValue(true);
	}
	case 'f': {
		if (!Match("alse")) {
			Error("Found 'f' but expected 'false'");
		}
		return JsonValue(false);
	}
	case '"':
		return JsonValue(ParseString());
	case '-':
	case '0':
	case '1':
	case '2':
	case '3':
	case '4':
	case '5':
	case '6':
	case '7':
	case '8':
	case '9':
		return ParseNumber(c);
	case '\0':
		Error("Unexpected end of input");
	default:
		Error(StringUtil::Format("Unexpected character '%s'", string(1, c)));
	}
}

// the opening quote has already been consumed
string JsonParser::ParseString() {
	string str;
	while (true) {
		auto c = Next();
		if (c == 0) {
			Error("Expected closing quote");
		} else if (c == '\\') {
			c = Next();
			switch (c) {
			case '"':
				str += '"';
				break;
			case '\\':
				str += '\\';
				break;
			case '/':
				str += '/';
				break;
			case 'b':
				str += '\b';
				break;
			case 'f':
				str += '\f';
				break;
			case 'n':
				str += '\n';
				break;
			case 'r':
				str += '\r';
				break;
			case 't':
				str += '\t';
				break;
			case 'u': {
				auto codepoint = ParseHexQuad();
				if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
					// high surrogate: must be followed by an escaped low surrogate
					if (!Match("\\u")) {
						Error("Expected low surrogate after high surrogate in unicode escape");
					}
					auto low = ParseHexQuad();
					if (low < 0xDC00 || low > 0xDFFF) {
						Error("Invalid low surrogate in unicode escape");
					}
					codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
				} else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
					Error("Unexpected low surrogate in unicode escape");
				}
				AppendUTF8(str, codepoint);
				break;
			}
			default:
				Error("Invalid escape sequence");
			}
		} else if (c == '"') {
			break;
		} else if (static_cast<unsigned char>(c) < 0x20) {
			Error("Unescaped control character in string");
		} else {
			str += c;
		}
	}
	return str;
}

uint32_t JsonParser::ParseHexQuad() {
	uint32_t result = 0;
	for (idx_t i = 0; i < 4; i++) {
		auto c = Next();
		result <<= 4;
		if (c >= '0' && c <= '9') {
			result += static_cast<uint32_t>(c - '0');
		} else if (c >= 'a' && c <= 'f') {
			result += static_cast<uint32_t>(c - 'a' + 10);
		} else if (c >= 'A' && c <= 'F') {
			result += static_cast<uint32_t>(c - 'A' + 10);
		} else {
			Error("Expected four hexadecimal digits in unicode escape");
		}
	}
	return result;
}

void JsonParser::AppendUTF8(string &target, uint32_t codepoint) {
	if (codepoint < 0x80) {
		target += static_cast<char>(codepoint);
	} else if (codepoint < 0x800) {
		target += static_cast<char>(0xC0 | (codepoint >> 6));
		target += static_cast<char>(0x80 | (codepoint & 0x3F));
	} else if (codepoint < 0x10000) {
		target += static_cast<char>(0xE0 | (codepoint >> 12));
		target += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
		target += static_cast<char>(0x80 | (codepoint & 0x3F));
	} else {
		target += static_cast<char>(0xF0 | (codepoint >> 18));
		target += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
		target += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
		target += static_cast<char>(0x80 | (codepoint & 0x3F));
	}
}

// the first character (a digit or '-') has already been consumed
JsonValue JsonParser::ParseNumber(char c) {
	string str;
	if (c == '-') {
		str += '-';
		c = Next();
	}
	if (c == '0') {
		str += '0';
	} else if (c >= '1' && c <= '9') {
		str += c;
		c = Peek();
		while (c >= '0' && c <= '9') {
			str += Next();
			c = Peek();
		}
	} else {
		Error("Expected digit after minus sign");
	}

	if (Peek() == '.') {
		str += Next();
		c = Peek();
		if (c < '0' || c > '9') {
			Error("Expected digit after decimal point");
		}
		while (c >= '0' && c <= '9') {
			str += Next();
			c = Peek();
		}
	}
	c = Peek();
	if (c == 'e' || c == 'E') {
		str += Next();
		c = Peek();
		if (c == '+' || c == '-') {
			str += Next();
		}
		c = Peek();
		if (c < '0' || c > '9') {
			Error("Expected digit after exponent");
		}
		while (c >= '0' && c <= '9') {
			str += Next();
			c = Peek();
		}
	}
	auto value = std::strtod(str.c_str(), nullptr);
	return JsonValue(value, std::move(str));
}

//------------------------------------------------------
// ::Parse()
//------------------------------------------------------
JsonValue JsonValue::Parse(const string &str) {
	StringByteSource source(str);
	JsonParser reader(source);
	auto result = reader.ParseValue();
	if (!reader.AtEnd()) {
		reader.Error("Unexpected trailing characters after JSON value");
	}
	return result;
}

//------------------------------------------------------
// Accessors
//------------------------------------------------------
void JsonValue::VerifyKind(JsonKind expected) const {
	if (kind != expected) {
		throw InvalidInputException("Expected JSON value of kind %s, but got %s", JsonKindToString(expected),
		                            JsonKindToString(kind));
	}
}

template <>
const bool &JsonValue::As() const {
	VerifyKind(JsonKind::BOOLEAN);
	return bool_value;
}

template <>
const double &JsonValue::As() const {
	VerifyKind(JsonKind::NUMBER);
	return number_value;
}

template <>
const string &JsonValue::As() const {
	VerifyKind(JsonKind::STRING);
	return string_value;
}

const string &JsonValue::GetNumberText() const {
	VerifyKind(JsonKind::NUMBER);
	return number_text;
}

bool JsonValue::IsInteger() const {
	if (kind != JsonKind::NUMBER || number_text.empty()) {
		return false;
	}
	for (idx_t i = number_text[0] == '-' ? 1 : 0; i < number_text.size(); i++) {
		if (!StringUtil::CharacterIsDigit(number_text[i])) {
			return false;
		}
	}
	return true;
}

idx_t JsonValue::Count() const {
	switch (kind) {
	case JsonKind::ARRAY:
	case JsonKind::OBJECT:
		return items.size();
	default:
		return 0;
	}
}

void JsonValue::Emplace(JsonValue value) {
	VerifyKind(JsonKind::ARRAY);
	items.push_back(std::move(value));
}

void JsonValue::Emplace(const string &key, JsonValue value) {
	VerifyKind(JsonKind::OBJECT);
	for (idx_t i = 0; i < keys.size(); i++) {
		if (keys[i] == key) {
			items[i] = std::move(value);
			return;
		}
	}
	keys.push_back(key);
	items.push_back(std::move(value));
}

const vector<JsonValue> &JsonValue::Items() const {
	if (kind != JsonKind::OBJECT) {
		VerifyKind(JsonKind::ARRAY);
	}
	return items;
}

const vector<string> &JsonValue::Keys() const {
	VerifyKind(JsonKind::OBJECT);
	return keys;
}

const JsonValue *JsonValue::Find(const string &key) const {
	VerifyKind(JsonKind::OBJECT);
	for (idx_t i = 0; i < keys.size(); i++) {
		if (keys[i] == key) {
			return &items[i];
		}
	}
	return nullptr;
}

const JsonValue *JsonValue::FindCaseInsensitive(const string &key) const {
	auto exact = Find(key);
	if (exact) {
		return exact;
	}
	for (idx_t i = 0; i < keys.size(); i++) {
		if (StringUtil::CIEquals(keys[i], key)) {
			return &items[i];
		}
	}
	return nullptr;
}

const JsonValue &JsonValue::operator[](idx_t index) const {
	VerifyKind(JsonKind::ARRAY);
	if (index >= items.size()) {
		throw OutOfRangeException("JSON array index %llu out of range for array of size %llu", index, items.size());
	}
	return items[index];
}

const JsonValue &JsonValue::operator[](const string &key) const {
	auto entry = Find(key);
	if (!entry) {
		throw InvalidInputException("JSON object does not have a property \"%s\"", key);
	}
	return *entry;
}

bool JsonValue::operator==(const JsonValue &other) const {
	if (kind != other.kind) {
		return false;
	}
	switch (kind) {
	case JsonKind::NULLVALUE:
		return true;
	case JsonKind::BOOLEAN:
		return bool_value == other.bool_value;
	case JsonKind::NUMBER:
		if (number_value != other.number_value) {
			return false;
		}
		// integers beyond 2^53 share a double, so compare their literals
		if (number_value != 0 && IsInteger() && other.IsInteger()) {
			return number_text == other.number_text;
		}
		return true;
	case JsonKind::STRING:
		return string_value == other.string_value;
	case JsonKind::ARRAY:
		return items == other.items;
	case JsonKind::OBJECT: {
		if (keys.size() != other.keys.size()) {
			return false;
		}
		for (idx_t i = 0; i < keys.size(); i++) {
			auto entry = other.Find(keys[i]);
			if (!entry || *entry != items[i]) {
				return false;
			}
		}
		return true;
	}
	default:
		return false;
	}
}

//------------------------------------------------------
// ::ToString()
//------------------------------------------------------

static string NumberToString(double value) {
	if (!std::isfinite(value)) {
		// JSON has no representation for inf/nan
		return "null";
	}
	return fmt::format("{}", value);
}

static string ToStringInternal(const JsonValue &value, bool format, idx_t level) {
	switch (value.GetType()) {
	case JsonKind::STRING:
		return "\"" + StringUtil::EscapeJSON(value.As<string>()) + "\"";
	case JsonKind::NUMBER:
		if (!value.GetNumberText().empty()) {
			return value.GetNumberText();
		}
		return NumberToString(value.As<double>());
	case JsonKind::BOOLEAN:
		return value.As<bool>() ? "true" : "false";
	case JsonKind::NULLVALUE:
		return "null";
	case JsonKind::OBJECT: {
		string result = "{";
		if (format) {
			result += "\n";
		}
		auto &keys = value.Keys();
		auto &items = value.Items();
		for (idx_t i = 0; i < keys.size(); i++) {
			if (format) {
				for (idx_t l = 0; l < level + 1; l++) {
					result += "\t";
				}
			}
			result += "\"" + StringUtil::EscapeJSON(keys[i]) + "\":";
			if (format) {
				result += " ";
			}
			result += ToStringInternal(items[i], format, level + 1);
			if (i + 1 < value.Count()) {
				result += ",";
			}
			if (format) {
				result += "\n";
			}
		}
		if (format) {
			for (idx_t l = 0; l < level; l++) {
				result += "\t";
			}
		}
		result += "}";
		return result;
	}
	case JsonKind::ARRAY: {
		string result = "[";
		if (format) {
			result += "\n";
		}
		idx_t count = 0;
		for (auto &entry : value.Items()) {
			if (format) {
				for (idx_t l = 0; l < level + 1; l++) {
					result += "\t";
				}
			}
			result += ToStringInternal(entry, format, level + 1);
			if (++count < value.Count()) {
				result += ",";
			}
			if (format) {
				result += "\n";
			}
		}
		if (format) {
			for (idx_t l = 0; l < level; l++) {
				result += "\t";
			}
		}
		result += "]";
		return result;
	}
	default:
		throw InvalidInputException("Unrecognized JSON kind!");
	}
}

string JsonValue::ToString(bool format) const {
	return ToStringInternal(*this, format, 0);
}

} // namespace remotefs
