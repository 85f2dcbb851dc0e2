//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/json/json_value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

enum class JsonKind : uint8_t { NULLVALUE, BOOLEAN, NUMBER, STRING, ARRAY, OBJECT };

string JsonKindToString(JsonKind kind);

//! A decoded JSON document. Object properties keep their insertion order.
class JsonValue {
public:
	JsonValue() : kind(JsonKind::NULLVALUE) {
	}
	explicit JsonValue(JsonKind kind_p) : kind(kind_p) {
	}
	explicit JsonValue(bool value) : kind(JsonKind::BOOLEAN), bool_value(value) {
	}
	explicit JsonValue(double value) : kind(JsonKind::NUMBER), number_value(value) {
	}
	//! A number together with the literal it was parsed from
	JsonValue(double value, string text) : kind(JsonKind::NUMBER), number_value(value), number_text(std::move(text)) {
	}
	explicit JsonValue(string value) : kind(JsonKind::STRING), string_value(std::move(value)) {
	}
	explicit JsonValue(const char *value) : kind(JsonKind::STRING), string_value(value) {
	}

public:
	//! Parse a complete JSON document from a string
	static JsonValue Parse(const string &str);

	JsonKind GetType() const {
		return kind;
	}
	bool IsNull() const {
		return kind == JsonKind::NULLVALUE;
	}

	template <class T>
	const T &As() const;

	//! The literal a parsed number was written as, empty for numbers constructed from a double
	const string &GetNumberText() const;
	//! Whether this is a number written as an integer literal (no fraction or exponent)
	bool IsInteger() const;

	//! Number of items (arrays) or properties (objects)
	idx_t Count() const;

	//! Append an item to an array
	void Emplace(JsonValue value);
	//! Add a property to an object; a repeated key replaces the previous value
	void Emplace(const string &key, JsonValue value);

	//! The items of an array, or the property values of an object (in key order)
	const vector<JsonValue> &Items() const;
	//! The property keys of an object
	const vector<string> &Keys() const;

	//! Look up an object property by exact key, returns nullptr if it is not present
	const JsonValue *Find(const string &key) const;
	//! Look up an object property, case-insensitively if there is no exact match
	const JsonValue *FindCaseInsensitive(const string &key) const;

	const JsonValue &operator[](idx_t index) const;
	const JsonValue &operator[](const string &key) const;

	bool operator==(const JsonValue &other) const;
	bool operator!=(const JsonValue &other) const {
		return !(*this == other);
	}

	string ToString(bool format = false) const;

private:
	void VerifyKind(JsonKind expected) const;

private:
	JsonKind kind;
	bool bool_value = false;
	double number_value = 0;
	string number_text;
	string string_value;
	vector<string> keys;
	vector<JsonValue> items;
};

template <>
const bool &JsonValue::As() const;
template <>
const double &JsonValue::As() const;
template <>
const string &JsonValue::As() const;

} // namespace remotefs
