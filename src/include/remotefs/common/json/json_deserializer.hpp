//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/json/json_deserializer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/json/json_value.hpp"

#include <limits>
#include <type_traits>

namespace remotefs {

class JsonDeserializer;

//! Binds a decoded JSON value to a C++ type. Types without a specialization below must provide a
//! static T Deserialize(JsonDeserializer &deserializer) method.
template <class T, class ENABLE = void>
struct JsonReadOperation {
	static T Read(JsonDeserializer &deserializer) {
		return T::Deserialize(deserializer);
	}
};

class JsonDeserializer {
public:
	JsonDeserializer(const JsonValue &value, string path);

	//! Deserialize a complete document into a T
	template <class T>
	static T Deserialize(const JsonValue &value) {
		JsonDeserializer deserializer(value, "$");
		return deserializer.Read<T>();
	}

	//! Read the current value as a T
	template <class T>
	T Read() {
		return JsonReadOperation<T>::Read(*this);
	}

	//! Read a required property of the current object
	template <class T>
	T ReadProperty(const string &tag) {
		auto entry = FindProperty(tag);
		if (!entry) {
			throw SerializationException("Failed to deserialize %s: missing required property \"%s\"", path, tag);
		}
		JsonDeserializer child(*entry, path + "." + tag);
		return child.Read<T>();
	}

	//! Read an optional property of the current object, returning the default if it is absent or null
	template <class T>
	T ReadPropertyWithDefault(const string &tag, T default_value) {
		auto entry = FindProperty(tag);
		if (!entry || entry->IsNull()) {
			return default_value;
		}
		JsonDeserializer child(*entry, path + "." + tag);
		return child.Read<T>();
	}

	//! Whether the current object has a (non-null) property with the given tag
	bool HasProperty(const string &tag);

	//! Read every item of the current array using the given callback
	template <class FUNC>
	void ReadList(FUNC func) {
		VerifyKind(JsonKind::ARRAY);
		auto &items = value.Items();
		for (idx_t i = 0; i < items.size(); i++) {
			JsonDeserializer child(items[i], path + "[" + std::to_string(i) + "]");
			func(child);
		}
	}

	const JsonValue &GetValue() const {
		return value;
	}
	const string &GetPath() const {
		return path;
	}

	void VerifyKind(JsonKind expected) const;

	string ReadString();
	bool ReadBoolean();
	double ReadDouble();
	//! Read a whole number that fits a two's complement integer whose minimum value is min
	int64_t ReadSignedInteger(int64_t min);
	uint64_t ReadUnsignedInteger(uint64_t max);

private:
	const JsonValue *FindProperty(const string &tag);
	double ReadWholeNumber();

private:
	const JsonValue &value;
	//! Location of the current value within the document, used in error messages
	string path;
};

//===--------------------------------------------------------------------===//
// Built-in targets
//===--------------------------------------------------------------------===//
template <>
struct JsonReadOperation<string> {
	static string Read(JsonDeserializer &deserializer) {
		return deserializer.ReadString();
	}
};

template <>
struct JsonReadOperation<bool> {
	static bool Read(JsonDeserializer &deserializer) {
		return deserializer.ReadBoolean();
	}
};

template <class T>
struct JsonReadOperation<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
	static T Read(JsonDeserializer &deserializer) {
		return static_cast<T>(deserializer.ReadDouble());
	}
};

template <class T>
struct JsonReadOperation<T, typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value &&
                                                    !std::is_same<T, bool>::value>::type> {
	static T Read(JsonDeserializer &deserializer) {
		return static_cast<T>(deserializer.ReadSignedInteger(std::numeric_limits<T>::min()));
	}
};

template <class T>
struct JsonReadOperation<T, typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                                    !std::is_same<T, bool>::value>::type> {
	static T Read(JsonDeserializer &deserializer) {
		return static_cast<T>(deserializer.ReadUnsignedInteger(std::numeric_limits<T>::max()));
	}
};

template <>
struct JsonReadOperation<JsonValue> {
	static JsonValue Read(JsonDeserializer &deserializer) {
		return deserializer.GetValue();
	}
};

template <class T>
struct JsonReadOperation<vector<T>> {
	static vector<T> Read(JsonDeserializer &deserializer) {
		vector<T> result;
		deserializer.ReadList([&](JsonDeserializer &child) { result.push_back(child.Read<T>()); });
		return result;
	}
};

} // namespace remotefs
