//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/scan_target.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/json/json_deserializer.hpp"

namespace remotefs {

enum class ScanTargetType : uint8_t {
	//! a string receiving raw text
	TEXT,
	//! a JsonValue receiving the decoded value as-is
	JSON_VALUE,
	//! any type that can be read through a JsonDeserializer
	DESERIALIZABLE
};

//! A type-erased, mutable reference to the variable a reader scans into
class ScanTarget {
public:
	typedef void (*assign_function_t)(const JsonValue &value, void *target);

	static ScanTarget Bind(string &target) {
		return ScanTarget(ScanTargetType::TEXT, &target, AssignDecoded<string>);
	}
	static ScanTarget Bind(JsonValue &target) {
		return ScanTarget(ScanTargetType::JSON_VALUE, &target, AssignDecoded<JsonValue>);
	}
	template <class T>
	static ScanTarget Bind(T &target) {
		return ScanTarget(ScanTargetType::DESERIALIZABLE, &target, AssignDecoded<T>);
	}

	ScanTargetType GetType() const {
		return type;
	}
	//! The target as a string, only valid for TEXT targets
	string &GetText() const;
	//! Decode the value into the target. The target is only modified if the value could be decoded completely.
	void Assign(const JsonValue &value) const {
		assign(value, target);
	}

private:
	ScanTarget(ScanTargetType type, void *target, assign_function_t assign)
	    : type(type), target(target), assign(assign) {
	}

	template <class T>
	static void AssignDecoded(const JsonValue &value, void *target) {
		auto result = JsonDeserializer::Deserialize<T>(value);
		*reinterpret_cast<T *>(target) = std::move(result);
	}

private:
	ScanTargetType type;
	void *target;
	assign_function_t assign;
};

string ScanTargetTypeToString(ScanTargetType type);

} // namespace remotefs
