//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/error_data.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/exception.hpp"

namespace remotefs {

//! An error captured as a value, for the non-throwing variants of the API
class ErrorData {
public:
	//! Not initialized, default constructor
	ErrorData();
	//! From std::exception
	ErrorData(const std::exception &ex); // NOLINT: allow implicit construction from exception
	//! From a raw string and exception type
	ErrorData(ExceptionType type, const string &raw_message);

public:
	//! Throw the error as the typed exception it was captured from
	[[noreturn]] void Throw(const string &prepended_message = "") const;

	const ExceptionType &Type() const;
	const string &Message() const {
		return final_message;
	}
	const string &RawMessage() const {
		return raw_message;
	}
	bool HasError() const {
		return initialized;
	}
	bool operator==(const ErrorData &other) const;

private:
	//! Whether this ErrorData contains an exception or not
	bool initialized;
	//! The ExceptionType of the preserved exception
	ExceptionType type;
	//! The message the exception was constructed with (does not contain the Exception Type)
	string raw_message;
	//! The final message (stored in the preserved error for compatibility reasons with C-API)
	string final_message;

private:
	static string SanitizeErrorMessage(string error);
	string ConstructFinalMessage() const;
};

} // namespace remotefs
