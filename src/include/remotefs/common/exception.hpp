//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/assert.hpp"
#include "remotefs/common/constants.hpp"
#include "remotefs/common/exception_format_value.hpp"

#include <stdexcept>

namespace remotefs {

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,                // invalid type
	OUT_OF_RANGE = 1,           // value out of range error
	CONVERSION = 2,             // conversion/casting error
	NOT_IMPLEMENTED = 3,        // method not implemented
	SERIALIZATION = 4,          // serialization or decoding error
	IO = 5,                     // IO/transport exception
	INTERNAL = 6,               // Internal exception: exception that indicates something went wrong internally
	INVALID_INPUT = 7,          // Input or arguments error
	INVALID_CONFIGURATION = 8,  // An invalid configuration was detected (e.g. an unknown setting)
	NOT_FOUND = 9,              // the remote object does not exist
	FATAL = 10                  // Fatal exceptions are non-recoverable
};

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;

public:
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);
	static ExceptionType StringToExceptionType(const string &type);

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		const std::size_t num_args = sizeof...(ARGS);
		if (num_args == 0) {
			return msg;
		}
		std::vector<ExceptionFormatValue> values;
		return ConstructMessageRecursive(msg, values, params...);
	}

	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values);

	template <class T, typename... ARGS>
	static string ConstructMessageRecursive(const string &msg, std::vector<ExceptionFormatValue> &values, T param,
	                                        ARGS... params) {
		values.push_back(ExceptionFormatValue::CreateFormatValue<T>(param));
		return ConstructMessageRecursive(msg, values, params...);
	}

	//! Whether or not an exception is currently being unwound on this thread
	static bool UncaughtException();

private:
	string raw_message;
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class OutOfRangeException : public Exception {
public:
	explicit OutOfRangeException(const string &msg);

	template <typename... ARGS>
	explicit OutOfRangeException(const string &msg, ARGS... params)
	    : OutOfRangeException(ConstructMessage(msg, params...)) {
	}
};

class ConversionException : public Exception {
public:
	explicit ConversionException(const string &msg);

	template <typename... ARGS>
	explicit ConversionException(const string &msg, ARGS... params)
	    : ConversionException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class SerializationException : public Exception {
public:
	explicit SerializationException(const string &msg);

	template <typename... ARGS>
	explicit SerializationException(const string &msg, ARGS... params)
	    : SerializationException(ConstructMessage(msg, params...)) {
	}
};

class IOException : public Exception {
public:
	explicit IOException(const string &msg);
	explicit IOException(ExceptionType exception_type, const string &msg) : Exception(exception_type, msg) {
	}

	template <typename... ARGS>
	explicit IOException(const string &msg, ARGS... params) : IOException(ConstructMessage(msg, params...)) {
	}
};

//! The remote object addressed by an operation does not exist
class NotFoundException : public IOException {
public:
	explicit NotFoundException(const string &msg);

	template <typename... ARGS>
	explicit NotFoundException(const string &msg, ARGS... params)
	    : NotFoundException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class InvalidConfigurationException : public Exception {
public:
	explicit InvalidConfigurationException(const string &msg);

	template <typename... ARGS>
	explicit InvalidConfigurationException(const string &msg, ARGS... params)
	    : InvalidConfigurationException(ConstructMessage(msg, params...)) {
	}
};

class FatalException : public Exception {
public:
	explicit FatalException(const string &msg) : FatalException(ExceptionType::FATAL, msg) {
	}
	template <typename... ARGS>
	explicit FatalException(const string &msg, ARGS... params) : FatalException(ConstructMessage(msg, params...)) {
	}

protected:
	explicit FatalException(ExceptionType type, const string &msg);
};

} // namespace remotefs
