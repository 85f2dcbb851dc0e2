#include "remotefs/common/error_data.hpp"

#include "remotefs/common/exception.hpp"
#include "remotefs/common/string_util.hpp"

namespace remotefs {

ErrorData::ErrorData() : initialized(false), type(ExceptionType::INVALID) {
}

ErrorData::ErrorData(const std::exception &ex) : initialized(true), type(ExceptionType::INVALID) {
	auto remote_ex = dynamic_cast<const Exception *>(&ex);
	if (remote_ex) {
		type = remote_ex->type;
		raw_message = SanitizeErrorMessage(remote_ex->RawMessage());
	} else if (string(ex.what()) == std::bad_alloc().what()) {
		type = ExceptionType::FATAL;
		raw_message = "Allocation failure";
	} else {
		raw_message = SanitizeErrorMessage(ex.what());
	}
	final_message = ConstructFinalMessage();
}

ErrorData::ErrorData(ExceptionType type, const string &message)
    : initialized(true), type(type), raw_message(SanitizeErrorMessage(message)),
      final_message(ConstructFinalMessage()) {
}

string ErrorData::SanitizeErrorMessage(string error) {
	return StringUtil::Replace(std::move(error), string("\0", 1), "\\0");
}

string ErrorData::ConstructFinalMessage() const {
	return Exception::ExceptionTypeToString(type) + " Error: " + raw_message;
}

void ErrorData::Throw(const string &prepended_message) const {
	D_ASSERT(initialized);
	auto message = prepended_message + raw_message;
	switch (type) {
	case ExceptionType::OUT_OF_RANGE:
		throw OutOfRangeException(message);
	case ExceptionType::CONVERSION:
		throw ConversionException(message);
	case ExceptionType::NOT_IMPLEMENTED:
		throw NotImplementedException(message);
	case ExceptionType::SERIALIZATION:
		throw SerializationException(message);
	case ExceptionType::IO:
		throw IOException(message);
	case ExceptionType::NOT_FOUND:
		throw NotFoundException(message);
	case ExceptionType::INTERNAL:
		throw InternalException(message);
	case ExceptionType::INVALID_INPUT:
		throw InvalidInputException(message);
	case ExceptionType::INVALID_CONFIGURATION:
		throw InvalidConfigurationException(message);
	case ExceptionType::FATAL:
		throw FatalException(message);
	default:
		throw Exception(type, message);
	}
}

const ExceptionType &ErrorData::Type() const {
	D_ASSERT(initialized);
	return this->type;
}

bool ErrorData::operator==(const ErrorData &other) const {
	if (initialized != other.initialized) {
		return false;
	}
	if (type != other.type) {
		return false;
	}
	return raw_message == other.raw_message;
}

} // namespace remotefs
