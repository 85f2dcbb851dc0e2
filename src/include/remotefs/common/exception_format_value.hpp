//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/exception_format_value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

enum class ExceptionFormatValueType : uint8_t {
	FORMAT_VALUE_TYPE_DOUBLE,
	FORMAT_VALUE_TYPE_INTEGER,
	FORMAT_VALUE_TYPE_STRING
};

struct ExceptionFormatValue {
	ExceptionFormatValue(double dbl_val);   // NOLINT
	ExceptionFormatValue(int64_t int_val);  // NOLINT
	ExceptionFormatValue(string str_val);   // NOLINT

	ExceptionFormatValueType type;

	double dbl_val = 0;
	int64_t int_val = 0;
	string str_val;

public:
	template <class T>
	static ExceptionFormatValue CreateFormatValue(const T &value) {
		return int64_t(value);
	}
	static string Format(const string &msg, std::vector<ExceptionFormatValue> &values);
};

template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const float &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const double &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const string &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(const char *const &value);
template <>
ExceptionFormatValue ExceptionFormatValue::CreateFormatValue(char *const &value);

} // namespace remotefs
