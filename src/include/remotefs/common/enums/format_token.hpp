//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/enums/format_token.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

//! The classification of a remote file's content, decided once when a reader is opened
enum class FormatToken : uint8_t {
	//! a JSON document whose top-level value is an array
	ARRAY = 0,
	//! a JSON document whose top-level value is a single value (usually an object)
	OBJECT = 1,
	//! line-oriented text
	TEXT = 2
};

string FormatTokenToString(FormatToken token);

} // namespace remotefs
