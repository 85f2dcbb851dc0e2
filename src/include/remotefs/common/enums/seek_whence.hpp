//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/enums/seek_whence.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

//! The reference point of a seek request
enum class SeekWhence : uint8_t {
	//! relative to the start of the file
	START = 0,
	//! relative to the current position of the handle
	CURRENT = 1,
	//! relative to the end of the file
	END = 2
};

string SeekWhenceToString(SeekWhence whence);

} // namespace remotefs
