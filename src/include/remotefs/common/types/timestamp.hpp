//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/types/timestamp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

#include <ctime>

namespace remotefs {

//! Type used to represent timestamps (microseconds since 1970-01-01)
struct timestamp_t { // NOLINT
	int64_t value;

	timestamp_t() = default;
	explicit constexpr timestamp_t(int64_t micros) : value(micros) {
	}

	bool operator==(const timestamp_t &rhs) const {
		return value == rhs.value;
	};
	bool operator!=(const timestamp_t &rhs) const {
		return value != rhs.value;
	};
	bool operator<(const timestamp_t &rhs) const {
		return value < rhs.value;
	};
	bool operator<=(const timestamp_t &rhs) const {
		return value <= rhs.value;
	};
	bool operator>(const timestamp_t &rhs) const {
		return value > rhs.value;
	};
	bool operator>=(const timestamp_t &rhs) const {
		return value >= rhs.value;
	};
};

struct Interval {
	static constexpr const int64_t MSECS_PER_SEC = 1000;
	static constexpr const int64_t MICROS_PER_MSEC = 1000;
	static constexpr const int64_t MICROS_PER_SEC = MICROS_PER_MSEC * MSECS_PER_SEC;
};

//! The Timestamp class is a static class that holds helper functions for the Timestamp type.
class Timestamp {
public:
	//! Get the current timestamp
	static timestamp_t GetCurrentTimestamp();
	//! Convert the epoch (in sec) to a timestamp
	static timestamp_t FromEpochSeconds(int64_t sec);
	//! Convert the epoch (in ms) to a timestamp
	static timestamp_t FromEpochMs(int64_t ms);
	//! Convert a time_t to a timestamp
	static timestamp_t FromTimeT(time_t t) {
		return FromEpochSeconds(static_cast<int64_t>(t));
	}
	//! Convert the timestamp to an epoch (in ms)
	static int64_t GetEpochMs(timestamp_t timestamp);
	//! Convert the timestamp to an epoch (in sec)
	static int64_t GetEpochSeconds(timestamp_t timestamp);
	//! Convert a timestamp to a string in the format "YYYY-MM-DD hh:mm:ss.uuuuuu" (UTC)
	static string ToString(timestamp_t timestamp);
};

} // namespace remotefs
