#include "remotefs/common/types/timestamp.hpp"

#include "remotefs/common/exception.hpp"
#include "remotefs/common/string_util.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>

namespace remotefs {

using std::chrono::duration_cast;
using std::chrono::system_clock;

static constexpr const int64_t MAX_EPOCH_SECONDS = INT64_MAX / Interval::MICROS_PER_SEC;

timestamp_t Timestamp::GetCurrentTimestamp() {
	auto now = system_clock::now();
	auto epoch_ms = duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	return Timestamp::FromEpochMs(epoch_ms);
}

timestamp_t Timestamp::FromEpochSeconds(int64_t sec) {
	if (sec > MAX_EPOCH_SECONDS || sec < -MAX_EPOCH_SECONDS) {
		throw ConversionException("Could not convert Timestamp(S) to Timestamp(US)");
	}
	return timestamp_t(sec * Interval::MICROS_PER_SEC);
}

timestamp_t Timestamp::FromEpochMs(int64_t ms) {
	return timestamp_t(ms * Interval::MICROS_PER_MSEC);
}

int64_t Timestamp::GetEpochMs(timestamp_t timestamp) {
	return timestamp.value / Interval::MICROS_PER_MSEC;
}

int64_t Timestamp::GetEpochSeconds(timestamp_t timestamp) {
	return timestamp.value / Interval::MICROS_PER_SEC;
}

string Timestamp::ToString(timestamp_t timestamp) {
	auto seconds = static_cast<time_t>(GetEpochSeconds(timestamp));
	auto micros = timestamp.value % Interval::MICROS_PER_SEC;
	if (micros < 0) {
		seconds -= 1;
		micros += Interval::MICROS_PER_SEC;
	}
	struct tm result;
	if (!gmtime_r(&seconds, &result)) {
		throw ConversionException("Could not convert timestamp with value %lld to a calendar time", timestamp.value);
	}
	return StringUtil::Format("%04d-%02d-%02d %02d:%02d:%02d.%06d", result.tm_year + 1900, result.tm_mon + 1,
	                          result.tm_mday, result.tm_hour, result.tm_min, result.tm_sec, micros);
}

} // namespace remotefs
