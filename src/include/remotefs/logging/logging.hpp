//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/case_insensitive_map.hpp"

namespace remotefs {

//! Logging levels, can be used to filter logs
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

//! Which log types are passed on to the storage
enum class LogMode : uint8_t {
	LEVEL_ONLY = 0,
	DISABLE_SELECTED = 1,
	ENABLE_SELECTED = 2,
};

string LogLevelToString(LogLevel level);
LogLevel LogLevelFromString(const string &level);
string LogModeToString(LogMode mode);
LogMode LogModeFromString(const string &mode);

struct LogConfig {
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";

	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *DEFAULT_LOG_STORAGE = IN_MEMORY_STORAGE_NAME;

	LogConfig();

	static LogConfig Create(bool enabled, LogLevel level);
	static LogConfig CreateFromEnabled(bool enabled, LogLevel level, unordered_set<string> &enabled_log_types);
	static LogConfig CreateFromDisabled(bool enabled, LogLevel level, unordered_set<string> &disabled_log_types);

	bool IsConsistent() const;

	bool enabled;
	LogMode mode;
	LogLevel level;
	string storage;

	unordered_set<string> enabled_log_types;
	unordered_set<string> disabled_log_types;

protected:
	LogConfig(bool enabled, LogLevel level, LogMode mode, const unordered_set<string> *enabled_log_types,
	          const unordered_set<string> *disabled_log_types);
};

} // namespace remotefs
