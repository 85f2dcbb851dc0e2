#include "remotefs/logging/logging.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/string_util.hpp"

namespace remotefs {

constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

struct LogLevelEntry {
	LogLevel level;
	const char *name;
};

static constexpr LogLevelEntry LOG_LEVEL_MAP[] = {{LogLevel::LOG_TRACE, "TRACE"}, {LogLevel::LOG_DEBUG, "DEBUG"},
                                                  {LogLevel::LOG_INFO, "INFO"},   {LogLevel::LOG_WARN, "WARN"},
                                                  {LogLevel::LOG_ERROR, "ERROR"}, {LogLevel::LOG_FATAL, "FATAL"}};

string LogLevelToString(LogLevel level) {
	for (auto &entry : LOG_LEVEL_MAP) {
		if (entry.level == level) {
			return entry.name;
		}
	}
	throw InternalException("Unrecognized LogLevel %d", static_cast<int>(level));
}

LogLevel LogLevelFromString(const string &level) {
	for (auto &entry : LOG_LEVEL_MAP) {
		if (StringUtil::CIEquals(entry.name, level)) {
			return entry.level;
		}
	}
	// WARNING is accepted as an alias of WARN
	if (StringUtil::CIEquals(level, "WARNING")) {
		return LogLevel::LOG_WARN;
	}
	throw InvalidInputException("Unrecognized log level '%s', expected one of TRACE, DEBUG, INFO, WARN, ERROR, FATAL",
	                            level);
}

string LogModeToString(LogMode mode) {
	switch (mode) {
	case LogMode::LEVEL_ONLY:
		return "LEVEL_ONLY";
	case LogMode::DISABLE_SELECTED:
		return "DISABLE_SELECTED";
	case LogMode::ENABLE_SELECTED:
		return "ENABLE_SELECTED";
	default:
		throw InternalException("Unrecognized LogMode %d", static_cast<int>(mode));
	}
}

LogMode LogModeFromString(const string &mode) {
	if (StringUtil::CIEquals(mode, "LEVEL_ONLY")) {
		return LogMode::LEVEL_ONLY;
	}
	if (StringUtil::CIEquals(mode, "DISABLE_SELECTED")) {
		return LogMode::DISABLE_SELECTED;
	}
	if (StringUtil::CIEquals(mode, "ENABLE_SELECTED")) {
		return LogMode::ENABLE_SELECTED;
	}
	throw InvalidInputException("Unrecognized log mode '%s'", mode);
}

LogConfig::LogConfig()
    : enabled(false), mode(LogMode::LEVEL_ONLY), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

bool LogConfig::IsConsistent() const {
	if (mode == LogMode::LEVEL_ONLY) {
		return enabled_log_types.empty() && disabled_log_types.empty();
	}
	if (mode == LogMode::DISABLE_SELECTED) {
		return enabled_log_types.empty() && !disabled_log_types.empty();
	}
	if (mode == LogMode::ENABLE_SELECTED) {
		return !enabled_log_types.empty() && disabled_log_types.empty();
	}
	return false;
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	return LogConfig(enabled, level, LogMode::LEVEL_ONLY, nullptr, nullptr);
}
LogConfig LogConfig::CreateFromEnabled(bool enabled, LogLevel level, unordered_set<string> &enabled_log_types) {
	return LogConfig(enabled, level, LogMode::ENABLE_SELECTED, &enabled_log_types, nullptr);
}

LogConfig LogConfig::CreateFromDisabled(bool enabled, LogLevel level, unordered_set<string> &disabled_log_types) {
	return LogConfig(enabled, level, LogMode::DISABLE_SELECTED, nullptr, &disabled_log_types);
}

LogConfig::LogConfig(bool enabled, LogLevel level_p, LogMode mode_p, const unordered_set<string> *enabled_log_types_p,
                     const unordered_set<string> *disabled_log_types_p)
    : enabled(enabled), mode(mode_p), level(level_p) {
	if (enabled_log_types_p) {
		enabled_log_types = *enabled_log_types_p;
	}
	if (disabled_log_types_p) {
		disabled_log_types = *disabled_log_types_p;
	}
	storage = LogConfig::IN_MEMORY_STORAGE_NAME;
}

} // namespace remotefs
