//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/string_util.hpp"
#include "remotefs/logging/log_type.hpp"
#include "remotefs/logging/logging.hpp"

#include <atomic>

namespace remotefs {

class LogManager;
class RemoteFileSystem;
class RemoteFileHandle;

//! Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}
	virtual ~Logger() {
	}

	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	//! Format-string variant: the message is only built once the caller has checked ShouldLog
	template <typename... ARGS>
	void WriteLog(const char *log_type, LogLevel log_level, const char *format_string, ARGS... params) {
		auto formatted_string = StringUtil::Format(format_string, params...);
		WriteLog(log_type, log_level, formatted_string.c_str());
	}

	virtual void Flush() = 0;
	virtual void UpdateConfig(LogConfig &new_config) {
	}

	// Get the Logger to write log messages to
	static Logger &Get(LogManager &manager);
	static Logger &Get(Logger &logger) {
		return logger;
	}
	static Logger &Get(const RemoteFileSystem &file_system);
	static Logger &Get(const RemoteFileHandle &handle);

protected:
	LogManager &manager;
};

//! Logger whose configuration can be changed after creation, and is shared between threads
class MutableLogger : public Logger {
public:
	MutableLogger(const LogConfig &config, LogManager &manager);

	// Main Logger API
	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;
	using Logger::WriteLog;

	void Flush() override;
	void UpdateConfig(LogConfig &new_config) override;

protected:
	// Atomics for lock-free log setting checks
	std::atomic<bool> enabled;
	std::atomic<LogMode> mode;
	std::atomic<LogLevel> level;

	mutex lock;
	LogConfig config;
};

//! Logger that does not log anything
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override {
	}
	using Logger::WriteLog;
	void Flush() override {
	}
};

} // namespace remotefs

//===--------------------------------------------------------------------===//
// Logging macros
//===--------------------------------------------------------------------===//

// Main macro for logging: checks ShouldLog before building the message
#define REMOTEFS_LOG_INTERNAL(SOURCE, TYPE, LEVEL, ...)                                                                \
	{                                                                                                                  \
		auto &_remotefs_logger = remotefs::Logger::Get(SOURCE);                                                        \
		if (_remotefs_logger.ShouldLog(TYPE, LEVEL)) {                                                                 \
			_remotefs_logger.WriteLog(TYPE, LEVEL, __VA_ARGS__);                                                       \
		}                                                                                                              \
	}

// Log using a structured log type: TYPE::ConstructLogMessage builds the message from the remaining arguments
#define REMOTEFS_LOG(SOURCE, TYPE, ...)                                                                                \
	REMOTEFS_LOG_INTERNAL(SOURCE, TYPE::NAME, TYPE::LEVEL, TYPE::ConstructLogMessage(__VA_ARGS__))

// Log free-form messages with the default log type
#define REMOTEFS_LOG_TRACE(SOURCE, ...)                                                                                \
	REMOTEFS_LOG_INTERNAL(SOURCE, remotefs::DefaultLogType::NAME, remotefs::LogLevel::LOG_TRACE, __VA_ARGS__)
#define REMOTEFS_LOG_DEBUG(SOURCE, ...)                                                                                \
	REMOTEFS_LOG_INTERNAL(SOURCE, remotefs::DefaultLogType::NAME, remotefs::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define REMOTEFS_LOG_INFO(SOURCE, ...)                                                                                 \
	REMOTEFS_LOG_INTERNAL(SOURCE, remotefs::DefaultLogType::NAME, remotefs::LogLevel::LOG_INFO, __VA_ARGS__)
#define REMOTEFS_LOG_WARN(SOURCE, ...)                                                                                 \
	REMOTEFS_LOG_INTERNAL(SOURCE, remotefs::DefaultLogType::NAME, remotefs::LogLevel::LOG_WARN, __VA_ARGS__)
#define REMOTEFS_LOG_ERROR(SOURCE, ...)                                                                                \
	REMOTEFS_LOG_INTERNAL(SOURCE, remotefs::DefaultLogType::NAME, remotefs::LogLevel::LOG_ERROR, __VA_ARGS__)
