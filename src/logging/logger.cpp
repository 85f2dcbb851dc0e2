#include "remotefs/logging/logger.hpp"
#include "remotefs/logging/log_manager.hpp"
#include "remotefs/remote/remote_file_handle.hpp"
#include "remotefs/remote/remote_file_system.hpp"

namespace remotefs {

void Logger::WriteLog(const char *log_type, LogLevel log_level, const string &message) {
	WriteLog(log_type, log_level, message.c_str());
}

Logger &Logger::Get(LogManager &manager) {
	return manager.GlobalLogger();
}

Logger &Logger::Get(const RemoteFileSystem &file_system) {
	return file_system.GetLogManager().GlobalLogger();
}

Logger &Logger::Get(const RemoteFileHandle &handle) {
	return Logger::Get(handle.file_system);
}

MutableLogger::MutableLogger(const LogConfig &config_p, LogManager &manager)
    : Logger(manager), config(config_p) {
	enabled = config.enabled;
	level = config.level;
	mode = config.mode;
}

void MutableLogger::UpdateConfig(LogConfig &new_config) {
	unique_lock<mutex> lck(lock);
	config = new_config;

	// Update atomics for lock-free access
	enabled = config.enabled;
	level = config.level;
	mode = config.mode;
}

void MutableLogger::WriteLog(const char *log_type, LogLevel log_level, const char *log_message) {
	manager.WriteLogEntry(Timestamp::GetCurrentTimestamp(), log_type, log_level, log_message);
}

bool MutableLogger::ShouldLog(const char *log_type, LogLevel log_level) {
	if (!enabled) {
		return false;
	}

	// check atomic level to early out if level too low
	if (level > log_level) {
		return false;
	}

	if (mode == LogMode::LEVEL_ONLY) {
		return true;
	}

	{
		unique_lock<mutex> lck(lock);
		if (config.mode == LogMode::ENABLE_SELECTED) {
			return config.enabled_log_types.find(log_type) != config.enabled_log_types.end();
		}
		if (config.mode == LogMode::DISABLE_SELECTED) {
			return config.disabled_log_types.find(log_type) == config.disabled_log_types.end();
		}
	}
	throw InternalException("Should be unreachable (MutableLogger::ShouldLog)");
}

void MutableLogger::Flush() {
	manager.Flush();
}

} // namespace remotefs
