//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/types/timestamp.hpp"
#include "remotefs/logging/logger.hpp"
#include "remotefs/logging/log_storage.hpp"

namespace remotefs {

// Holds the log storage and the global logger; every logger writes its entries through the LogManager
class LogManager : public std::enable_shared_from_this<LogManager> {
	friend class MutableLogger;

public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	//! Create a new logger that follows the current configuration
	unique_ptr<Logger> CreateLogger(bool mutable_settings = true);

	//! The global logger can be used whenever no more specific logger is available
	Logger &GlobalLogger();

	//! Flush everything
	void Flush();

	shared_ptr<LogStorage> GetLogStorage();

	//! Make a storage available under a name so it can be selected with SetLogStorage
	bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> storage);

	void SetEnableLogging(bool enable);
	void SetLogMode(LogMode mode);
	void SetLogLevel(LogLevel level);
	void SetEnabledLogTypes(unordered_set<string> &enabled_log_types);
	void SetDisabledLogTypes(unordered_set<string> &disabled_log_types);
	void SetLogStorage(const string &storage_name);
	void SetConfig(const LogConfig &config);

	void TruncateLogStorage();

	LogConfig GetConfig();

protected:
	void WriteLogEntry(timestamp_t timestamp, const char *log_type, LogLevel log_level, const char *log_message);
	void SetLogStorageInternal(const string &storage_name);

	mutex lock;
	LogConfig config;

	unique_ptr<Logger> global_logger;

	shared_ptr<LogStorage> log_storage;

	unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace remotefs
