//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

namespace remotefs {

struct RemoteFileSystemConfig;

struct HostSetting {
	static constexpr const char *Name = "host";
	static constexpr const char *Description = "The host name of the remote server";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct PortSetting {
	static constexpr const char *Name = "port";
	static constexpr const char *Description = "The port of the remote server";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct UserSetting {
	static constexpr const char *Name = "user";
	static constexpr const char *Description = "The user name used to authenticate with the remote server";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct PasswordSetting {
	static constexpr const char *Name = "password";
	static constexpr const char *Description = "The password used to authenticate with the remote server";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct RemoteDirSetting {
	static constexpr const char *Name = "remote_dir";
	static constexpr const char *Description = "The directory on the remote server that paths are relative to";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct ReadBufferSizeSetting {
	static constexpr const char *Name = "read_buffer_size";
	static constexpr const char *Description = "The number of bytes a sequential reader fetches per round trip";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct JsonExtensionSetting {
	static constexpr const char *Name = "json_extension";
	static constexpr const char *Description = "Files whose name ends in this extension are read as JSON";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct EnableLogging {
	static constexpr const char *Name = "enable_logging";
	static constexpr const char *Description = "Enables the logger";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct LoggingLevel {
	static constexpr const char *Name = "logging_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct LoggingMode {
	static constexpr const char *Name = "logging_mode";
	static constexpr const char *Description =
	    "Determines which types of log messages are logged (LEVEL_ONLY, DISABLE_SELECTED or ENABLE_SELECTED)";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct LoggingStorage {
	static constexpr const char *Name = "logging_storage";
	static constexpr const char *Description = "Set the logging storage (memory/stdout)";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct EnabledLogTypes {
	static constexpr const char *Name = "enabled_log_types";
	static constexpr const char *Description =
	    "Sets the list of enabled loggers, used when logging_mode is ENABLE_SELECTED";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

struct DisabledLogTypes {
	static constexpr const char *Name = "disabled_log_types";
	static constexpr const char *Description =
	    "Sets the list of disabled loggers, used when logging_mode is DISABLE_SELECTED";
	static void SetGlobal(RemoteFileSystemConfig &config, const string &parameter);
	static string GetSetting(const RemoteFileSystemConfig &config);
};

} // namespace remotefs
