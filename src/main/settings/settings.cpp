#include "remotefs/main/settings.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/string_util.hpp"
#include "remotefs/main/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace remotefs {

static bool ParseBoolean(const char *setting, const string &parameter) {
	auto value = StringUtil::Lower(parameter);
	StringUtil::Trim(value);
	if (value == "true" || value == "t" || value == "1" || value == "on") {
		return true;
	}
	if (value == "false" || value == "f" || value == "0" || value == "off") {
		return false;
	}
	throw InvalidConfigurationException("Could not parse \"%s\" as a boolean for setting \"%s\"", parameter, setting);
}

static idx_t ParseUnsigned(const char *setting, const string &parameter, idx_t max_value) {
	auto value = parameter;
	StringUtil::Trim(value);
	if (value.empty() || !StringUtil::CharacterIsDigit(value[0])) {
		throw InvalidConfigurationException("Could not parse \"%s\" as an unsigned integer for setting \"%s\"",
		                                    parameter, setting);
	}
	errno = 0;
	char *end = nullptr;
	auto result = std::strtoull(value.c_str(), &end, 10);
	if (errno == ERANGE || *end != '\0' || result > max_value) {
		throw InvalidConfigurationException("Value \"%s\" is out of range or malformed for setting \"%s\"", parameter,
		                                    setting);
	}
	return static_cast<idx_t>(result);
}

static unordered_set<string> ParseLogTypes(const string &parameter) {
	unordered_set<string> result;
	for (auto &entry : StringUtil::Split(parameter, ',')) {
		auto log_type = entry;
		StringUtil::Trim(log_type);
		if (!log_type.empty()) {
			result.insert(log_type);
		}
	}
	return result;
}

static string RenderLogTypes(const unordered_set<string> &log_types) {
	vector<string> entries(log_types.begin(), log_types.end());
	std::sort(entries.begin(), entries.end());
	return StringUtil::Join(entries, ",");
}

//===----------------------------------------------------------------------===//
// Host
//===----------------------------------------------------------------------===//
void HostSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.host = parameter;
}

string HostSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return config.host;
}

//===----------------------------------------------------------------------===//
// Port
//===----------------------------------------------------------------------===//
void PortSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	auto port = ParseUnsigned(Name, parameter, 65535);
	if (port == 0) {
		throw InvalidConfigurationException("The port must be between 1 and 65535");
	}
	config.port = port;
}

string PortSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return std::to_string(config.port);
}

//===----------------------------------------------------------------------===//
// User
//===----------------------------------------------------------------------===//
void UserSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.user = parameter;
}

string UserSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return config.user;
}

//===----------------------------------------------------------------------===//
// Password
//===----------------------------------------------------------------------===//
void PasswordSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.password = parameter;
}

string PasswordSetting::GetSetting(const RemoteFileSystemConfig &config) {
	// never render the secret itself
	return config.password.empty() ? string() : "redacted";
}

//===----------------------------------------------------------------------===//
// Remote Dir
//===----------------------------------------------------------------------===//
void RemoteDirSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.remote_dir = parameter;
}

string RemoteDirSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return config.remote_dir;
}

//===----------------------------------------------------------------------===//
// Read Buffer Size
//===----------------------------------------------------------------------===//
void ReadBufferSizeSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	auto size = ParseUnsigned(Name, parameter, std::numeric_limits<uint32_t>::max());
	if (size == 0) {
		throw InvalidConfigurationException("The read buffer size must be larger than 0");
	}
	config.read_buffer_size = size;
}

string ReadBufferSizeSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return std::to_string(config.read_buffer_size);
}

//===----------------------------------------------------------------------===//
// JSON Extension
//===----------------------------------------------------------------------===//
void JsonExtensionSetting::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	if (parameter.empty()) {
		throw InvalidConfigurationException("The JSON extension cannot be empty");
	}
	config.json_extension = StringUtil::StartsWith(parameter, ".") ? parameter : "." + parameter;
}

string JsonExtensionSetting::GetSetting(const RemoteFileSystemConfig &config) {
	return config.json_extension;
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLogging::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.log_config.enabled = ParseBoolean(Name, parameter);
}

string EnableLogging::GetSetting(const RemoteFileSystemConfig &config) {
	return config.log_config.enabled ? "true" : "false";
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevel::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	try {
		config.log_config.level = LogLevelFromString(parameter);
	} catch (InvalidInputException &ex) {
		throw InvalidConfigurationException(ex.RawMessage());
	}
}

string LoggingLevel::GetSetting(const RemoteFileSystemConfig &config) {
	return LogLevelToString(config.log_config.level);
}

//===----------------------------------------------------------------------===//
// Logging Mode
//===----------------------------------------------------------------------===//
void LoggingMode::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	try {
		config.log_config.mode = LogModeFromString(parameter);
	} catch (InvalidInputException &ex) {
		throw InvalidConfigurationException(ex.RawMessage());
	}
}

string LoggingMode::GetSetting(const RemoteFileSystemConfig &config) {
	return LogModeToString(config.log_config.mode);
}

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//
void LoggingStorage::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	auto storage = StringUtil::Lower(parameter);
	if (storage != LogConfig::IN_MEMORY_STORAGE_NAME && storage != LogConfig::STDOUT_STORAGE_NAME) {
		throw InvalidConfigurationException("Log storage '%s' is not yet registered, expected \"%s\" or \"%s\"",
		                                    parameter, LogConfig::IN_MEMORY_STORAGE_NAME,
		                                    LogConfig::STDOUT_STORAGE_NAME);
	}
	config.log_config.storage = storage;
}

string LoggingStorage::GetSetting(const RemoteFileSystemConfig &config) {
	return config.log_config.storage;
}

//===----------------------------------------------------------------------===//
// Enabled Log Types
//===----------------------------------------------------------------------===//
void EnabledLogTypes::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.log_config.enabled_log_types = ParseLogTypes(parameter);
}

string EnabledLogTypes::GetSetting(const RemoteFileSystemConfig &config) {
	return RenderLogTypes(config.log_config.enabled_log_types);
}

//===----------------------------------------------------------------------===//
// Disabled Log Types
//===----------------------------------------------------------------------===//
void DisabledLogTypes::SetGlobal(RemoteFileSystemConfig &config, const string &parameter) {
	config.log_config.disabled_log_types = ParseLogTypes(parameter);
}

string DisabledLogTypes::GetSetting(const RemoteFileSystemConfig &config) {
	return RenderLogTypes(config.log_config.disabled_log_types);
}

} // namespace remotefs
