//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/case_insensitive_map.hpp"
#include "remotefs/common/constants.hpp"
#include "remotefs/logging/logging.hpp"

namespace remotefs {

struct RemoteFileSystemConfig;

typedef void (*set_global_function_t)(RemoteFileSystemConfig &config, const string &parameter);
typedef string (*get_setting_function_t)(const RemoteFileSystemConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	set_global_function_t set_global;
	get_setting_function_t get_setting;
};

//! The settings of a remote file system
struct RemoteFileSystemConfig {
public:
	RemoteFileSystemConfig();

	//! The remote server to connect to
	string host;
	idx_t port;
	string user;
	string password;
	//! The directory on the remote side all paths are relative to
	string remote_dir;
	//! The chunk size sequential readers fetch from a handle
	idx_t read_buffer_size;
	//! Paths ending in this extension are read as JSON
	string json_extension;
	//! The log configuration
	LogConfig log_config;

public:
	//! Set an option by its (case insensitive) name
	void SetOption(const string &name, const string &value);
	//! Render the current value of an option
	string GetOption(const string &name) const;
	//! Overlay every REMOTEFS_<OPTION> environment variable that is set
	void ReadFromEnvironment();

	static RemoteFileSystemConfig FromSettings(const case_insensitive_map_t<string> &settings);

	static idx_t GetOptionCount();
	static vector<string> GetOptionNames();
	static const ConfigurationOption *GetOptionByIndex(idx_t index);
	static const ConfigurationOption *GetOptionByName(const string &name);
};

} // namespace remotefs
