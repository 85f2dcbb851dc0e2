#include "remotefs/main/config.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/string_util.hpp"
#include "remotefs/main/settings.hpp"

#include <cstdlib>

namespace remotefs {

#define REMOTEFS_GLOBAL(_PARAM)                                                                                        \
	{ _PARAM::Name, _PARAM::Description, _PARAM::SetGlobal, _PARAM::GetSetting }
#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {REMOTEFS_GLOBAL(HostSetting),
                                                       REMOTEFS_GLOBAL(PortSetting),
                                                       REMOTEFS_GLOBAL(UserSetting),
                                                       REMOTEFS_GLOBAL(PasswordSetting),
                                                       REMOTEFS_GLOBAL(RemoteDirSetting),
                                                       REMOTEFS_GLOBAL(ReadBufferSizeSetting),
                                                       REMOTEFS_GLOBAL(JsonExtensionSetting),
                                                       REMOTEFS_GLOBAL(EnableLogging),
                                                       REMOTEFS_GLOBAL(LoggingLevel),
                                                       REMOTEFS_GLOBAL(LoggingMode),
                                                       REMOTEFS_GLOBAL(LoggingStorage),
                                                       REMOTEFS_GLOBAL(EnabledLogTypes),
                                                       REMOTEFS_GLOBAL(DisabledLogTypes),
                                                       FINAL_SETTING};

RemoteFileSystemConfig::RemoteFileSystemConfig()
    : port(21), read_buffer_size(DEFAULT_READ_BUFFER_SIZE), json_extension(DEFAULT_JSON_EXTENSION) {
}

idx_t RemoteFileSystemConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> RemoteFileSystemConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t i = 0, option_count = GetOptionCount(); i < option_count; i++) {
		names.emplace_back(GetOptionByIndex(i)->name);
	}
	return names;
}

const ConfigurationOption *RemoteFileSystemConfig::GetOptionByIndex(idx_t target_index) {
	for (idx_t index = 0; internal_options[index].name; index++) {
		if (index == target_index) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption *RemoteFileSystemConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	for (idx_t index = 0; internal_options[index].name; index++) {
		D_ASSERT(StringUtil::Lower(internal_options[index].name) == string(internal_options[index].name));
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

void RemoteFileSystemConfig::SetOption(const string &name, const string &value) {
	auto option = GetOptionByName(name);
	if (!option) {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\", expected one of: %s", name,
		                                    StringUtil::Join(GetOptionNames(), ", "));
	}
	option->set_global(*this, value);
}

string RemoteFileSystemConfig::GetOption(const string &name) const {
	auto option = GetOptionByName(name);
	if (!option) {
		throw InvalidConfigurationException("Unrecognized configuration option \"%s\"", name);
	}
	return option->get_setting(*this);
}

void RemoteFileSystemConfig::ReadFromEnvironment() {
	for (idx_t index = 0; internal_options[index].name; index++) {
		auto variable = "REMOTEFS_" + StringUtil::Upper(internal_options[index].name);
		auto value = std::getenv(variable.c_str());
		if (value) {
			internal_options[index].set_global(*this, value);
		}
	}
}

RemoteFileSystemConfig RemoteFileSystemConfig::FromSettings(const case_insensitive_map_t<string> &settings) {
	RemoteFileSystemConfig config;
	for (auto &entry : settings) {
		config.SetOption(entry.first, entry.second);
	}
	return config;
}

} // namespace remotefs
