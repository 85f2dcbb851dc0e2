#include "catch.hpp"
#include "mock_transfer_session.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <stdlib.h>

using namespace remotefs;
using namespace std;

TEST_CASE("Configuration defaults", "[config]") {
	RemoteFileSystemConfig config;
	REQUIRE(config.GetOption("port") == "21");
	REQUIRE(config.GetOption("read_buffer_size") == std::to_string(DEFAULT_READ_BUFFER_SIZE));
	REQUIRE(config.GetOption("json_extension") == ".json");
	REQUIRE(config.GetOption("enable_logging") == "false");
	REQUIRE(config.GetOption("logging_level") == "INFO");
	REQUIRE(config.GetOption("logging_mode") == "LEVEL_ONLY");
	REQUIRE(config.GetOption("logging_storage") == "memory");
	REQUIRE(config.GetOption("password").empty());
	REQUIRE(config.GetOption("remote_dir").empty());
}

TEST_CASE("Set and render configuration options", "[config]") {
	RemoteFileSystemConfig config;
	config.SetOption("host", "ftp.example.org");
	config.SetOption("PORT", "2121");
	config.SetOption("user", "anonymous");
	config.SetOption("password", "secret");
	config.SetOption("remote_dir", "/pub");
	config.SetOption("read_buffer_size", "65536");
	config.SetOption("json_extension", "ndjson");
	config.SetOption("enable_logging", "on");
	config.SetOption("logging_level", "warning");
	config.SetOption("logging_mode", "disable_selected");
	config.SetOption("disabled_log_types", " b , a,,");

	REQUIRE(config.host == "ftp.example.org");
	REQUIRE(config.port == 2121);
	REQUIRE(config.GetOption("Port") == "2121");
	REQUIRE(config.user == "anonymous");
	REQUIRE(config.password == "secret");
	REQUIRE(config.GetOption("password") == "redacted");
	REQUIRE(config.remote_dir == "/pub");
	REQUIRE(config.read_buffer_size == 65536);
	REQUIRE(config.json_extension == ".ndjson");
	REQUIRE(config.log_config.enabled);
	REQUIRE(config.log_config.level == LogLevel::LOG_WARN);
	REQUIRE(config.log_config.mode == LogMode::DISABLE_SELECTED);
	REQUIRE(config.GetOption("disabled_log_types") == "a,b");
	REQUIRE(config.log_config.IsConsistent());
}

TEST_CASE("Invalid configuration values are rejected", "[config]") {
	RemoteFileSystemConfig config;
	REQUIRE_THROWS_AS(config.SetOption("no_such_option", "1"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.GetOption("no_such_option"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("port", "0"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("port", "65536"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("port", "21abc"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("port", "-1"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("read_buffer_size", "0"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("read_buffer_size", "99999999999"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("json_extension", ""), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("enable_logging", "maybe"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("logging_level", "loud"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("logging_mode", "some"), InvalidConfigurationException);
	REQUIRE_THROWS_AS(config.SetOption("logging_storage", "file"), InvalidConfigurationException);

	// a rejected value leaves the previous one in place
	REQUIRE(config.port == 21);
	REQUIRE(config.read_buffer_size == DEFAULT_READ_BUFFER_SIZE);

	try {
		config.SetOption("colour", "blue");
		FAIL("expected an exception");
	} catch (InvalidConfigurationException &ex) {
		REQUIRE(ex.RawMessage().find("read_buffer_size") != string::npos);
	}
}

TEST_CASE("Enumerate configuration options", "[config]") {
	auto names = RemoteFileSystemConfig::GetOptionNames();
	REQUIRE(names.size() == RemoteFileSystemConfig::GetOptionCount());
	REQUIRE(std::find(names.begin(), names.end(), "host") != names.end());
	for (idx_t i = 0; i < RemoteFileSystemConfig::GetOptionCount(); i++) {
		auto option = RemoteFileSystemConfig::GetOptionByIndex(i);
		REQUIRE(option);
		REQUIRE(string(option->description).size() > 0);
		REQUIRE(RemoteFileSystemConfig::GetOptionByName(option->name) == option);
	}
	REQUIRE(!RemoteFileSystemConfig::GetOptionByIndex(RemoteFileSystemConfig::GetOptionCount()));
	REQUIRE(!RemoteFileSystemConfig::GetOptionByName("nope"));
}

TEST_CASE("Build a configuration from settings", "[config]") {
	case_insensitive_map_t<string> settings;
	settings["Host"] = "localhost";
	settings["USER"] = "reader";
	settings["logging_storage"] = "STDOUT";
	auto config = RemoteFileSystemConfig::FromSettings(settings);
	REQUIRE(config.host == "localhost");
	REQUIRE(config.user == "reader");
	REQUIRE(config.log_config.storage == "stdout");

	settings["port"] = "http";
	REQUIRE_THROWS_AS(RemoteFileSystemConfig::FromSettings(settings), InvalidConfigurationException);
}

TEST_CASE("Read configuration from the environment", "[config]") {
	setenv("REMOTEFS_HOST", "env.example.org", 1);
	setenv("REMOTEFS_READ_BUFFER_SIZE", "128", 1);
	RemoteFileSystemConfig config;
	config.host = "overridden";
	config.user = "kept";
	config.ReadFromEnvironment();
	unsetenv("REMOTEFS_HOST");
	unsetenv("REMOTEFS_READ_BUFFER_SIZE");

	REQUIRE(config.host == "env.example.org");
	REQUIRE(config.read_buffer_size == 128);
	REQUIRE(config.user == "kept");

	setenv("REMOTEFS_PORT", "not a port", 1);
	REQUIRE_THROWS_AS(config.ReadFromEnvironment(), InvalidConfigurationException);
	unsetenv("REMOTEFS_PORT");
}

TEST_CASE("The file system validates its configuration", "[config]") {
	auto session = make_shared_ptr<MockTransferSession>();
	RemoteFileSystemConfig config;
	config.read_buffer_size = 0;
	REQUIRE_THROWS_AS(RemoteFileSystem(session, config), InvalidConfigurationException);
	REQUIRE_THROWS_AS(RemoteFileSystem(nullptr), InvalidInputException);

	config.read_buffer_size = 8;
	config.log_config.enabled = true;
	RemoteFileSystem fs(session, config);
	REQUIRE(fs.GetConfig().read_buffer_size == 8);
	REQUIRE(fs.GetLogManager().GetConfig().enabled);
	// the connection is announced at INFO
	auto entries = fs.GetLogManager().GetLogStorage()->GetEntries();
	REQUIRE(entries.size() == 1);
	REQUIRE(entries[0].message.find("Connected MockTransferSession") == 0);
}
