//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/logging/log_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/logging/logging.hpp"

namespace remotefs {

struct OperationRecord;

//! Log types provide some structure to the formats that the different log messages can have
class LogType {
public:
	LogType(const string &name_p, const LogLevel &level_p) : name(name_p), level(level_p) {
	}
	virtual ~LogType() {
	}

	string name;
	LogLevel level;
};

class DefaultLogType : public LogType {
public:
	static constexpr const char *NAME = "";
	static constexpr LogLevel LEVEL = LogLevel::LOG_INFO;
};

class RemoteFileSystemLogType : public LogType {
public:
	static constexpr const char *NAME = "RemoteFileSystem";
	static constexpr LogLevel LEVEL = LogLevel::LOG_DEBUG;

	RemoteFileSystemLogType();

	static string ConstructLogMessage(const string &fs_name, const OperationRecord &record);
};

} // namespace remotefs
