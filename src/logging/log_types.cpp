#include "remotefs/logging/log_type.hpp"
#include "remotefs/remote/instrumentation.hpp"
#include "remotefs/common/json/json_value.hpp"

namespace remotefs {

constexpr const char *DefaultLogType::NAME;
constexpr LogLevel DefaultLogType::LEVEL;
constexpr const char *RemoteFileSystemLogType::NAME;
constexpr LogLevel RemoteFileSystemLogType::LEVEL;

//===--------------------------------------------------------------------===//
// RemoteFileSystemLogType
//===--------------------------------------------------------------------===//
RemoteFileSystemLogType::RemoteFileSystemLogType() : LogType(NAME, LEVEL) {
}

string RemoteFileSystemLogType::ConstructLogMessage(const string &fs_name, const OperationRecord &record) {
	JsonValue message(JsonKind::OBJECT);
	message.Emplace("fs", JsonValue(fs_name));
	message.Emplace("path", JsonValue(record.path));
	message.Emplace("op", JsonValue(record.operation));
	message.Emplace("status", JsonValue(record.success ? "SUCCESS" : "ERROR"));
	message.Emplace("bytes", JsonValue(static_cast<double>(record.bytes)));
	message.Emplace("pos", JsonValue(static_cast<double>(record.position)));
	message.Emplace("duration_ms", JsonValue(static_cast<double>(record.duration_ms)));
	if (record.error.HasError()) {
		message.Emplace("error", JsonValue(record.error.Message()));
	}
	return message.ToString();
}

} // namespace remotefs
