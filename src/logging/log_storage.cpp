#include "remotefs/logging/log_storage.hpp"

#include "remotefs/common/printer.hpp"
#include "remotefs/common/string_util.hpp"

namespace remotefs {

void LogStorage::Truncate() {
	throw NotImplementedException("Truncate not implemented for this LogStorage");
}

vector<LogEntry> LogStorage::GetEntries() {
	throw NotImplementedException("Scanning is not supported by this LogStorage");
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message) {
	auto line = StringUtil::Format("%s\t%s\t%s\t%s\n", Timestamp::ToString(timestamp), LogLevelToString(level),
	                               log_type, log_message);
	Printer::RawPrint(OutputStream::STREAM_STDOUT, line);
}

void StdOutLogStorage::Flush() {
	Printer::Flush(OutputStream::STREAM_STDOUT);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message) {
	lock_guard<mutex> lck(lock);
	LogEntry entry;
	entry.timestamp = timestamp;
	entry.level = level;
	entry.log_type = log_type;
	entry.message = log_message;
	entries.push_back(std::move(entry));
}

void InMemoryLogStorage::Flush() {
	// NOP
}

void InMemoryLogStorage::Truncate() {
	lock_guard<mutex> lck(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() {
	lock_guard<mutex> lck(lock);
	return entries;
}

} // namespace remotefs
