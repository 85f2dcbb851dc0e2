//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/types/timestamp.hpp"
#include "remotefs/logging/logging.hpp"

namespace remotefs {

struct LogEntry {
	timestamp_t timestamp;
	LogLevel level;
	string log_type;
	string message;
};

//! Interface for writing log entries
class LogStorage {
public:
	virtual ~LogStorage() {
	}

	//! WRITING
	virtual void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                           const string &log_message) = 0;
	virtual void Flush() = 0;
	//! Remove all stored entries
	virtual void Truncate();

	//! READING (OPTIONAL)
	virtual bool CanScan() {
		return false;
	}
	virtual vector<LogEntry> GetEntries();
};

//! Writes one tab separated line per entry to stdout
class StdOutLogStorage : public LogStorage {
public:
	explicit StdOutLogStorage();
	~StdOutLogStorage() override;

	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;
};

//! Keeps all entries in memory so they can be inspected afterwards
class InMemoryLogStorage : public LogStorage {
public:
	explicit InMemoryLogStorage();
	~InMemoryLogStorage() override;

	void WriteLogEntry(timestamp_t timestamp, LogLevel level, const string &log_type,
	                   const string &log_message) override;
	void Flush() override;
	void Truncate() override;

	bool CanScan() override {
		return true;
	}
	vector<LogEntry> GetEntries() override;

protected:
	mutex lock;
	vector<LogEntry> entries;
};

} // namespace remotefs
