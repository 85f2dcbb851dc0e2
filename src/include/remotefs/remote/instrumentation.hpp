//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/remote/instrumentation.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/error_data.hpp"

#include <chrono>

namespace remotefs {

class LogManager;

//! The outcome of a single public operation on a remote file
struct OperationRecord {
	//! The operation name, e.g. "Read" or "Seek"
	string operation;
	string path;
	bool success = false;
	//! Bytes transferred by the operation (0 for operations that move no data)
	int64_t bytes = 0;
	//! The handle position after the operation
	idx_t position = 0;
	int64_t duration_ms = 0;
	//! Set when success is false
	ErrorData error;
};

//! Receives a record for every public operation, whether it succeeded or failed
class Instrumentation {
public:
	virtual ~Instrumentation() {
	}

	virtual void RecordOperation(const OperationRecord &record) = 0;

public:
	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
};

struct OperationStatistics {
	idx_t calls = 0;
	idx_t failures = 0;
	int64_t total_bytes = 0;
	int64_t total_duration_ms = 0;
};

//! Writes every operation to the log and keeps per-operation statistics
class LoggingInstrumentation : public Instrumentation {
public:
	LoggingInstrumentation(shared_ptr<LogManager> log_manager, string fs_name);

	void RecordOperation(const OperationRecord &record) override;

	//! Statistics of a single operation, all zero if it was never called
	OperationStatistics GetStatistics(const string &operation);
	unordered_map<string, OperationStatistics> GetAllStatistics();
	void ResetStatistics();

private:
	shared_ptr<LogManager> log_manager;
	string fs_name;

	mutex lock;
	unordered_map<string, OperationStatistics> statistics;
};

//! Times an operation and reports it when it goes out of scope. The operation counts as successful only if Finish
//! was called before destruction.
class OperationTracker {
public:
	OperationTracker(Instrumentation &instrumentation, string operation, string path);
	~OperationTracker();

	void Finish(int64_t bytes, idx_t position);
	void Fail(const std::exception &ex, idx_t position);

private:
	Instrumentation &instrumentation;
	std::chrono::steady_clock::time_point start;
	OperationRecord record;
	bool finished;
};

} // namespace remotefs
