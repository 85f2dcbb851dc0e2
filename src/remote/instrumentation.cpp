#include "remotefs/remote/instrumentation.hpp"
#include "remotefs/common/printer.hpp"
#include "remotefs/logging/log_manager.hpp"
#include "remotefs/logging/log_type.hpp"

namespace remotefs {

//===--------------------------------------------------------------------===//
// LoggingInstrumentation
//===--------------------------------------------------------------------===//
LoggingInstrumentation::LoggingInstrumentation(shared_ptr<LogManager> log_manager_p, string fs_name_p)
    : log_manager(std::move(log_manager_p)), fs_name(std::move(fs_name_p)) {
	if (!log_manager) {
		throw InternalException("LoggingInstrumentation requires a LogManager");
	}
}

void LoggingInstrumentation::RecordOperation(const OperationRecord &record) {
	{
		lock_guard<mutex> guard(lock);
		auto &stats = statistics[record.operation];
		stats.calls++;
		if (!record.success) {
			stats.failures++;
		}
		stats.total_bytes += record.bytes;
		stats.total_duration_ms += record.duration_ms;
	}
	auto level = record.success ? RemoteFileSystemLogType::LEVEL : LogLevel::LOG_ERROR;
	REMOTEFS_LOG_INTERNAL(*log_manager, RemoteFileSystemLogType::NAME, level,
	                      RemoteFileSystemLogType::ConstructLogMessage(fs_name, record));
}

OperationStatistics LoggingInstrumentation::GetStatistics(const string &operation) {
	lock_guard<mutex> guard(lock);
	auto entry = statistics.find(operation);
	if (entry == statistics.end()) {
		return OperationStatistics();
	}
	return entry->second;
}

unordered_map<string, OperationStatistics> LoggingInstrumentation::GetAllStatistics() {
	lock_guard<mutex> guard(lock);
	return statistics;
}

void LoggingInstrumentation::ResetStatistics() {
	lock_guard<mutex> guard(lock);
	statistics.clear();
}

//===--------------------------------------------------------------------===//
// OperationTracker
//===--------------------------------------------------------------------===//
OperationTracker::OperationTracker(Instrumentation &instrumentation_p, string operation, string path)
    : instrumentation(instrumentation_p), start(std::chrono::steady_clock::now()), finished(false) {
	record.operation = std::move(operation);
	record.path = std::move(path);
}

OperationTracker::~OperationTracker() {
	auto elapsed = std::chrono::steady_clock::now() - start;
	record.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
	if (!finished && !record.error.HasError()) {
		record.error = ErrorData(ExceptionType::INTERNAL, "operation was aborted before completion");
	}
	record.success = finished;
	try {
		instrumentation.RecordOperation(record);
	} catch (std::exception &ex) {
		// never throw from a destructor
		ErrorData error(ex);
		Printer::Print(OutputStream::STREAM_STDERR,
		               "Failed to record operation " + record.operation + ": " + error.Message());
	}
}

void OperationTracker::Finish(int64_t bytes, idx_t position) {
	record.bytes = bytes;
	record.position = position;
	finished = true;
}

void OperationTracker::Fail(const std::exception &ex, idx_t position) {
	record.error = ErrorData(ex);
	record.position = position;
	finished = false;
}

} // namespace remotefs
