#include "remotefs/remote/remote_file_handle.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/logging/logger.hpp"
#include "remotefs/reader/format_reader_factory.hpp"
#include "remotefs/remote/instrumentation.hpp"
#include "remotefs/remote/remote_file_system.hpp"
#include "remotefs/transfer/transfer_session.hpp"

#include <limits>

namespace remotefs {

RemoteFileHandle::RemoteFileHandle(RemoteFileSystem &file_system, string path_p, FileOpenFlags flags, idx_t offset)
    : file_system(file_system), path(std::move(path_p)), flags(flags), offset(offset), has_last_modified(false),
      last_modified(0), closed(false) {
}

RemoteFileHandle::~RemoteFileHandle() {
}

void RemoteFileHandle::VerifyOpen(const char *operation) const {
	if (closed) {
		throw IOException("Cannot %s \"%s\": the file handle is closed", operation, path);
	}
}

void RemoteFileHandle::VerifyReadable(const char *operation) const {
	VerifyOpen(operation);
	if (!flags.OpenForReading()) {
		throw InvalidInputException("Cannot %s \"%s\": the file was not opened for reading", operation, path);
	}
}

void RemoteFileHandle::VerifyWritable(const char *operation) const {
	VerifyOpen(operation);
	if (!flags.OpenForWriting()) {
		throw InvalidInputException("Cannot %s \"%s\": the file was not opened for writing", operation, path);
	}
}

idx_t RemoteFileHandle::ReadInternal(data_ptr_t buffer, idx_t nr_bytes, idx_t location) {
	// every read is its own retrieve, the stream never outlives this call
	auto stream = file_system.GetSession().RetrieveFrom(path, location);
	idx_t bytes_read = 0;
	while (bytes_read < nr_bytes) {
		auto read_count = stream->Read(buffer + bytes_read, nr_bytes - bytes_read);
		if (read_count == 0) {
			break;
		}
		bytes_read += read_count;
	}
	stream->Close();
	return bytes_read;
}

void RemoteFileHandle::WriteInternal(const_data_ptr_t buffer, idx_t nr_bytes, idx_t location) {
	MemoryTransferStream source(buffer, nr_bytes);
	file_system.GetSession().StoreFrom(path, source, location);
}

void RemoteFileHandle::RefreshModificationTime() {
	try {
		last_modified = file_system.GetSession().GetModificationTime(path);
		has_last_modified = true;
	} catch (std::exception &ex) {
		ErrorData error(ex);
		REMOTEFS_LOG_WARN(*this, "Could not refresh the modification time of \"%s\" after a write: %s", path,
		                  error.Message());
	}
}

int64_t RemoteFileHandle::Read(void *buffer, idx_t nr_bytes) {
	OperationTracker tracker(file_system.GetInstrumentation(), "Read", path);
	try {
		VerifyReadable("read from");
		auto bytes_read = ReadInternal(data_ptr_cast(buffer), nr_bytes, offset);
		offset += bytes_read;
		tracker.Finish(UnsafeNumericCast<int64_t>(bytes_read), offset);
		return UnsafeNumericCast<int64_t>(bytes_read);
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

int64_t RemoteFileHandle::ReadAt(void *buffer, idx_t nr_bytes, idx_t location) {
	OperationTracker tracker(file_system.GetInstrumentation(), "ReadAt", path);
	try {
		VerifyReadable("read from");
		auto bytes_read = ReadInternal(data_ptr_cast(buffer), nr_bytes, location);
		tracker.Finish(UnsafeNumericCast<int64_t>(bytes_read), location + bytes_read);
		return UnsafeNumericCast<int64_t>(bytes_read);
	} catch (std::exception &ex) {
		tracker.Fail(ex, location);
		throw;
	}
}

int64_t RemoteFileHandle::Write(const void *buffer, idx_t nr_bytes) {
	OperationTracker tracker(file_system.GetInstrumentation(), "Write", path);
	try {
		VerifyWritable("write to");
		WriteInternal(const_data_ptr_cast(buffer), nr_bytes, offset);
		offset += nr_bytes;
		RefreshModificationTime();
		tracker.Finish(UnsafeNumericCast<int64_t>(nr_bytes), offset);
		return UnsafeNumericCast<int64_t>(nr_bytes);
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

int64_t RemoteFileHandle::WriteAt(const void *buffer, idx_t nr_bytes, idx_t location) {
	OperationTracker tracker(file_system.GetInstrumentation(), "WriteAt", path);
	try {
		VerifyWritable("write to");
		WriteInternal(const_data_ptr_cast(buffer), nr_bytes, location);
		RefreshModificationTime();
		tracker.Finish(UnsafeNumericCast<int64_t>(nr_bytes), location + nr_bytes);
		return UnsafeNumericCast<int64_t>(nr_bytes);
	} catch (std::exception &ex) {
		tracker.Fail(ex, location);
		throw;
	}
}

idx_t RemoteFileHandle::ComputeSeekTarget(int64_t requested, SeekWhence whence) {
	// the size is queried on every seek, it is never cached on the handle
	auto size = file_system.GetSession().FileSize(path);
	if (size < 0) {
		throw IOException("Cannot seek in \"%s\": the remote size %lld is invalid", path, size);
	}
	int64_t base;
	switch (whence) {
	case SeekWhence::START:
		base = 0;
		break;
	case SeekWhence::CURRENT:
		base = UnsafeNumericCast<int64_t>(offset);
		break;
	case SeekWhence::END:
		base = size;
		break;
	default:
		throw InvalidInputException("Cannot seek in \"%s\": invalid whence %s", path, SeekWhenceToString(whence));
	}
	// base is never negative, so the sum can only overflow upwards
	if (requested > 0 && base > std::numeric_limits<int64_t>::max() - requested) {
		throw OutOfRangeException("Cannot seek in \"%s\": offset %lld from %s overflows", path, requested,
		                          SeekWhenceToString(whence));
	}
	auto target = base + requested;
	if (target < 0 || target > size) {
		throw OutOfRangeException("Cannot seek in \"%s\": target %lld (offset %lld from %s) is outside of [0, %lld]",
		                          path, target, requested, SeekWhenceToString(whence), size);
	}
	return UnsafeNumericCast<idx_t>(target);
}

idx_t RemoteFileHandle::Seek(int64_t requested, SeekWhence whence) {
	OperationTracker tracker(file_system.GetInstrumentation(), "Seek", path);
	try {
		VerifyOpen("seek in");
		auto target = ComputeSeekTarget(requested, whence);
		offset = target;
		tracker.Finish(0, offset);
		return offset;
	} catch (std::exception &ex) {
		// a failed seek reports position 0, the stored offset is untouched
		tracker.Fail(ex, 0);
		throw;
	}
}

bool RemoteFileHandle::TrySeek(int64_t requested, SeekWhence whence, idx_t &position, ErrorData &error) {
	try {
		position = Seek(requested, whence);
		error = ErrorData();
		return true;
	} catch (std::exception &ex) {
		position = 0;
		error = ErrorData(ex);
		return false;
	}
}

void RemoteFileHandle::Reset() {
	OperationTracker tracker(file_system.GetInstrumentation(), "Reset", path);
	try {
		VerifyOpen("reset");
		offset = 0;
		tracker.Finish(0, offset);
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

idx_t RemoteFileHandle::GetFileSize() {
	OperationTracker tracker(file_system.GetInstrumentation(), "FileSize", path);
	try {
		VerifyOpen("get the size of");
		auto size = file_system.GetSession().FileSize(path);
		if (size < 0) {
			throw IOException("Remote size %lld of \"%s\" is invalid", size, path);
		}
		tracker.Finish(0, offset);
		return UnsafeNumericCast<idx_t>(size);
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

timestamp_t RemoteFileHandle::GetLastModifiedTime() {
	OperationTracker tracker(file_system.GetInstrumentation(), "LastModified", path);
	try {
		if (!has_last_modified) {
			VerifyOpen("get the modification time of");
			last_modified = file_system.GetSession().GetModificationTime(path);
			has_last_modified = true;
		}
		tracker.Finish(0, offset);
		return last_modified;
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

string RemoteFileHandle::ReadLine() {
	OperationTracker tracker(file_system.GetInstrumentation(), "ReadLine", path);
	try {
		VerifyReadable("read from");
		auto chunk_size = file_system.GetConfig().read_buffer_size;
		auto buffer = make_uniq_array<data_t>(chunk_size);
		auto position = offset;
		string result;
		bool found_newline = false;
		while (!found_newline) {
			auto bytes_read = ReadInternal(buffer.get(), chunk_size, position);
			if (bytes_read == 0) {
				break;
			}
			idx_t i;
			for (i = 0; i < bytes_read; i++) {
				if (buffer[i] == '\n') {
					found_newline = true;
					break;
				}
			}
			result.append(char_ptr_cast<char>(buffer.get()), i);
			position += found_newline ? i + 1 : bytes_read;
		}
		if (!result.empty() && result.back() == '\r') {
			result.pop_back();
		}
		auto bytes_consumed = position - offset;
		offset = position;
		tracker.Finish(UnsafeNumericCast<int64_t>(bytes_consumed), offset);
		return result;
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

unique_ptr<SequentialReader> RemoteFileHandle::ReadAll() {
	OperationTracker tracker(file_system.GetInstrumentation(), "ReadAll", path);
	try {
		VerifyReadable("read from");
		auto reader = FormatReaderFactory::Open(*this);
		tracker.Finish(0, offset);
		return reader;
	} catch (std::exception &ex) {
		tracker.Fail(ex, offset);
		throw;
	}
}

void RemoteFileHandle::Close() {
	if (closed) {
		return;
	}
	OperationTracker tracker(file_system.GetInstrumentation(), "Close", path);
	closed = true;
	tracker.Finish(0, offset);
}

} // namespace remotefs
