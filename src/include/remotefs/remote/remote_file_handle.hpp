//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/remote/remote_file_handle.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/enums/seek_whence.hpp"
#include "remotefs/common/error_data.hpp"
#include "remotefs/common/file_open_flags.hpp"
#include "remotefs/common/types/timestamp.hpp"

namespace remotefs {

class RemoteFileSystem;
class SequentialReader;

//! A random-access handle on a single remote object. The handle only keeps the path and a logical offset: every
//! read or write is a separate round trip on the transfer session, and the remote size is queried again whenever it
//! is needed. A handle must not be used from multiple threads at the same time.
class RemoteFileHandle {
public:
	RemoteFileHandle(RemoteFileSystem &file_system, string path, FileOpenFlags flags, idx_t offset = 0);
	RemoteFileHandle(const RemoteFileHandle &) = delete;
	~RemoteFileHandle();

	//! Read up to nr_bytes at the current offset and advance the offset by the number of bytes read. Returns 0 at
	//! the end of the file.
	int64_t Read(void *buffer, idx_t nr_bytes);
	//! Read up to nr_bytes at the given location, the offset of the handle is not changed
	int64_t ReadAt(void *buffer, idx_t nr_bytes, idx_t location);
	//! Store the buffer at the current offset. The offset only advances if the store succeeded.
	int64_t Write(const void *buffer, idx_t nr_bytes);
	//! Store the buffer at the given location, the offset of the handle is not changed
	int64_t WriteAt(const void *buffer, idx_t nr_bytes, idx_t location);

	//! Move the offset relative to the start, the current offset or the end of the remote object, and return the new
	//! offset. The target must lie within [0, size]; out-of-range targets are rejected, never clamped. On failure an
	//! exception is thrown and the offset is left unchanged.
	idx_t Seek(int64_t offset, SeekWhence whence);
	//! Non-throwing Seek: on failure the error is set, position is 0 and false is returned
	bool TrySeek(int64_t offset, SeekWhence whence, idx_t &position, ErrorData &error);
	//! Move the offset back to the start of the file
	void Reset();
	idx_t SeekPosition() const {
		return offset;
	}

	//! Query the current size of the remote object
	idx_t GetFileSize();
	//! The modification time observed after the last write (queried from the session if nothing was written yet)
	timestamp_t GetLastModifiedTime();

	//! Read a line starting at the current offset, the newline is consumed but not returned
	string ReadLine();
	//! Open a sequential reader over the contents of the file, see FormatReaderFactory
	unique_ptr<SequentialReader> ReadAll();

	void Close();
	bool IsClosed() const {
		return closed;
	}

	const string &GetPath() const {
		return path;
	}
	FileOpenFlags GetFlags() const {
		return flags;
	}

public:
	RemoteFileSystem &file_system;
	string path;

private:
	void VerifyOpen(const char *operation) const;
	void VerifyReadable(const char *operation) const;
	void VerifyWritable(const char *operation) const;
	idx_t ReadInternal(data_ptr_t buffer, idx_t nr_bytes, idx_t location);
	void WriteInternal(const_data_ptr_t buffer, idx_t nr_bytes, idx_t location);
	idx_t ComputeSeekTarget(int64_t offset, SeekWhence whence);
	void RefreshModificationTime();

private:
	FileOpenFlags flags;
	idx_t offset;
	bool has_last_modified;
	timestamp_t last_modified;
	bool closed;
};

} // namespace remotefs
