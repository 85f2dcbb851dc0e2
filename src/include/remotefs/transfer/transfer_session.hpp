//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/transfer/transfer_session.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/types/timestamp.hpp"
#include "remotefs/transfer/transfer_stream.hpp"

namespace remotefs {

//! An entry of a remote directory
struct RemoteFileInfo {
	RemoteFileInfo() : is_directory(false), size(0), last_modified(0) {
	}

	string name;
	bool is_directory;
	int64_t size;
	timestamp_t last_modified;
};

//! The protocol session a remote file system talks to (e.g. an FTP or SFTP connection). All offsets are absolute
//! byte positions within the remote object. A missing path raises a NotFoundException, any other protocol failure an
//! IOException.
class TransferSession {
public:
	virtual ~TransferSession() {
	}

	//! Open a stream over the contents of the remote object, starting at the given offset
	virtual unique_ptr<TransferStream> RetrieveFrom(const string &path, idx_t offset) = 0;
	//! Store the contents of the source at the given offset. An offset of 0 replaces the object, any other offset
	//! resumes the upload at that position and keeps the bytes before it.
	virtual void StoreFrom(const string &path, TransferStream &source, idx_t offset) = 0;
	//! The current size of the remote object in bytes
	virtual int64_t FileSize(const string &path) = 0;
	//! The last modification time of the remote object
	virtual timestamp_t GetModificationTime(const string &path) = 0;

	//! Create an empty object, or truncate an existing one
	virtual void CreateFile(const string &path);
	virtual void MakeDirectory(const string &path);
	virtual void ChangeDirectory(const string &path);
	virtual string GetWorkingDirectory();
	virtual vector<RemoteFileInfo> ListDirectory(const string &path);
	virtual RemoteFileInfo Stat(const string &path);
	virtual void RemoveFile(const string &path);
	//! Remove a directory and everything below it
	virtual void RemoveDirectory(const string &path);
	virtual void MoveFile(const string &source, const string &target);

	//! Return the name of the session, used in log messages and errors
	virtual string GetName() const = 0;

public:
	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}
};

} // namespace remotefs
