//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/transfer/local_transfer_session.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/transfer/transfer_session.hpp"

namespace remotefs {

//! Serves a directory of the local file system as if it were a remote server. Remote paths are resolved against the
//! session's working directory and can never leave the root directory.
class LocalTransferSession : public TransferSession {
public:
	explicit LocalTransferSession(string root_directory);

	unique_ptr<TransferStream> RetrieveFrom(const string &path, idx_t offset) override;
	void StoreFrom(const string &path, TransferStream &source, idx_t offset) override;
	int64_t FileSize(const string &path) override;
	timestamp_t GetModificationTime(const string &path) override;

	void CreateFile(const string &path) override;
	void MakeDirectory(const string &path) override;
	void ChangeDirectory(const string &path) override;
	string GetWorkingDirectory() override;
	vector<RemoteFileInfo> ListDirectory(const string &path) override;
	RemoteFileInfo Stat(const string &path) override;
	void RemoveFile(const string &path) override;
	void RemoveDirectory(const string &path) override;
	void MoveFile(const string &source, const string &target) override;

	string GetName() const override {
		return "LocalTransferSession";
	}

	const string &GetRootDirectory() const {
		return root_directory;
	}

	//! Resolve a remote path to a normalized absolute remote path (always starting with "/")
	string ResolveRemotePath(const string &path) const;
	//! Resolve a remote path to the local path it is stored at
	string ResolveLocalPath(const string &path) const;

private:
	string root_directory;
	string working_directory;
};

} // namespace remotefs
