//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/remote/remote_file_system.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/file_open_flags.hpp"
#include "remotefs/main/config.hpp"
#include "remotefs/remote/remote_file_handle.hpp"
#include "remotefs/transfer/transfer_session.hpp"

namespace remotefs {

class Instrumentation;
class LogManager;

//! Presents the objects of a transfer session as files. Every public operation is reported to the instrumentation,
//! both when it succeeds and when it fails.
class RemoteFileSystem {
public:
	//! Creates a file system on top of an established session. Without an explicit instrumentation, operations are
	//! logged through the file system's log manager.
	explicit RemoteFileSystem(shared_ptr<TransferSession> session,
	                          RemoteFileSystemConfig config = RemoteFileSystemConfig(),
	                          shared_ptr<Instrumentation> instrumentation = nullptr);
	~RemoteFileSystem();

	//! Open a handle on the given path. Without FILE_CREATE or FILE_CREATE_NEW the file must already exist.
	unique_ptr<RemoteFileHandle> OpenFile(const string &path, FileOpenFlags flags);
	//! Open an existing file for reading
	unique_ptr<RemoteFileHandle> Open(const string &path);
	//! Create (or truncate) a file and open it for reading and writing
	unique_ptr<RemoteFileHandle> Create(const string &path);

	void MakeDirectory(const string &path);
	void ChangeDirectory(const string &path);
	string GetWorkingDirectory();
	vector<RemoteFileInfo> ListDirectory(const string &path);
	RemoteFileInfo Stat(const string &path);
	void RemoveFile(const string &path);
	//! Remove a directory including its contents
	void RemoveDirectory(const string &path);
	void MoveFile(const string &source, const string &target);
	bool FileExists(const string &path);
	bool DirectoryExists(const string &path);

	TransferSession &GetSession() const {
		return *session;
	}
	Instrumentation &GetInstrumentation() const {
		return *instrumentation;
	}
	LogManager &GetLogManager() const {
		return *log_manager;
	}
	shared_ptr<LogManager> GetLogManagerPointer() const {
		return log_manager;
	}
	const RemoteFileSystemConfig &GetConfig() const {
		return config;
	}
	string GetName() const;

private:
	shared_ptr<TransferSession> session;
	RemoteFileSystemConfig config;
	shared_ptr<LogManager> log_manager;
	shared_ptr<Instrumentation> instrumentation;
};

} // namespace remotefs
