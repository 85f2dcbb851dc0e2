#include "remotefs/remote/remote_file_system.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/logging/log_manager.hpp"
#include "remotefs/remote/instrumentation.hpp"

namespace remotefs {

constexpr FileOpenFlags FileFlags::FILE_FLAGS_READ;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_WRITE;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_FILE_CREATE;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_FILE_CREATE_NEW;
constexpr FileOpenFlags FileFlags::FILE_FLAGS_APPEND;

RemoteFileSystem::RemoteFileSystem(shared_ptr<TransferSession> session_p, RemoteFileSystemConfig config_p,
                                   shared_ptr<Instrumentation> instrumentation_p)
    : session(std::move(session_p)), config(std::move(config_p)), instrumentation(std::move(instrumentation_p)) {
	if (!session) {
		throw InvalidInputException("RemoteFileSystem requires a transfer session");
	}
	if (config.read_buffer_size == 0) {
		throw InvalidConfigurationException("The read buffer size must be larger than 0");
	}
	log_manager = make_shared_ptr<LogManager>(config.log_config);
	if (!instrumentation) {
		instrumentation = make_shared_ptr<LoggingInstrumentation>(log_manager, GetName());
	}
	if (!config.remote_dir.empty()) {
		ChangeDirectory(config.remote_dir);
	}
	REMOTEFS_LOG_INFO(*this, "Connected %s to %s:%llu as \"%s\"", session->GetName(), config.host, config.port,
	                  config.user);
}

RemoteFileSystem::~RemoteFileSystem() {
}

string RemoteFileSystem::GetName() const {
	return session->GetName();
}

unique_ptr<RemoteFileHandle> RemoteFileSystem::OpenFile(const string &path, FileOpenFlags flags) {
	OperationTracker tracker(*instrumentation, "Open", path);
	try {
		flags.Verify();
		if (flags.OverwriteExistingFile()) {
			session->CreateFile(path);
		} else if (flags.CreateFileIfNotExists()) {
			if (!FileExists(path)) {
				session->CreateFile(path);
			}
		} else {
			// the file has to exist: a missing path raises a NotFoundException here
			session->FileSize(path);
		}
		idx_t offset = 0;
		if (flags.OpenForAppending()) {
			offset = UnsafeNumericCast<idx_t>(session->FileSize(path));
		}
		auto handle = make_uniq<RemoteFileHandle>(*this, path, flags, offset);
		tracker.Finish(0, offset);
		return handle;
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

unique_ptr<RemoteFileHandle> RemoteFileSystem::Open(const string &path) {
	return OpenFile(path, FileFlags::FILE_FLAGS_READ);
}

unique_ptr<RemoteFileHandle> RemoteFileSystem::Create(const string &path) {
	return OpenFile(path, FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_WRITE |
	                          FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
}

void RemoteFileSystem::MakeDirectory(const string &path) {
	OperationTracker tracker(*instrumentation, "MakeDirectory", path);
	try {
		session->MakeDirectory(path);
		tracker.Finish(0, 0);
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

void RemoteFileSystem::ChangeDirectory(const string &path) {
	OperationTracker tracker(*instrumentation, "ChangeDirectory", path);
	try {
		session->ChangeDirectory(path);
		tracker.Finish(0, 0);
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

string RemoteFileSystem::GetWorkingDirectory() {
	OperationTracker tracker(*instrumentation, "GetWorkingDirectory", "");
	try {
		auto result = session->GetWorkingDirectory();
		tracker.Finish(0, 0);
		return result;
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

vector<RemoteFileInfo> RemoteFileSystem::ListDirectory(const string &path) {
	OperationTracker tracker(*instrumentation, "ListDirectory", path);
	try {
		auto result = session->ListDirectory(path);
		tracker.Finish(0, 0);
		return result;
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

RemoteFileInfo RemoteFileSystem::Stat(const string &path) {
	OperationTracker tracker(*instrumentation, "Stat", path);
	try {
		auto result = session->Stat(path);
		tracker.Finish(0, 0);
		return result;
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

void RemoteFileSystem::RemoveFile(const string &path) {
	OperationTracker tracker(*instrumentation, "RemoveFile", path);
	try {
		session->RemoveFile(path);
		tracker.Finish(0, 0);
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

void RemoteFileSystem::RemoveDirectory(const string &path) {
	OperationTracker tracker(*instrumentation, "RemoveDirectory", path);
	try {
		session->RemoveDirectory(path);
		tracker.Finish(0, 0);
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

void RemoteFileSystem::MoveFile(const string &source, const string &target) {
	OperationTracker tracker(*instrumentation, "MoveFile", source);
	try {
		session->MoveFile(source, target);
		tracker.Finish(0, 0);
	} catch (std::exception &ex) {
		tracker.Fail(ex, 0);
		throw;
	}
}

bool RemoteFileSystem::FileExists(const string &path) {
	try {
		session->FileSize(path);
		return true;
	} catch (NotFoundException &ex) {
		return false;
	}
}

bool RemoteFileSystem::DirectoryExists(const string &path) {
	try {
		return session->Stat(path).is_directory;
	} catch (NotFoundException &ex) {
		return false;
	}
}

} // namespace remotefs
