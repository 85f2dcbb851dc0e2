#include "remotefs/transfer/local_transfer_session.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/common/string_util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <functional>
#include <sys/stat.h>
#include <unistd.h>

namespace remotefs {

//! Raise the exception matching errno for a failed call on path
[[noreturn]] static void ThrowSystemError(const string &action, const string &path) {
	auto error = errno;
	if (error == ENOENT) {
		throw NotFoundException("Could not %s \"%s\": %s", action, path, strerror(error));
	}
	throw IOException("Could not %s \"%s\": %s", action, path, strerror(error));
}

static timestamp_t ModificationTime(const struct stat &status) {
	return timestamp_t(static_cast<int64_t>(status.st_mtim.tv_sec) * Interval::MICROS_PER_SEC +
	                   static_cast<int64_t>(status.st_mtim.tv_nsec) / 1000);
}

//===--------------------------------------------------------------------===//
// LocalTransferStream
//===--------------------------------------------------------------------===//
class LocalTransferStream : public TransferStream {
public:
	LocalTransferStream(int fd, string path, idx_t offset) : fd(fd), path(std::move(path)), position(offset) {
	}
	~LocalTransferStream() override {
		LocalTransferStream::Close();
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override {
		if (fd == -1) {
			throw IOException("Could not read from \"%s\": the transfer is closed", path);
		}
		int64_t bytes_read =
		    pread(fd, buffer, UnsafeNumericCast<size_t>(nr_bytes), UnsafeNumericCast<off_t>(position));
		if (bytes_read == -1) {
			ThrowSystemError("read from", path);
		}
		position += UnsafeNumericCast<idx_t>(bytes_read);
		return UnsafeNumericCast<idx_t>(bytes_read);
	}

	void Close() override {
		if (fd != -1) {
			close(fd);
			fd = -1;
		}
	}

private:
	int fd;
	string path;
	idx_t position;
};

static void WriteAll(int fd, const_data_ptr_t buffer, idx_t nr_bytes, idx_t location, const string &path) {
	while (nr_bytes > 0) {
		int64_t bytes_written =
		    pwrite(fd, buffer, UnsafeNumericCast<size_t>(nr_bytes), UnsafeNumericCast<off_t>(location));
		if (bytes_written == -1) {
			ThrowSystemError("write to", path);
		}
		if (bytes_written == 0) {
			throw IOException("Could not write to \"%s\": no bytes were written at location %llu", path, location);
		}
		buffer += bytes_written;
		nr_bytes -= UnsafeNumericCast<idx_t>(bytes_written);
		location += UnsafeNumericCast<idx_t>(bytes_written);
	}
}

static int RemoveDirectoryRecursive(const string &path) {
	DIR *d = opendir(path.c_str());
	if (!d) {
		return -1;
	}
	unique_ptr<DIR, std::function<void(DIR *)>> dir_unique_ptr(d, [](DIR *dir) { closedir(dir); });
	struct dirent *p;
	while ((p = readdir(d)) != nullptr) {
		// skip "." and ".." as we don't want to recurse on them
		if (!strcmp(p->d_name, ".") || !strcmp(p->d_name, "..")) {
			continue;
		}
		auto entry_path = path + "/" + p->d_name;
		struct stat statbuf;
		if (stat(entry_path.c_str(), &statbuf) != 0) {
			return -1;
		}
		int r = S_ISDIR(statbuf.st_mode) ? RemoveDirectoryRecursive(entry_path) : unlink(entry_path.c_str());
		if (r != 0) {
			return r;
		}
	}
	dir_unique_ptr.reset();
	return rmdir(path.c_str());
}

//===--------------------------------------------------------------------===//
// LocalTransferSession
//===--------------------------------------------------------------------===//
LocalTransferSession::LocalTransferSession(string root_directory_p)
    : root_directory(std::move(root_directory_p)), working_directory("/") {
	while (root_directory.size() > 1 && StringUtil::EndsWith(root_directory, "/")) {
		root_directory.pop_back();
	}
	struct stat status;
	if (stat(root_directory.c_str(), &status) != 0) {
		ThrowSystemError("open root directory", root_directory);
	}
	if (!S_ISDIR(status.st_mode)) {
		throw IOException("Could not open root directory \"%s\": path exists but is not a directory!",
		                  root_directory);
	}
}

string LocalTransferSession::ResolveRemotePath(const string &path) const {
	string full_path = StringUtil::StartsWith(path, "/") ? path : working_directory + "/" + path;
	vector<string> parts;
	for (auto &part : StringUtil::Split(full_path, '/')) {
		if (part.empty() || part == ".") {
			continue;
		}
		if (part == "..") {
			// ".." at the root stays at the root
			if (!parts.empty()) {
				parts.pop_back();
			}
			continue;
		}
		parts.push_back(part);
	}
	return "/" + StringUtil::Join(parts, "/");
}

string LocalTransferSession::ResolveLocalPath(const string &path) const {
	auto remote_path = ResolveRemotePath(path);
	if (remote_path == "/") {
		return root_directory;
	}
	return root_directory + remote_path;
}

unique_ptr<TransferStream> LocalTransferSession::RetrieveFrom(const string &path, idx_t offset) {
	auto local_path = ResolveLocalPath(path);
	int fd = open(local_path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd == -1) {
		ThrowSystemError("retrieve", path);
	}
	auto stream = make_uniq<LocalTransferStream>(fd, path, offset);
	struct stat status;
	if (fstat(fd, &status) != 0) {
		ThrowSystemError("retrieve", path);
	}
	if (S_ISDIR(status.st_mode)) {
		throw IOException("Could not retrieve \"%s\": path is a directory", path);
	}
	return std::move(stream);
}

void LocalTransferSession::StoreFrom(const string &path, TransferStream &source, idx_t offset) {
	auto local_path = ResolveLocalPath(path);
	int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
	if (offset == 0) {
		flags |= O_TRUNC;
	}
	int fd = open(local_path.c_str(), flags, 0644);
	if (fd == -1) {
		ThrowSystemError("store", path);
	}
	unique_ptr<int, std::function<void(int *)>> fd_guard(&fd, [](int *f) { close(*f); });

	data_t buffer[4096];
	auto location = offset;
	while (true) {
		auto bytes_read = source.Read(buffer, sizeof(buffer));
		if (bytes_read == 0) {
			break;
		}
		WriteAll(fd, buffer, bytes_read, location, path);
		location += bytes_read;
	}
}

int64_t LocalTransferSession::FileSize(const string &path) {
	auto local_path = ResolveLocalPath(path);
	struct stat status;
	if (stat(local_path.c_str(), &status) != 0) {
		ThrowSystemError("get size of", path);
	}
	if (S_ISDIR(status.st_mode)) {
		throw IOException("Could not get size of \"%s\": path is a directory", path);
	}
	return static_cast<int64_t>(status.st_size);
}

timestamp_t LocalTransferSession::GetModificationTime(const string &path) {
	auto local_path = ResolveLocalPath(path);
	struct stat status;
	if (stat(local_path.c_str(), &status) != 0) {
		ThrowSystemError("get modification time of", path);
	}
	return ModificationTime(status);
}

void LocalTransferSession::CreateFile(const string &path) {
	auto local_path = ResolveLocalPath(path);
	int fd = open(local_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
	if (fd == -1) {
		ThrowSystemError("create file", path);
	}
	close(fd);
}

void LocalTransferSession::MakeDirectory(const string &path) {
	auto local_path = ResolveLocalPath(path);
	struct stat st;
	if (stat(local_path.c_str(), &st) != 0) {
		// EEXIST for race condition
		if (mkdir(local_path.c_str(), 0755) != 0 && errno != EEXIST) {
			ThrowSystemError("create directory", path);
		}
	} else if (!S_ISDIR(st.st_mode)) {
		throw IOException("Could not create directory \"%s\": path exists but is not a directory!", path);
	}
}

void LocalTransferSession::ChangeDirectory(const string &path) {
	auto remote_path = ResolveRemotePath(path);
	auto local_path = ResolveLocalPath(remote_path);
	struct stat st;
	if (stat(local_path.c_str(), &st) != 0) {
		ThrowSystemError("change directory to", path);
	}
	if (!S_ISDIR(st.st_mode)) {
		throw IOException("Could not change directory to \"%s\": path is not a directory", path);
	}
	working_directory = remote_path;
}

string LocalTransferSession::GetWorkingDirectory() {
	return working_directory;
}

vector<RemoteFileInfo> LocalTransferSession::ListDirectory(const string &path) {
	auto local_path = ResolveLocalPath(path);
	auto dir = opendir(local_path.c_str());
	if (!dir) {
		ThrowSystemError("list directory", path);
	}
	// RAII wrapper around DIR to automatically free on exceptions
	unique_ptr<DIR, std::function<void(DIR *)>> dir_unique_ptr(dir, [](DIR *d) { closedir(d); });

	vector<RemoteFileInfo> result;
	struct dirent *ent;
	while ((ent = readdir(dir)) != nullptr) {
		string name = ent->d_name;
		if (name.empty() || name == "." || name == "..") {
			continue;
		}
		struct stat status;
		if (stat((local_path + "/" + name).c_str(), &status) != 0) {
			continue;
		}
		if (!S_ISREG(status.st_mode) && !S_ISDIR(status.st_mode)) {
			// not a file or directory: skip
			continue;
		}
		RemoteFileInfo info;
		info.name = name;
		info.is_directory = S_ISDIR(status.st_mode);
		info.size = static_cast<int64_t>(status.st_size);
		info.last_modified = ModificationTime(status);
		result.push_back(std::move(info));
	}
	return result;
}

RemoteFileInfo LocalTransferSession::Stat(const string &path) {
	auto local_path = ResolveLocalPath(path);
	struct stat status;
	if (stat(local_path.c_str(), &status) != 0) {
		ThrowSystemError("stat", path);
	}
	RemoteFileInfo info;
	info.name = StringUtil::GetFileName(ResolveRemotePath(path));
	info.is_directory = S_ISDIR(status.st_mode);
	info.size = static_cast<int64_t>(status.st_size);
	info.last_modified = ModificationTime(status);
	return info;
}

void LocalTransferSession::RemoveFile(const string &path) {
	auto local_path = ResolveLocalPath(path);
	if (std::remove(local_path.c_str()) != 0) {
		ThrowSystemError("remove file", path);
	}
}

void LocalTransferSession::RemoveDirectory(const string &path) {
	if (ResolveRemotePath(path) == "/") {
		throw IOException("Could not remove directory \"%s\": cannot remove the root directory", path);
	}
	auto local_path = ResolveLocalPath(path);
	if (RemoveDirectoryRecursive(local_path) != 0) {
		ThrowSystemError("remove directory", path);
	}
}

void LocalTransferSession::MoveFile(const string &source, const string &target) {
	auto local_source = ResolveLocalPath(source);
	auto local_target = ResolveLocalPath(target);
	if (rename(local_source.c_str(), local_target.c_str()) != 0) {
		ThrowSystemError("rename", source);
	}
}

} // namespace remotefs
