//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/file_open_flags.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

class FileOpenFlags {
public:
	static constexpr idx_t FILE_FLAGS_READ = idx_t(1 << 0);
	static constexpr idx_t FILE_FLAGS_WRITE = idx_t(1 << 1);
	static constexpr idx_t FILE_FLAGS_FILE_CREATE = idx_t(1 << 2);
	static constexpr idx_t FILE_FLAGS_FILE_CREATE_NEW = idx_t(1 << 3);
	static constexpr idx_t FILE_FLAGS_APPEND = idx_t(1 << 4);

public:
	FileOpenFlags() = default;
	constexpr FileOpenFlags(idx_t flags) : flags(flags) { // NOLINT: allow implicit conversion
	}

	FileOpenFlags operator|(FileOpenFlags b) const {
		return FileOpenFlags(flags | b.flags);
	}
	FileOpenFlags &operator|=(FileOpenFlags b) {
		flags |= b.flags;
		return *this;
	}

	void Verify() const {
		if (!OpenForReading() && !OpenForWriting()) {
			throw InvalidInputException("READ, WRITE or both should be specified when opening a file");
		}
		if ((flags & FILE_FLAGS_FILE_CREATE) && (flags & FILE_FLAGS_FILE_CREATE_NEW)) {
			throw InvalidInputException("FILE_CREATE and FILE_CREATE_NEW cannot be combined");
		}
		if (!OpenForWriting() && (flags & (FILE_FLAGS_FILE_CREATE | FILE_FLAGS_FILE_CREATE_NEW | FILE_FLAGS_APPEND))) {
			throw InvalidInputException("FILE_CREATE, FILE_CREATE_NEW and APPEND can only be set together with WRITE");
		}
	}

	bool OpenForReading() const {
		return flags & FILE_FLAGS_READ;
	}
	bool OpenForWriting() const {
		return flags & FILE_FLAGS_WRITE;
	}
	bool OpenForAppending() const {
		return flags & FILE_FLAGS_APPEND;
	}
	bool CreateFileIfNotExists() const {
		return flags & FILE_FLAGS_FILE_CREATE;
	}
	bool OverwriteExistingFile() const {
		return flags & FILE_FLAGS_FILE_CREATE_NEW;
	}
	idx_t GetFlagsInternal() const {
		return flags;
	}

private:
	idx_t flags = 0;
};

class FileFlags {
public:
	//! Open file with read access
	static constexpr FileOpenFlags FILE_FLAGS_READ = FileOpenFlags(FileOpenFlags::FILE_FLAGS_READ);
	//! Open file with write access
	static constexpr FileOpenFlags FILE_FLAGS_WRITE = FileOpenFlags(FileOpenFlags::FILE_FLAGS_WRITE);
	//! Create file if not exists, can only be used together with WRITE
	static constexpr FileOpenFlags FILE_FLAGS_FILE_CREATE = FileOpenFlags(FileOpenFlags::FILE_FLAGS_FILE_CREATE);
	//! Always create a new file. If a file exists, the file is truncated. Cannot be used together with CREATE.
	static constexpr FileOpenFlags FILE_FLAGS_FILE_CREATE_NEW =
	    FileOpenFlags(FileOpenFlags::FILE_FLAGS_FILE_CREATE_NEW);
	//! Open file in append mode
	static constexpr FileOpenFlags FILE_FLAGS_APPEND = FileOpenFlags(FileOpenFlags::FILE_FLAGS_APPEND);
};

} // namespace remotefs
