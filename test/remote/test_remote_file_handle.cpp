#include "catch.hpp"
#include "mock_transfer_session.hpp"
#include "test_helpers.hpp"

using namespace remotefs;
using namespace std;

TEST_CASE("Read advances the offset with a fresh retrieve per call", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "hello world";
	auto handle = mock.fs.Open("/file.txt");

	char buffer[5];
	REQUIRE(handle->Read(buffer, 5) == 5);
	REQUIRE(string(buffer, 5) == "hello");
	REQUIRE(handle->SeekPosition() == 5);
	REQUIRE(handle->Read(buffer, 5) == 5);
	REQUIRE(string(buffer, 5) == " worl");
	REQUIRE(handle->Read(buffer, 5) == 1);
	REQUIRE(buffer[0] == 'd');
	REQUIRE(handle->SeekPosition() == 11);
	// end of file
	REQUIRE(handle->Read(buffer, 5) == 0);
	REQUIRE(handle->SeekPosition() == 11);

	REQUIRE(mock.session->retrieve_calls == 4);
	REQUIRE(mock.session->retrieve_offsets == vector<idx_t>({0, 5, 10, 11}));
	// no stream outlives its call
	REQUIRE(mock.session->closed_streams == 4);
}

TEST_CASE("ReadAt leaves the offset untouched", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "hello world";
	auto handle = mock.fs.Open("/file.txt");

	char buffer[5];
	REQUIRE(handle->ReadAt(buffer, 5, 6) == 5);
	REQUIRE(string(buffer, 5) == "world");
	REQUIRE(handle->SeekPosition() == 0);
	REQUIRE(handle->ReadAt(buffer, 5, 100) == 0);
	REQUIRE(handle->SeekPosition() == 0);
	REQUIRE(mock.session->retrieve_offsets == vector<idx_t>({6, 100}));
}

TEST_CASE("Failed reads keep the offset and surface the error", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "hello world";
	auto handle = mock.fs.Open("/file.txt");
	handle->Seek(3, SeekWhence::START);

	char buffer[4];
	mock.session->FailOn("RetrieveFrom", ExceptionType::IO, "connection reset by peer");
	REQUIRE_THROWS_AS(handle->Read(buffer, 4), IOException);
	REQUIRE(handle->SeekPosition() == 3);
	REQUIRE_THROWS_AS(handle->ReadAt(buffer, 4, 0), IOException);
	REQUIRE(handle->SeekPosition() == 3);
	mock.session->ClearFailures();

	// the file disappears on the remote side
	mock.session->files.erase("/file.txt");
	REQUIRE_THROWS_AS(handle->Read(buffer, 4), NotFoundException);
	REQUIRE(handle->SeekPosition() == 3);
}

TEST_CASE("Write stores at the offset and refreshes the modification time", "[remote_file_handle]") {
	MockFileSystem mock;
	auto handle = mock.fs.Create("/out.txt");
	REQUIRE(mock.session->files["/out.txt"].empty());

	REQUIRE(handle->Write("hello", 5) == 5);
	REQUIRE(handle->SeekPosition() == 5);
	REQUIRE(handle->Write(" world", 6) == 6);
	REQUIRE(handle->SeekPosition() == 11);
	REQUIRE(mock.session->files["/out.txt"] == "hello world");
	REQUIRE(mock.session->store_offsets == vector<idx_t>({0, 5}));
	REQUIRE(mock.session->time_calls == 2);

	mock.session->modification_time = Timestamp::FromEpochSeconds(1800000000);
	REQUIRE(handle->WriteAt("W", 1, 6) == 1);
	REQUIRE(handle->SeekPosition() == 11);
	REQUIRE(mock.session->files["/out.txt"] == "hello World");
	REQUIRE(handle->GetLastModifiedTime() == Timestamp::FromEpochSeconds(1800000000));
}

TEST_CASE("Failed writes keep the offset", "[remote_file_handle]") {
	MockFileSystem mock;
	auto handle = mock.fs.Create("/out.txt");
	handle->Write("abc", 3);

	mock.session->FailOn("StoreFrom", ExceptionType::IO, "disk quota exceeded");
	REQUIRE_THROWS_AS(handle->Write("def", 3), IOException);
	REQUIRE(handle->SeekPosition() == 3);
	REQUIRE_THROWS_AS(handle->WriteAt("def", 3, 0), IOException);
	REQUIRE(handle->SeekPosition() == 3);
	REQUIRE(mock.session->files["/out.txt"] == "abc");

	mock.session->FailOn("StoreFrom", ExceptionType::NOT_FOUND, "no such directory");
	REQUIRE_THROWS_AS(handle->Write("def", 3), NotFoundException);
	REQUIRE(handle->SeekPosition() == 3);
}

TEST_CASE("A failing modification time query does not fail the write", "[remote_file_handle]") {
	MockFileSystem mock;
	auto handle = mock.fs.Create("/out.txt");
	mock.session->FailOn("GetModificationTime", ExceptionType::IO, "MDTM not supported");

	REQUIRE(handle->Write("abc", 3) == 3);
	REQUIRE(handle->SeekPosition() == 3);
	REQUIRE(mock.session->files["/out.txt"] == "abc");
	REQUIRE(mock.instrumentation->Last().operation == "Write");
	REQUIRE(mock.instrumentation->Last().success);
}

TEST_CASE("Open modes of the remote file system", "[remote_file_handle]") {
	MockFileSystem mock;

	// opening a missing file for reading fails
	REQUIRE_THROWS_AS(mock.fs.Open("/missing.txt"), NotFoundException);
	REQUIRE(!mock.instrumentation->Last().success);
	REQUIRE(mock.instrumentation->Last().operation == "Open");

	// FILE_CREATE keeps existing content
	mock.session->files["/keep.txt"] = "content";
	auto handle = mock.fs.OpenFile("/keep.txt", FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE);
	REQUIRE(mock.session->files["/keep.txt"] == "content");
	handle = mock.fs.OpenFile("/new.txt", FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE);
	REQUIRE(mock.session->files.count("/new.txt") == 1);

	// FILE_CREATE_NEW truncates
	handle = mock.fs.Create("/keep.txt");
	REQUIRE(mock.session->files["/keep.txt"].empty());

	// APPEND starts at the end of the file
	mock.session->files["/log.txt"] = "line 1\n";
	handle = mock.fs.OpenFile("/log.txt", FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_APPEND);
	REQUIRE(handle->SeekPosition() == 7);
	handle->Write("line 2\n", 7);
	REQUIRE(mock.session->files["/log.txt"] == "line 1\nline 2\n");

	// invalid flag combinations
	REQUIRE_THROWS_AS(mock.fs.OpenFile("/x.txt", FileFlags::FILE_FLAGS_FILE_CREATE), InvalidInputException);
	REQUIRE_THROWS_AS(mock.fs.OpenFile("/x.txt", FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE |
	                                                 FileFlags::FILE_FLAGS_FILE_CREATE_NEW),
	                  InvalidInputException);
}

TEST_CASE("Handles enforce their open mode and closed state", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "abc";
	auto reader = mock.fs.Open("/file.txt");
	REQUIRE_THROWS_AS(reader->Write("x", 1), InvalidInputException);
	REQUIRE(mock.session->files["/file.txt"] == "abc");

	auto writer = mock.fs.OpenFile("/file.txt", FileFlags::FILE_FLAGS_WRITE);
	char buffer[3];
	REQUIRE_THROWS_AS(writer->Read(buffer, 3), InvalidInputException);

	reader->Close();
	REQUIRE(reader->IsClosed());
	REQUIRE_THROWS_AS(reader->Read(buffer, 3), IOException);
	REQUIRE_THROWS_AS(reader->Seek(0, SeekWhence::START), IOException);
	// closing twice is fine
	reader->Close();
}

TEST_CASE("ReadLine and GetFileSize on a handle", "[remote_file_handle]") {
	RemoteFileSystemConfig config;
	config.read_buffer_size = 4;
	MockFileSystem mock(config);
	mock.session->files["/lines.txt"] = "first line\r\nsecond\n\nlast";
	auto handle = mock.fs.Open("/lines.txt");

	REQUIRE(handle->GetFileSize() == 24);
	REQUIRE(handle->ReadLine() == "first line");
	REQUIRE(handle->SeekPosition() == 12);
	REQUIRE(handle->ReadLine() == "second");
	REQUIRE(handle->ReadLine() == "");
	REQUIRE(handle->ReadLine() == "last");
	REQUIRE(handle->SeekPosition() == 24);
	REQUIRE(handle->ReadLine() == "");
}

TEST_CASE("Every handle operation reaches the instrumentation", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "0123456789";
	auto handle = mock.fs.OpenFile("/file.txt", FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_WRITE);

	char buffer[4];
	handle->Read(buffer, 4);
	auto record = mock.instrumentation->Last();
	REQUIRE(record.operation == "Read");
	REQUIRE(record.success);
	REQUIRE(record.bytes == 4);
	REQUIRE(record.position == 4);
	REQUIRE(record.path == "/file.txt");

	handle->ReadAt(buffer, 4, 2);
	REQUIRE(mock.instrumentation->Last().operation == "ReadAt");
	handle->Write("ab", 2);
	REQUIRE(mock.instrumentation->Last().operation == "Write");
	REQUIRE(mock.instrumentation->Last().bytes == 2);
	handle->WriteAt("ab", 2, 0);
	REQUIRE(mock.instrumentation->Last().operation == "WriteAt");

	mock.session->FailOn("RetrieveFrom", ExceptionType::IO, "timeout");
	REQUIRE_THROWS(handle->Read(buffer, 4));
	record = mock.instrumentation->Last();
	REQUIRE(record.operation == "Read");
	REQUIRE(!record.success);
	REQUIRE(record.error.Type() == ExceptionType::IO);
	REQUIRE(StringUtil::Contains(record.error.Message(), "timeout"));

	REQUIRE_THROWS(handle->ReadAt(buffer, 4, 0));
	REQUIRE(mock.instrumentation->Last().operation == "ReadAt");
	REQUIRE(!mock.instrumentation->Last().success);

	mock.session->FailOn("StoreFrom", ExceptionType::IO, "timeout");
	REQUIRE_THROWS(handle->Write("x", 1));
	REQUIRE(!mock.instrumentation->Last().success);
	REQUIRE_THROWS(handle->WriteAt("x", 1, 0));
	REQUIRE(mock.instrumentation->Last().operation == "WriteAt");
	REQUIRE(!mock.instrumentation->Last().success);
}

TEST_CASE("Querying the modification time reaches the instrumentation", "[remote_file_handle]") {
	MockFileSystem mock;
	mock.session->files["/file.txt"] = "0123456789";
	auto handle = mock.fs.Open("/file.txt");

	mock.session->FailOn("GetModificationTime", ExceptionType::IO, "MDTM not supported");
	REQUIRE_THROWS_AS(handle->GetLastModifiedTime(), IOException);
	auto record = mock.instrumentation->Last();
	REQUIRE(record.operation == "LastModified");
	REQUIRE(!record.success);
	REQUIRE(record.path == "/file.txt");
	REQUIRE(StringUtil::Contains(record.error.Message(), "MDTM not supported"));

	mock.session->ClearFailures();
	REQUIRE(handle->GetLastModifiedTime() == Timestamp::FromEpochSeconds(1700000000));
	REQUIRE(mock.instrumentation->Last().operation == "LastModified");
	REQUIRE(mock.instrumentation->Last().success);
	// the cached value is reported too
	handle->GetLastModifiedTime();
	REQUIRE(mock.instrumentation->Count("LastModified") == 3);
	REQUIRE(mock.session->time_calls == 2);
}
