#include "test_helpers.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

#define TESTING_DIRECTORY_NAME "remotefs_unittest_tempdir"

namespace remotefs {
static string custom_test_directory;
static bool delete_test_path = true;

//! Local helpers go through a session rooted at the working directory
static LocalTransferSession &LocalSession() {
	static LocalTransferSession session(".");
	return session;
}

void TestDeleteDirectory(string path) {
	try {
		LocalSession().RemoveDirectory(path);
	} catch (NotFoundException &ex) {
		// nothing to delete
	}
}

void TestDeleteFile(string path) {
	try {
		LocalSession().RemoveFile(path);
	} catch (NotFoundException &ex) {
		// nothing to delete
	}
}

void TestCreateDirectory(string path) {
	LocalSession().MakeDirectory(path);
}

void SetDeleteTestPath(bool delete_path) {
	delete_test_path = delete_path;
}

bool DeleteTestPath() {
	return delete_test_path;
}

void SetTestDirectory(string path) {
	custom_test_directory = path;
}

string GetTestDirectory() {
	if (custom_test_directory.empty()) {
		return TESTING_DIRECTORY_NAME;
	}
	return custom_test_directory;
}

string TestDirectoryPath() {
	auto test_directory = GetTestDirectory();
	TestCreateDirectory(test_directory);
	string path;
	if (custom_test_directory.empty()) {
		// add the PID to the test directory - but only if it was not specified explicitly by the user
		path = StringUtil::Format(test_directory + "/%d", getpid());
	} else {
		path = test_directory;
	}
	TestCreateDirectory(path);
	return path;
}

string TestCreatePath(string suffix) {
	if (suffix.empty()) {
		return TestDirectoryPath();
	}
	return TestDirectoryPath() + "/" + suffix;
}

void WriteTestFile(const string &path, const string &contents) {
	std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
	if (!outfile) {
		throw IOException("Could not open \"%s\" for writing", path);
	}
	outfile << contents;
	outfile.close();
}

string ReadTestFile(const string &path) {
	std::ifstream infile(path, std::ios::binary);
	if (!infile) {
		throw IOException("Could not open \"%s\" for reading", path);
	}
	std::stringstream buffer;
	buffer << infile.rdbuf();
	return buffer.str();
}

vector<string> ReadAllLines(SequentialReader &reader) {
	vector<string> result;
	while (reader.Next()) {
		string line;
		reader.Scan(line);
		result.push_back(line);
	}
	return result;
}

} // namespace remotefs
