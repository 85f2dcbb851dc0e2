//===----------------------------------------------------------------------===//
//
//                         RemoteFS
//
// test_helpers.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs.hpp"
#include "remotefs/common/string_util.hpp"

namespace remotefs {

void TestDeleteDirectory(string path);
void TestCreateDirectory(string path);
void TestDeleteFile(string path);
void SetDeleteTestPath(bool delete_path);
bool DeleteTestPath();
void SetTestDirectory(string path);
string GetTestDirectory();
string TestDirectoryPath();
string TestCreatePath(string suffix);

//! Write the contents to a local file, replacing it if it exists
void WriteTestFile(const string &path, const string &contents);
//! Read the complete contents of a local file
string ReadTestFile(const string &path);

//! Collect every record of a reader as text
vector<string> ReadAllLines(SequentialReader &reader);

} // namespace remotefs
