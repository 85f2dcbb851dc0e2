#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

#include "remotefs/common/helper.hpp"
#include "test_helpers.hpp"

#include <cstdio>

using namespace remotefs;

int main(int argc_in, char *argv[]) {
	idx_t argc = UnsafeNumericCast<idx_t>(argc_in);
	int new_argc = 0;
	auto new_argv = unique_ptr<char *[]>(new char *[argc]);
	for (idx_t i = 0; i < argc; i++) {
		string argument(argv[i]);
		if (argument == "--test-temp-dir" && i + 1 < argc) {
			SetDeleteTestPath(false);
			SetTestDirectory(string(argv[++i]));
		} else {
			new_argv[new_argc] = argv[i];
			new_argc++;
		}
	}

	// delete the testing directory if it exists
	string dir;
	try {
		dir = TestCreatePath("");
		TestDeleteDirectory(dir);
		// create the empty testing directory
		dir = TestCreatePath("");
	} catch (std::exception &ex) {
		ErrorData error(ex);
		fprintf(stderr, "Failed to create testing directory \"%s\": %s\n", dir.c_str(), error.Message().c_str());
		return 1;
	}

	int result = Catch::Session().run(new_argc, new_argv.get());

	if (DeleteTestPath()) {
		TestDeleteDirectory(GetTestDirectory());
	}
	return result;
}
