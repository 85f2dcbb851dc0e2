#include "remotefs.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/common/printer.hpp"

#include <stdio.h>
#include <stdlib.h>

/* USAGE:
./remotefs_cat <root directory> <path> [option=value ...]
./remotefs_cat test/data /people.json enable_logging=true logging_storage=stdout
*/

using namespace remotefs;

void PrintUsage() {
	printf("Usage: remotefs_cat [root directory] [path] [option=value ...]\n");
	exit(1);
}

int main(int argc, const char **argv) {
	if (argc < 3) {
		PrintUsage();
	}
	try {
		RemoteFileSystemConfig config;
		config.ReadFromEnvironment();
		for (int i = 3; i < argc; i++) {
			auto setting = string(argv[i]);
			auto pos = setting.find('=');
			if (pos == string::npos) {
				PrintUsage();
			}
			config.SetOption(setting.substr(0, pos), setting.substr(pos + 1));
		}

		RemoteFileSystem fs(make_shared_ptr<LocalTransferSession>(argv[1]), config);
		auto handle = fs.Open(argv[2]);
		auto reader = handle->ReadAll();
		idx_t count = 0;
		while (reader->Next()) {
			if (reader->GetFormat() == FormatToken::TEXT) {
				string line;
				reader->Scan(line);
				Printer::Print(OutputStream::STREAM_STDOUT, line);
			} else {
				JsonValue value;
				reader->Scan(value);
				Printer::Print(OutputStream::STREAM_STDOUT, value.ToString());
			}
			count++;
		}
		Printer::PrintF("%llu %s record(s) from %s", count, FormatTokenToString(reader->GetFormat()),
		                handle->GetPath());
	} catch (std::exception &ex) {
		ErrorData error(ex);
		Printer::Print(OutputStream::STREAM_STDERR, error.Message());
		return 1;
	}
	return 0;
}
