#include "catch.hpp"
#include "mock_transfer_session.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace remotefs;
using namespace std;

namespace {

struct Record {
	int64_t n = 0;

	static Record Deserialize(JsonDeserializer &deserializer) {
		Record result;
		result.n = deserializer.ReadProperty<int64_t>("n");
		return result;
	}
};

struct Person {
	string name;
	int32_t age = 0;
	vector<string> tags;
	bool active = false;

	static Person Deserialize(JsonDeserializer &deserializer) {
		Person result;
		result.name = deserializer.ReadProperty<string>("name");
		result.age = deserializer.ReadProperty<int32_t>("age");
		result.tags = deserializer.ReadPropertyWithDefault<vector<string>>("tags", vector<string>());
		result.active = deserializer.ReadPropertyWithDefault<bool>("active", true);
		return result;
	}
};

} // namespace

TEST_CASE("Text files are read line by line", "[format_reader]") {
	MockFileSystem mock;
	mock.session->files["/data.csv"] = "a,b\nc,d";
	auto handle = mock.fs.Open("/data.csv");
	auto reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::TEXT);

	string line;
	REQUIRE(reader->Next());
	reader->Scan(line);
	REQUIRE(line == "a,b");
	REQUIRE(reader->Next());
	reader->Scan(line);
	REQUIRE(line == "c,d");
	REQUIRE(!reader->Next());
	REQUIRE(!reader->Next());
	REQUIRE_THROWS_AS(reader->Scan(line), IOException);
	REQUIRE(line == "c,d");
}

TEST_CASE("Readers continue from the current position of the handle", "[format_reader]") {
	MockFileSystem mock;
	SECTION("text") {
		mock.session->files["/data.csv"] = "header\nrow1\nrow2";
		auto handle = mock.fs.Open("/data.csv");
		REQUIRE(handle->ReadLine() == "header");
		auto reader = handle->ReadAll();
		REQUIRE(ReadAllLines(*reader) == vector<string>({"row1", "row2"}));
	}
	SECTION("json array") {
		mock.session->files["/records.json"] = "[0] [1, 2]";
		auto handle = mock.fs.Open("/records.json");
		REQUIRE(handle->Seek(4, SeekWhence::START) == 4);
		auto reader = handle->ReadAll();
		REQUIRE(reader->GetFormat() == FormatToken::ARRAY);
		vector<int64_t> values;
		while (reader->Next()) {
			int64_t value;
			reader->Scan(value);
			values.push_back(value);
		}
		REQUIRE(values == vector<int64_t>({1, 2}));
		REQUIRE(mock.session->retrieve_offsets[0] == 4);
	}
	SECTION("single json value") {
		// a single value is always decoded from the start of the file
		mock.session->files["/record.json"] = "{\"n\":7}";
		auto handle = mock.fs.Open("/record.json");
		handle->Seek(3, SeekWhence::START);
		auto reader = handle->ReadAll();
		REQUIRE(reader->GetFormat() == FormatToken::OBJECT);
		Record record;
		REQUIRE(reader->Next());
		reader->Scan(record);
		REQUIRE(record.n == 7);
	}
}

TEST_CASE("Line reader keeps line content verbatim", "[format_reader]") {
	MockFileSystem mock;
	mock.session->files["/notes.txt"] = "  leading\ttab  \r\n\nmiddle\n{\"not\": \"json\"}\n";
	auto handle = mock.fs.Open("/notes.txt");
	auto reader = handle->ReadAll();
	auto lines = ReadAllLines(*reader);
	REQUIRE(lines == vector<string>({"  leading\ttab  ", "", "middle", "{\"not\": \"json\"}"}));

	// an empty file has no lines
	mock.session->files["/empty.txt"] = "";
	auto empty_handle = mock.fs.Open("/empty.txt");
	auto empty_reader = empty_handle->ReadAll();
	REQUIRE(!empty_reader->Next());
}

TEST_CASE("Line reader only scans into strings", "[format_reader]") {
	MockFileSystem mock;
	mock.session->files["/data.txt"] = "first\nsecond";
	auto handle = mock.fs.Open("/data.txt");
	auto reader = handle->ReadAll();

	REQUIRE(reader->Next());
	int64_t number = 7;
	REQUIRE_THROWS_AS(reader->Scan(number), InvalidInputException);
	REQUIRE(number == 7);
	JsonValue value(string("untouched"));
	REQUIRE_THROWS_AS(reader->Scan(value), InvalidInputException);
	REQUIRE(value.As<string>() == "untouched");

	// the line was not consumed by the failed scans
	string line;
	reader->Scan(line);
	REQUIRE(line == "first");
	reader->Scan(line);
	REQUIRE(line == "second");
	REQUIRE(!reader->Next());
}

TEST_CASE("Line reader fetches the file in chunks", "[format_reader]") {
	RemoteFileSystemConfig config;
	config.read_buffer_size = 3;
	MockFileSystem mock(config);
	mock.session->files["/data.txt"] = "one\ntwo\nthree\n";
	auto handle = mock.fs.Open("/data.txt");
	auto reader = handle->ReadAll();
	REQUIRE(ReadAllLines(*reader) == vector<string>({"one", "two", "three"}));
	REQUIRE(mock.session->retrieve_offsets == vector<idx_t>({0, 3, 6, 9, 12, 14}));
}

TEST_CASE("JSON arrays are streamed element by element", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/records.json"] = "[{\"n\":1},{\"n\":2}]";
	auto handle = mock.fs.Open("/records.json");
	auto reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::ARRAY);

	Record record;
	REQUIRE(reader->Next());
	// Next does not move past the current element
	REQUIRE(reader->Next());
	reader->Scan(record);
	REQUIRE(record.n == 1);
	REQUIRE(reader->Next());
	reader->Scan(record);
	REQUIRE(record.n == 2);
	REQUIRE(!reader->Next());
	REQUIRE_THROWS_AS(reader->Scan(record), IOException);
	REQUIRE(record.n == 2);
	REQUIRE(reader->Cast<JSONArrayReader>().ElementCount() == 2);
}

TEST_CASE("JSON array elements can be scanned into different targets", "[format_reader][json]") {
	RemoteFileSystemConfig config;
	config.read_buffer_size = 5;
	MockFileSystem mock(config);
	mock.session->files["/mixed.json"] =
	    " \n [ 1, \"two\" , null, [3, 4], {\"name\": \"Ann\", \"AGE\": 41, \"tags\": [\"a\", \"b\"]}, \"\\u00e9\\ud83d\\ude00\" ] ";
	auto handle = mock.fs.Open("/mixed.json");
	auto reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::ARRAY);

	double number;
	reader->Scan(number);
	REQUIRE(number == 1);
	string text;
	reader->Scan(text);
	REQUIRE(text == "two");
	JsonValue value;
	reader->Scan(value);
	REQUIRE(value.IsNull());
	vector<int64_t> numbers;
	reader->Scan(numbers);
	REQUIRE(numbers == vector<int64_t>({3, 4}));
	Person person;
	reader->Scan(person);
	REQUIRE(person.name == "Ann");
	REQUIRE(person.age == 41);
	REQUIRE(person.tags == vector<string>({"a", "b"}));
	REQUIRE(person.active);
	reader->Scan(text);
	REQUIRE(text == "\xc3\xa9\xf0\x9f\x98\x80");
	REQUIRE(!reader->Next());
}

TEST_CASE("JSON array elements keep 64-bit integer precision", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/ids.json"] = "[9007199254740993, -9223372036854775808, 18446744073709551615]";
	auto handle = mock.fs.Open("/ids.json");
	auto reader = handle->ReadAll();

	int64_t id = 0;
	REQUIRE(reader->Next());
	reader->Scan(id);
	REQUIRE(id == 9007199254740993LL);
	REQUIRE(reader->Next());
	reader->Scan(id);
	REQUIRE(id == std::numeric_limits<int64_t>::min());
	uint64_t unsigned_id = 0;
	REQUIRE(reader->Next());
	reader->Scan(unsigned_id);
	REQUIRE(unsigned_id == std::numeric_limits<uint64_t>::max());
	REQUIRE(!reader->Next());
}

TEST_CASE("A failed JSON scan leaves the target untouched", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/records.json"] = "[{\"n\":1},{\"n\":\"x\"},{\"n\":1.5},{\"n\":3}]";
	auto handle = mock.fs.Open("/records.json");
	auto reader = handle->ReadAll();

	Record record;
	reader->Scan(record);
	REQUIRE(record.n == 1);
	REQUIRE_THROWS_AS(reader->Scan(record), SerializationException);
	REQUIRE(record.n == 1);
	REQUIRE_THROWS_AS(reader->Scan(record), SerializationException);
	REQUIRE(record.n == 1);
	// the element was well-formed JSON, so the reader continues after it
	REQUIRE(reader->Next());
	reader->Scan(record);
	REQUIRE(record.n == 3);
	REQUIRE(!reader->Next());
}

TEST_CASE("Malformed array content is reported by Scan, not by Next", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/broken.json"] = "[{\"n\":1} {\"n\":2}]";
	auto handle = mock.fs.Open("/broken.json");
	auto reader = handle->ReadAll();

	Record record;
	reader->Scan(record);
	REQUIRE(record.n == 1);
	// the missing separator is detected by the lookahead, which does not throw
	REQUIRE(reader->Next());
	REQUIRE_THROWS_AS(reader->Scan(record), SerializationException);
	REQUIRE(record.n == 1);
	REQUIRE(!reader->Next());

	mock.session->files["/truncated.json"] = "[{\"n\":1},";
	handle = mock.fs.Open("/truncated.json");
	reader = handle->ReadAll();
	reader->Scan(record);
	REQUIRE(reader->Next());
	REQUIRE_THROWS_AS(reader->Scan(record), SerializationException);
	REQUIRE(!reader->Next());

	mock.session->files["/empty_array.json"] = "[ ]";
	handle = mock.fs.Open("/empty_array.json");
	reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::ARRAY);
	REQUIRE(!reader->Next());
}

TEST_CASE("A single JSON value is decoded in one scan", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/record.json"] = "{\"n\":1}";
	auto handle = mock.fs.Open("/record.json");
	auto reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::OBJECT);

	Record record;
	REQUIRE(reader->Next());
	REQUIRE(reader->Next());
	reader->Scan(record);
	REQUIRE(record.n == 1);
	REQUIRE(!reader->Next());
	REQUIRE_THROWS_AS(reader->Scan(record), IOException);

	// classification and decoding each start from the beginning of the file
	REQUIRE(mock.session->retrieve_offsets.size() >= 2);
	REQUIRE(mock.session->retrieve_offsets[0] == 0);
	REQUIRE(mock.session->retrieve_offsets[1] == 0);
}

TEST_CASE("A single JSON value that fails to decode is not retried", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/record.json"] = "{\"n\": \"one\"}";
	auto handle = mock.fs.Open("/record.json");
	auto reader = handle->ReadAll();
	Record record;
	record.n = 42;
	REQUIRE_THROWS_AS(reader->Scan(record), SerializationException);
	REQUIRE(record.n == 42);
	REQUIRE(!reader->Next());

	// top-level scalars use the same reader
	mock.session->files["/number.json"] = "  42 ";
	handle = mock.fs.Open("/number.json");
	reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::OBJECT);
	int32_t number;
	reader->Scan(number);
	REQUIRE(number == 42);
}

TEST_CASE("Invalid JSON content fails when opening the reader", "[format_reader][json]") {
	MockFileSystem mock;
	mock.session->files["/invalid.json"] = "hello";
	auto handle = mock.fs.Open("/invalid.json");
	REQUIRE_THROWS_AS(handle->ReadAll(), SerializationException);
	REQUIRE(mock.instrumentation->Last().operation == "ReadAll");
	REQUIRE(!mock.instrumentation->Last().success);

	mock.session->files["/empty.json"] = "   ";
	handle = mock.fs.Open("/empty.json");
	REQUIRE_THROWS_AS(handle->ReadAll(), SerializationException);

	// transport errors during classification surface from the factory as well
	mock.session->files["/records.json"] = "[1]";
	handle = mock.fs.Open("/records.json");
	mock.session->FailOn("RetrieveFrom", ExceptionType::IO, "connection lost");
	REQUIRE_THROWS_AS(handle->ReadAll(), IOException);
}

TEST_CASE("The JSON extension is configurable", "[format_reader][config]") {
	RemoteFileSystemConfig config;
	config.SetOption("json_extension", "data");
	MockFileSystem mock(config);
	mock.session->files["/records.data"] = "[1,2]";
	mock.session->files["/records.json"] = "[1,2]";

	auto handle = mock.fs.Open("/records.data");
	auto reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::ARRAY);
	handle = mock.fs.Open("/records.json");
	reader = handle->ReadAll();
	REQUIRE(reader->GetFormat() == FormatToken::TEXT);
	REQUIRE(ReadAllLines(*reader) == vector<string>({"[1,2]"}));
}
