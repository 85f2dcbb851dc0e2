#include "catch.hpp"
#include "remotefs/common/error_data.hpp"
#include "remotefs/common/exception.hpp"

using namespace remotefs;
using namespace std;

TEST_CASE("Exception messages are formatted", "[exception]") {
	IOException io("Could not retrieve \"%s\" at offset %llu", "/data.txt", idx_t(42));
	REQUIRE(string(io.what()) == "IO Error: Could not retrieve \"/data.txt\" at offset 42");
	REQUIRE(io.RawMessage() == "Could not retrieve \"/data.txt\" at offset 42");
	REQUIRE(io.type == ExceptionType::IO);

	OutOfRangeException range("position %lld", int64_t(-1));
	REQUIRE(string(range.what()) == "Out of Range Error: position -1");

	// a message without parameters is used as-is
	InvalidInputException input("100% literal");
	REQUIRE(input.RawMessage() == "100% literal");

	REQUIRE(Exception::ExceptionTypeToString(ExceptionType::NOT_FOUND) == "Not Found");
	REQUIRE(Exception::StringToExceptionType("Invalid Configuration") == ExceptionType::INVALID_CONFIGURATION);
}

TEST_CASE("NotFoundException is an IOException", "[exception]") {
	NotFoundException missing("no such file \"%s\"", "x");
	REQUIRE(missing.type == ExceptionType::NOT_FOUND);
	REQUIRE_THROWS_AS(throw missing, IOException);
	try {
		throw NotFoundException("gone");
	} catch (IOException &ex) {
		REQUIRE(ex.type == ExceptionType::NOT_FOUND);
	}
}

TEST_CASE("ErrorData preserves the exception type", "[exception]") {
	ErrorData empty;
	REQUIRE(!empty.HasError());

	ErrorData error(NotFoundException("missing \"%s\"", "/a"));
	REQUIRE(error.HasError());
	REQUIRE(error.Type() == ExceptionType::NOT_FOUND);
	REQUIRE(error.RawMessage() == "missing \"/a\"");
	REQUIRE(error.Message() == "Not Found Error: missing \"/a\"");
	REQUIRE_THROWS_AS(error.Throw(), NotFoundException);
	try {
		error.Throw("while opening: ");
		FAIL("expected an exception");
	} catch (NotFoundException &ex) {
		REQUIRE(ex.RawMessage() == "while opening: missing \"/a\"");
	}

	ErrorData seek(OutOfRangeException("beyond the end"));
	REQUIRE_THROWS_AS(seek.Throw(), OutOfRangeException);
	ErrorData config(InvalidConfigurationException("bad"));
	REQUIRE_THROWS_AS(config.Throw(), InvalidConfigurationException);

	// exceptions from outside the library are captured with an invalid type
	ErrorData foreign(std::runtime_error("boom"));
	REQUIRE(foreign.Type() == ExceptionType::INVALID);
	REQUIRE(foreign.RawMessage() == "boom");

	REQUIRE(ErrorData(IOException("x")) == ErrorData(ExceptionType::IO, "x"));
	REQUIRE(!(ErrorData(IOException("x")) == ErrorData(ExceptionType::NOT_FOUND, "x")));
}
