#include "remotefs/reader/buffered_handle_reader.hpp"
#include "remotefs/common/exception.hpp"
#include "remotefs/common/helper.hpp"
#include "remotefs/remote/remote_file_handle.hpp"

namespace remotefs {

BufferedHandleReader::BufferedHandleReader(RemoteFileHandle &handle, idx_t buffer_size)
    : handle(handle), buffer_size(buffer_size), buffer_count(0), buffer_offset(0), position(0), end_of_file(false) {
	if (buffer_size == 0) {
		throw InvalidInputException("The read buffer size must be larger than 0");
	}
	buffer = make_uniq_array<data_t>(buffer_size);
}

bool BufferedHandleReader::Refill() {
	if (end_of_file) {
		return false;
	}
	auto bytes_read = handle.Read(buffer.get(), buffer_size);
	buffer_offset = 0;
	buffer_count = UnsafeNumericCast<idx_t>(bytes_read);
	if (buffer_count == 0) {
		end_of_file = true;
		return false;
	}
	return true;
}

char BufferedHandleReader::Peek() {
	if (buffer_offset >= buffer_count && !Refill()) {
		return '\0';
	}
	return char(buffer[buffer_offset]);
}

char BufferedHandleReader::Get() {
	if (buffer_offset >= buffer_count && !Refill()) {
		return '\0';
	}
	position++;
	return char(buffer[buffer_offset++]);
}

bool BufferedHandleReader::Finished() {
	if (buffer_offset < buffer_count) {
		return false;
	}
	return !Refill();
}

bool BufferedHandleReader::ReadLine(string &result) {
	if (Finished()) {
		return false;
	}
	result.clear();
	while (true) {
		auto start = buffer_offset;
		while (buffer_offset < buffer_count && buffer[buffer_offset] != '\n') {
			buffer_offset++;
		}
		result.append(char_ptr_cast<char>(buffer.get() + start), buffer_offset - start);
		position += buffer_offset - start;
		if (buffer_offset < buffer_count) {
			// consume the newline
			buffer_offset++;
			position++;
			break;
		}
		if (!Refill()) {
			break;
		}
	}
	if (!result.empty() && result.back() == '\r') {
		result.pop_back();
	}
	return true;
}

void BufferedHandleReader::Reset() {
	handle.Reset();
	buffer_count = 0;
	buffer_offset = 0;
	position = 0;
	end_of_file = false;
}

const string &BufferedHandleReader::GetPath() const {
	return handle.GetPath();
}

} // namespace remotefs
