#include "remotefs/reader/line_reader.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

LineReader::LineReader(unique_ptr<BufferedHandleReader> reader_p)
    : SequentialReader(FormatToken::TEXT), reader(std::move(reader_p)), line_ready(false), finished(false) {
}

bool LineReader::Next() {
	if (line_ready) {
		return true;
	}
	if (finished) {
		return false;
	}
	try {
		if (reader->ReadLine(current_line)) {
			line_ready = true;
			return true;
		}
		finished = true;
		return false;
	} catch (std::exception &ex) {
		// reported by the next Scan
		lookahead_error = std::current_exception();
		line_ready = true;
		return true;
	}
}

void LineReader::ScanInto(const ScanTarget &target) {
	if (target.GetType() != ScanTargetType::TEXT) {
		throw InvalidInputException("Cannot scan a line of \"%s\" into a %s target: lines can only be scanned into a "
		                            "string",
		                            reader->GetPath(), ScanTargetTypeToString(target.GetType()));
	}
	if (!Next()) {
		throw IOException("Cannot scan \"%s\": end of file reached", reader->GetPath());
	}
	line_ready = false;
	if (lookahead_error) {
		finished = true;
		auto error = lookahead_error;
		lookahead_error = nullptr;
		std::rethrow_exception(error);
	}
	target.GetText() = std::move(current_line);
	current_line.clear();
}

} // namespace remotefs
