//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/reader/sequential_reader.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/enums/format_token.hpp"
#include "remotefs/reader/scan_target.hpp"

namespace remotefs {

//! Iterates over the records of a remote file. Next() reports whether another record is available and never
//! throws: a failure while looking ahead is reported by the following Scan. Scan decodes the current record into the
//! given target and throws an IOException once the reader is exhausted. A reader cannot be rewound.
class SequentialReader {
public:
	explicit SequentialReader(FormatToken format) : format(format) {
	}
	virtual ~SequentialReader() {
	}

	virtual bool Next() = 0;
	virtual void ScanInto(const ScanTarget &target) = 0;

	template <class T>
	void Scan(T &target) {
		ScanInto(ScanTarget::Bind(target));
	}

	//! The format the reader was opened with
	FormatToken GetFormat() const {
		return format;
	}

public:
	template <class TARGET>
	TARGET &Cast() {
		return reinterpret_cast<TARGET &>(*this);
	}

private:
	const FormatToken format;
};

} // namespace remotefs
