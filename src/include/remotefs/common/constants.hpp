//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/constants.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <functional>

namespace remotefs {

using std::string;
using std::vector;
using std::unique_ptr;
using std::shared_ptr;
using std::unordered_map;
using std::unordered_set;
using std::pair;
using std::mutex;
using std::lock_guard;
using std::unique_lock;


//! a saner size_t for loop indices etc
typedef uint64_t idx_t;

//! data pointers
typedef uint8_t data_t;
typedef data_t *data_ptr_t;
typedef const data_t *const_data_ptr_t;

struct DConstants {
	//! The value used to signify an invalid index entry
	static constexpr const idx_t INVALID_INDEX = idx_t(-1);
};

//! Default size of the chunks requested from a remote file when scanning it sequentially
static constexpr const idx_t DEFAULT_READ_BUFFER_SIZE = 4096;

//! The extension that marks a remote file as structured (JSON) content
static constexpr const char *DEFAULT_JSON_EXTENSION = ".json";

} // namespace remotefs
