#include "remotefs/reader/json_stream_decoder.hpp"

namespace remotefs {

JSONStreamDecoder::JSONStreamDecoder(RemoteFileHandle &handle, idx_t buffer_size)
    : reader(handle, buffer_size), parser(reader) {
}

} // namespace remotefs
