//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/exception.hpp"
#include "remotefs/common/error_data.hpp"
#include "remotefs/common/json/json_deserializer.hpp"
#include "remotefs/logging/log_manager.hpp"
#include "remotefs/main/config.hpp"
#include "remotefs/reader/format_reader_factory.hpp"
#include "remotefs/reader/json_array_reader.hpp"
#include "remotefs/reader/json_object_reader.hpp"
#include "remotefs/reader/line_reader.hpp"
#include "remotefs/remote/instrumentation.hpp"
#include "remotefs/remote/remote_file_handle.hpp"
#include "remotefs/remote/remote_file_system.hpp"
#include "remotefs/transfer/local_transfer_session.hpp"
