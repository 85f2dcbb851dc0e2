//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/assert.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

namespace remotefs {

void RemoteFSAssertInternal(bool condition, const char *condition_name, const char *file, int linenr);

} // namespace remotefs

#if defined(DEBUG) && !defined(DISABLE_ASSERTIONS)
#define D_ASSERT(condition) remotefs::RemoteFSAssertInternal(bool(condition), #condition, __FILE__, __LINE__)
#else
#define D_ASSERT(condition)
#endif
