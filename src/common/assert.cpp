#include "remotefs/common/assert.hpp"
#include "remotefs/common/exception.hpp"

namespace remotefs {

void RemoteFSAssertInternal(bool condition, const char *condition_name, const char *file, int linenr) {
	if (condition) {
		return;
	}
	throw InternalException("Assertion triggered in file \"%s\" on line %d: %s", file, linenr, condition_name);
}

} // namespace remotefs
