//===----------------------------------------------------------------------===//
//                         RemoteFS
//
// remotefs/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "remotefs/common/constants.hpp"

#include <string.h>

namespace remotefs {

template <class T, class... ARGS>
unique_ptr<T> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<T>(new T(std::forward<ARGS>(args)...));
}

template <class T, class... ARGS>
shared_ptr<T> make_shared_ptr(ARGS &&...args) { // NOLINT: mimic std style
	return std::make_shared<T>(std::forward<ARGS>(args)...);
}

template <class T>
unique_ptr<T[]> make_uniq_array(size_t n) { // NOLINT: mimic std style
	return unique_ptr<T[]>(new T[n]);
}

template <class S, class T>
S *char_ptr_cast(T *src) { // NOLINT: mimic std style
	return reinterpret_cast<S *>(src);
}

template <class T>
data_ptr_t data_ptr_cast(T *src) { // NOLINT: mimic std style
	return reinterpret_cast<data_ptr_t>(src);
}

template <class T>
const_data_ptr_t const_data_ptr_cast(const T *src) { // NOLINT: mimic std style
	return reinterpret_cast<const_data_ptr_t>(src);
}

template <typename T>
T MaxValue(T a, T b) {
	return a > b ? a : b;
}

template <typename T>
T MinValue(T a, T b) {
	return a < b ? a : b;
}

template <class T, class SRC>
T UnsafeNumericCast(SRC val) {
	return static_cast<T>(val);
}

} // namespace remotefs
