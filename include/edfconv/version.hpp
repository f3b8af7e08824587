#pragma once

#include <string>

namespace edfconv {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines EDFCONV_VERSION_STRING for all targets that link against the
// edfconv library.
#ifndef EDFCONV_VERSION_STRING
  #define EDFCONV_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return EDFCONV_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

} // namespace edfconv
