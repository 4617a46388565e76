#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * splitlines(s) behaves just like s.splitlines() in python, except that only '\n' is treated as a
 * line break. A trailing '\r' is left on the line; use rstrip() to drop it.
 */
std::vector<std::string> splitlines(const std::string& s);

// Removes trailing whitespace (including '\r')
std::string rstrip(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
