#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Setters for kj::MainBuilder options. The numeric ones reject values that
// do not parse completely.
std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);
std::function<bool(kj::StringPtr)> setUint(uint32_t& var);
std::function<bool(kj::StringPtr)> setUint64(uint64_t& var);
std::function<bool(kj::StringPtr)> setDouble(double& var);
std::function<bool(kj::StringPtr)> appendString(std::vector<std::string>& var);

// Returns a copy of data where every invalid UTF-8 sequence is replaced by
// U+FFFD.
std::string ToValidUtf8(const std::string& data);

// Returns s converted to lowercase (ASCII only).
std::string ToLower(std::string s);

}  // namespace util
#endif
