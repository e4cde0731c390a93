#include "util/misc.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace util {

namespace {
const constexpr char* kReplacementChar = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at data[pos], or 0.
size_t Utf8SequenceLength(const std::string& data, size_t pos) {
  auto byte = [&data](size_t i) { return static_cast<unsigned char>(data[i]); };
  unsigned char lead = byte(pos);
  if (lead < 0x80) return 1;
  size_t len = 0;
  uint32_t min_codepoint = 0;
  uint32_t codepoint = 0;
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    min_codepoint = 0x80;
    codepoint = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    min_codepoint = 0x800;
    codepoint = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    min_codepoint = 0x10000;
    codepoint = lead & 0x07;
  } else {
    return 0;
  }
  if (pos + len > data.size()) return 0;
  for (size_t i = 1; i < len; i++) {
    if ((byte(pos + i) & 0xC0) != 0x80) return 0;
    codepoint = (codepoint << 6) | (byte(pos + i) & 0x3F);
  }
  if (codepoint < min_codepoint || codepoint > 0x10FFFF) return 0;
  if (codepoint >= 0xD800 && codepoint <= 0xDFFF) return 0;
  return len;
}
}  // namespace

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
}

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    char* end = nullptr;
    long value = std::strtol(p.cStr(), &end, 10);
    if (p.size() == 0 || *end != '\0') return false;
    if (value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
      return false;
    }
    var = static_cast<int>(value);
    return true;
  };
}

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    char* end = nullptr;
    if (p.size() == 0 || p[0] == '-') return false;
    unsigned long long value = std::strtoull(p.cStr(), &end, 10);
    if (*end != '\0' || value > std::numeric_limits<uint32_t>::max()) {
      return false;
    }
    var = static_cast<uint32_t>(value);
    return true;
  };
}

std::function<bool(kj::StringPtr)> setUint64(uint64_t& var) {
  return [&var](kj::StringPtr p) {
    char* end = nullptr;
    if (p.size() == 0 || p[0] == '-') return false;
    unsigned long long value = std::strtoull(p.cStr(), &end, 10);
    if (*end != '\0') return false;
    var = value;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setDouble(double& var) {
  return [&var](kj::StringPtr p) {
    char* end = nullptr;
    double value = std::strtod(p.cStr(), &end);
    if (p.size() == 0 || *end != '\0') return false;
    var = value;
    return true;
  };
}

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>& var) {
  return [&var](kj::StringPtr p) {
    var.emplace_back(p.cStr());
    return true;
  };
}

std::string ToValidUtf8(const std::string& data) {
  std::string out;
  out.reserve(data.size());
  size_t pos = 0;
  while (pos < data.size()) {
    size_t len = Utf8SequenceLength(data, pos);
    if (len == 0) {
      out += kReplacementChar;
      pos++;
      continue;
    }
    out.append(data, pos, len);
    pos += len;
  }
  return out;
}

std::string ToLower(std::string s) {
  for (char& c : s) c = std::tolower(static_cast<unsigned char>(c));
  return s;
}

}  // namespace util
