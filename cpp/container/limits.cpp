#include "container/limits.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include "executor/errors.hpp"
#include "util/misc.hpp"

namespace container {

int64_t ParseMemoryLimit(const std::string& limit) {
  std::string value = util::ToLower(limit);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    value.pop_back();
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value[0])))
    value.erase(0, 1);

  int64_t multiplier = 1;
  if (!value.empty() && value.back() == 'b' && value.size() > 1 &&
      !std::isdigit(static_cast<unsigned char>(value[value.size() - 2]))) {
    value.pop_back();
  }
  if (!value.empty()) {
    switch (value.back()) {
      case 'k':
        multiplier = 1024LL;
        break;
      case 'm':
        multiplier = 1024LL * 1024;
        break;
      case 'g':
        multiplier = 1024LL * 1024 * 1024;
        break;
      default:
        break;
    }
    if (multiplier != 1) value.pop_back();
  }

  if (value.empty()) {
    throw executor::configuration_error("Invalid memory limit: \"" + limit +
                                        "\"");
  }
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw executor::configuration_error("Invalid memory limit: \"" + limit +
                                          "\"");
    }
  }
  if (value.size() > 18) {
    throw executor::configuration_error("Memory limit too large: " + limit);
  }
  int64_t amount = std::stoll(value);
  if (amount <= 0) {
    throw executor::configuration_error("Memory limit must be positive: " +
                                        limit);
  }
  if (amount > std::numeric_limits<int64_t>::max() / multiplier) {
    throw executor::configuration_error("Memory limit too large: " + limit);
  }
  return amount * multiplier;
}

int64_t CpuToNanoCpus(double cores) {
  if (!(cores > 0) || std::isinf(cores)) {
    throw executor::configuration_error("CPU limit must be positive");
  }
  return static_cast<int64_t>(std::llround(cores * 1e9));
}

}  // namespace container
