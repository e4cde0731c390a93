#ifndef CONTAINER_LIMITS_HPP
#define CONTAINER_LIMITS_HPP

#include <cstdint>
#include <string>

namespace container {

// Parses a human readable memory size into bytes: "512m", "1g", "1024k" or a
// bare number of bytes. Suffixes k, m, g (optionally followed by b) are
// powers of 1024 and are case insensitive. Throws configuration_error for
// malformed or non-positive values.
int64_t ParseMemoryLimit(const std::string& limit);

// Converts a fractional number of cores into the runtime's NanoCpus.
// Throws configuration_error for non-positive values.
int64_t CpuToNanoCpus(double cores);

}  // namespace container

#endif
