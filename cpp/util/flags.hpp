#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>
#include <vector>

struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Backend selection and common limits
  static std::string execution_env;
  static std::string root;
  static int32_t timeout_secs;
  static uint32_t max_output_bytes;

  // Container backend
  static std::string docker_socket;
  static std::string image;
  static std::string network;
  static std::string memory_limit;
  static double cpu_limit;

  // WebAssembly backend
  static uint32_t wasm_max_memory_pages;
  static uint64_t wasm_fuel_limit;

  // Per-request options of the run subcommand
  static std::vector<std::string> env;
  static std::vector<std::string> args;
  static std::string stdin_file;
  static std::string working_dir;
  static bool json;
};

#endif
