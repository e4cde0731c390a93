#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::execution_env = "sandbox";
std::string Flags::root;
int32_t Flags::timeout_secs = 30;
uint32_t Flags::max_output_bytes = 1024 * 1024;

std::string Flags::docker_socket = "/var/run/docker.sock";
std::string Flags::image = "python:3.12-slim";
std::string Flags::network = "none";
std::string Flags::memory_limit = "512m";
double Flags::cpu_limit = 1.0;

uint32_t Flags::wasm_max_memory_pages = 256;
uint64_t Flags::wasm_fuel_limit = 1000000000;

std::vector<std::string> Flags::env;
std::vector<std::string> Flags::args;
std::string Flags::stdin_file;
std::string Flags::working_dir;
bool Flags::json = false;
