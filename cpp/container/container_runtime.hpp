#ifndef CONTAINER_CONTAINER_RUNTIME_HPP
#define CONTAINER_CONTAINER_RUNTIME_HPP

#include <kj/async.h>
#include <cstdint>
#include <string>
#include <vector>

namespace container {

// Everything needed to create one container.
struct ContainerSpec {
  std::string name;
  std::string image;
  std::vector<std::string> cmd;
  // As KEY=VALUE.
  std::vector<std::string> env;
  std::string working_dir;
  bool network_disabled = true;
  std::string network_mode = "none";
  int64_t memory_bytes = 0;
  int64_t nano_cpus = 0;
  // As host:container[:ro].
  std::vector<std::string> binds;
};

struct ContainerLogs {
  std::string stdout_text;
  std::string stderr_text;
};

// The subset of a container engine's API used by ContainerExecutor. Failures
// reject the returned promises.
class ContainerRuntime {
 public:
  virtual kj::Promise<void> Ping() = 0;
  virtual kj::Promise<bool> HasImage(const std::string& image) = 0;
  virtual kj::Promise<void> PullImage(const std::string& image) = 0;

  // Returns the id of the new container.
  virtual kj::Promise<std::string> CreateContainer(
      const ContainerSpec& spec) = 0;
  virtual kj::Promise<void> StartContainer(const std::string& id) = 0;

  // Resolves to the exit status once the container stops.
  virtual kj::Promise<int64_t> WaitContainer(const std::string& id) = 0;
  virtual kj::Promise<ContainerLogs> FetchLogs(const std::string& id) = 0;

  // Removes the container, killing it if it is still running.
  virtual kj::Promise<void> RemoveContainer(const std::string& id) = 0;

  // Names of all containers, running or not, whose name starts with prefix.
  virtual kj::Promise<std::vector<std::string>> ListContainers(
      const std::string& name_prefix) = 0;

  virtual ~ContainerRuntime() = default;
};

}  // namespace container

#endif
