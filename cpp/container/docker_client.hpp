#ifndef CONTAINER_DOCKER_CLIENT_HPP
#define CONTAINER_DOCKER_CLIENT_HPP

#include <capnp/compat/json.h>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <string>
#include <vector>
#include "container/container_runtime.hpp"

namespace container {

// ContainerRuntime over the Docker Engine HTTP API, spoken through the
// daemon's Unix socket.
class DockerClient : public ContainerRuntime {
 public:
  static kj::Promise<kj::Own<DockerClient>> Connect(
      kj::Network& network, kj::Timer& timer, const std::string& socket_path);

  DockerClient(kj::Own<kj::NetworkAddress> address, kj::Timer& timer);

  kj::Promise<void> Ping() override;
  kj::Promise<bool> HasImage(const std::string& image) override;
  kj::Promise<void> PullImage(const std::string& image) override;
  kj::Promise<std::string> CreateContainer(const ContainerSpec& spec) override;
  kj::Promise<void> StartContainer(const std::string& id) override;
  kj::Promise<int64_t> WaitContainer(const std::string& id) override;
  kj::Promise<ContainerLogs> FetchLogs(const std::string& id) override;
  kj::Promise<void> RemoveContainer(const std::string& id) override;
  kj::Promise<std::vector<std::string>> ListContainers(
      const std::string& name_prefix) override;

  // Splits the multiplexed log stream of a container without a TTY. Each
  // frame is a 8 byte header (stream, 0, 0, 0, big endian size) followed by
  // the payload. Input that does not look multiplexed is returned as stdout.
  static ContainerLogs DemuxLogs(const std::string& raw);

  // Body of the create request.
  static std::string CreateBody(const ContainerSpec& spec);

  // Splits an image reference into repository and tag, defaulting the tag
  // to latest.
  static std::pair<std::string, std::string> SplitImage(
      const std::string& image);

  KJ_DISALLOW_COPY(DockerClient);

 private:
  struct Reply {
    unsigned int status;
    std::string body;
  };

  // Sends a request and reads the whole response.
  kj::Promise<Reply> Call(kj::HttpMethod method, const std::string& path,
                          const std::string& body = "");

  // As Call, but fails on error statuses other than the accepted one.
  kj::Promise<Reply> Expect(kj::HttpMethod method, const std::string& path,
                            const std::string& what,
                            const std::string& body = "",
                            unsigned int accepted = 0);

  kj::Own<kj::HttpHeaderTable> header_table_;
  kj::Own<kj::NetworkAddress> address_;
  kj::Own<kj::HttpClient> client_;
};

}  // namespace container

#endif
