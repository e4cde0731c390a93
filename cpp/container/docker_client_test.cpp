#include "container/docker_client.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include "gtest/gtest.h"

namespace {

using container::DockerClient;

std::string Frame(char stream, const std::string& payload) {
  std::string frame(8, '\0');
  frame[0] = stream;
  frame[4] = static_cast<char>((payload.size() >> 24) & 0xff);
  frame[5] = static_cast<char>((payload.size() >> 16) & 0xff);
  frame[6] = static_cast<char>((payload.size() >> 8) & 0xff);
  frame[7] = static_cast<char>(payload.size() & 0xff);
  return frame + payload;
}

capnp::JsonValue::Reader Field(capnp::JsonValue::Reader object,
                               kj::StringPtr name) {
  for (auto field : object.getObject()) {
    if (field.getName() == name) return field.getValue();
  }
  ADD_FAILURE() << "missing field " << name.cStr();
  return object;
}

// NOLINTNEXTLINE
TEST(DockerClient, DemuxLogs) {
  std::string raw = Frame(1, "out1\n") + Frame(2, "err\n") + Frame(1, "out2");
  container::ContainerLogs logs = DockerClient::DemuxLogs(raw);
  EXPECT_EQ(logs.stdout_text, "out1\nout2");
  EXPECT_EQ(logs.stderr_text, "err\n");
}

// NOLINTNEXTLINE
TEST(DockerClient, DemuxLogsLargeFrame) {
  std::string big(70000, 'x');
  container::ContainerLogs logs = DockerClient::DemuxLogs(Frame(1, big));
  EXPECT_EQ(logs.stdout_text, big);
  EXPECT_EQ(logs.stderr_text, "");
}

// NOLINTNEXTLINE
TEST(DockerClient, DemuxLogsTruncatedFrame) {
  std::string raw = Frame(2, "complete") + Frame(1, "partial").substr(0, 11);
  container::ContainerLogs logs = DockerClient::DemuxLogs(raw);
  EXPECT_EQ(logs.stderr_text, "complete");
  EXPECT_EQ(logs.stdout_text, "par");
}

// NOLINTNEXTLINE
TEST(DockerClient, DemuxLogsNotMultiplexed) {
  container::ContainerLogs logs = DockerClient::DemuxLogs("plain text output");
  EXPECT_EQ(logs.stdout_text, "plain text output");
  EXPECT_EQ(logs.stderr_text, "");
  EXPECT_EQ(DockerClient::DemuxLogs("").stdout_text, "");
}

// NOLINTNEXTLINE
TEST(DockerClient, SplitImage) {
  using Pair = std::pair<std::string, std::string>;
  EXPECT_EQ(DockerClient::SplitImage("python:3.12-slim"),
            Pair("python", "3.12-slim"));
  EXPECT_EQ(DockerClient::SplitImage("alpine"), Pair("alpine", "latest"));
  EXPECT_EQ(DockerClient::SplitImage("localhost:5000/tools"),
            Pair("localhost:5000/tools", "latest"));
  EXPECT_EQ(DockerClient::SplitImage("localhost:5000/tools:1"),
            Pair("localhost:5000/tools", "1"));
  EXPECT_EQ(DockerClient::SplitImage("alpine@sha256:abc"),
            Pair("alpine@sha256:abc", ""));
}

// NOLINTNEXTLINE
TEST(DockerClient, CreateBody) {
  container::ContainerSpec spec;
  spec.name = "codebox-exec-1";
  spec.image = "python:3.12-slim";
  spec.cmd = {"python3", "-c", "print(\"hi\")"};
  spec.env = {"A=1"};
  spec.working_dir = "/workspace";
  spec.network_disabled = true;
  spec.network_mode = "none";
  spec.memory_bytes = 512LL * 1024 * 1024;
  spec.nano_cpus = 1500000000;
  spec.binds = {"/data:/data:ro"};

  std::string body = DockerClient::CreateBody(spec);
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  codec.decodeRaw(kj::ArrayPtr<const char>(body.data(), body.size()), root);
  auto json = root.asReader();

  EXPECT_STREQ(Field(json, "Image").getString().cStr(), "python:3.12-slim");
  auto cmd = Field(json, "Cmd").getArray();
  ASSERT_EQ(cmd.size(), 3);
  EXPECT_STREQ(cmd[2].getString().cStr(), "print(\"hi\")");
  EXPECT_STREQ(Field(json, "Env").getArray()[0].getString().cStr(), "A=1");
  EXPECT_STREQ(Field(json, "WorkingDir").getString().cStr(), "/workspace");
  EXPECT_TRUE(Field(json, "NetworkDisabled").getBoolean());
  EXPECT_FALSE(Field(json, "Tty").getBoolean());

  auto host_config = Field(json, "HostConfig");
  EXPECT_STREQ(Field(host_config, "NetworkMode").getString().cStr(), "none");
  EXPECT_EQ(Field(host_config, "Memory").getNumber(), 536870912.0);
  EXPECT_EQ(Field(host_config, "NanoCpus").getNumber(), 1500000000.0);
  EXPECT_STREQ(Field(host_config, "Binds").getArray()[0].getString().cStr(),
            "/data:/data:ro");
}

}  // namespace
