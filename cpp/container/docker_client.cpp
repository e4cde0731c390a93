#include "container/docker_client.hpp"

#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/encoding.h>
#include <sstream>

namespace container {

namespace {

using capnp::JsonValue;

static const constexpr size_t kFrameHeaderSize = 8;

// Fills a JSON object field by field.
class JsonObject {
 public:
  JsonObject(JsonValue::Builder value, unsigned int size)
      : fields_(value.initObject(size)) {}

  JsonValue::Builder Add(const char* name) {
    KJ_REQUIRE(next_ < fields_.size(), name, "Too many fields");
    auto field = fields_[next_++];
    field.setName(name);
    return field.initValue();
  }

 private:
  capnp::List<JsonValue::Field>::Builder fields_;
  unsigned int next_ = 0;
};

capnp::Text::Reader AsText(const std::string& s) {
  return capnp::Text::Reader(s.data(), s.size());
}

void SetStrings(JsonValue::Builder value,
                const std::vector<std::string>& strings) {
  auto list = value.initArray(strings.size());
  for (size_t i = 0; i < strings.size(); i++) {
    list[i].setString(AsText(strings[i]));
  }
}

std::string Encode(JsonValue::Reader value) {
  capnp::JsonCodec codec;
  return codec.encodeRaw(value).cStr();
}

JsonValue::Reader Decode(const std::string& text,
                         capnp::MallocMessageBuilder* message) {
  capnp::JsonCodec codec;
  auto root = message->initRoot<JsonValue>();
  codec.decodeRaw(kj::ArrayPtr<const char>(text.data(), text.size()), root);
  return root.asReader();
}

kj::Maybe<JsonValue::Reader> GetField(JsonValue::Reader object,
                                      kj::StringPtr name) {
  if (object.which() != JsonValue::OBJECT) return nullptr;
  for (auto field : object.getObject()) {
    if (field.getName() == name) return field.getValue();
  }
  return nullptr;
}

std::string StringField(JsonValue::Reader object, kj::StringPtr name) {
  KJ_IF_MAYBE(value, GetField(object, name)) {
    if (value->which() == JsonValue::STRING) return value->getString().cStr();
  }
  return "";
}

std::string UriComponent(const std::string& s) {
  return kj::encodeUriComponent(kj::ArrayPtr<const char>(s.data(), s.size()))
      .cStr();
}

// The "message" field of an error body, or the body itself if it is not
// JSON.
std::string ApiMessage(const std::string& body) {
  std::string message;
  auto error = kj::runCatchingExceptions([&]() {
    capnp::MallocMessageBuilder builder;
    message = StringField(Decode(body, &builder), "message");
  });
  if (error != nullptr || message.empty()) message = body;
  while (!message.empty() && message.back() == '\n') message.pop_back();
  return message;
}

bool LooksMultiplexed(const std::string& raw) {
  if (raw.size() < kFrameHeaderSize) return false;
  return static_cast<unsigned char>(raw[0]) <= 2 && raw[1] == 0 &&
         raw[2] == 0 && raw[3] == 0;
}

}  // namespace

kj::Promise<kj::Own<DockerClient>> DockerClient::Connect(
    kj::Network& network, kj::Timer& timer, const std::string& socket_path) {
  return network.parseAddress(kj::str("unix:", socket_path.c_str()))
      .then([&timer](kj::Own<kj::NetworkAddress>&& address) {
        return kj::heap<DockerClient>(kj::mv(address), timer);
      });
}

DockerClient::DockerClient(kj::Own<kj::NetworkAddress> address,
                           kj::Timer& timer)
    : header_table_(kj::heap<kj::HttpHeaderTable>()),
      address_(kj::mv(address)),
      client_(kj::newHttpClient(timer, *header_table_, *address_)) {}

kj::Promise<DockerClient::Reply> DockerClient::Call(kj::HttpMethod method,
                                                    const std::string& path,
                                                    const std::string& body) {
  kj::HttpHeaders headers(*header_table_);
  headers.set(kj::HttpHeaderId::HOST, "docker");
  if (!body.empty()) {
    headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
  }
  auto request = client_->request(method, kj::StringPtr(path.c_str()),
                                  headers, static_cast<uint64_t>(body.size()));

  kj::Promise<void> sent = kj::READY_NOW;
  if (!body.empty()) {
    kj::String content = kj::heapString(body.data(), body.size());
    kj::AsyncOutputStream* stream = request.body.get();
    sent = stream->write(content.begin(), content.size())
               .attach(kj::mv(content));
  }
  return kj::mv(sent)
      .attach(kj::mv(request.body))
      .then([response = kj::mv(request.response)]() mutable {
        return kj::mv(response);
      })
      .then([](kj::HttpClient::Response&& response) {
        unsigned int status = response.statusCode;
        kj::AsyncInputStream* stream = response.body.get();
        return stream->readAllBytes()
            .attach(kj::mv(response.body))
            .then([status](kj::Array<kj::byte>&& bytes) {
              return Reply{status, std::string(bytes.begin(), bytes.end())};
            });
      });
}

kj::Promise<DockerClient::Reply> DockerClient::Expect(
    kj::HttpMethod method, const std::string& path, const std::string& what,
    const std::string& body, unsigned int accepted) {
  return Call(method, path, body).then([what, accepted](Reply&& reply) {
    if (reply.status >= 400 && reply.status != accepted) {
      kj::throwFatalException(
          KJ_EXCEPTION(FAILED, "Docker ", what.c_str(), " failed with status ",
                       reply.status, ": ", ApiMessage(reply.body).c_str()));
    }
    return kj::mv(reply);
  });
}

kj::Promise<void> DockerClient::Ping() {
  return Expect(kj::HttpMethod::GET, "/_ping", "ping").ignoreResult();
}

kj::Promise<bool> DockerClient::HasImage(const std::string& image) {
  return Expect(kj::HttpMethod::GET, "/images/" + image + "/json",
                "inspect of " + image, "", 404)
      .then([](Reply&& reply) { return reply.status != 404; });
}

kj::Promise<void> DockerClient::PullImage(const std::string& image) {
  auto repo_tag = SplitImage(image);
  std::string path = "/images/create?fromImage=" + UriComponent(repo_tag.first);
  if (!repo_tag.second.empty()) path += "&tag=" + UriComponent(repo_tag.second);
  KJ_LOG(INFO, "Pulling image", image);
  return Expect(kj::HttpMethod::POST, path, "pull of " + image)
      .then([image](Reply&& reply) {
        // Progress is streamed as JSON lines; failures can arrive after the
        // 200 status.
        std::istringstream lines(reply.body);
        std::string line;
        while (std::getline(lines, line)) {
          if (line.find_first_not_of(" \r\t") == std::string::npos) continue;
          capnp::MallocMessageBuilder message;
          std::string error = StringField(Decode(line, &message), "error");
          if (!error.empty()) {
            kj::throwFatalException(KJ_EXCEPTION(FAILED, "Cannot pull ",
                                                 image.c_str(), ": ",
                                                 error.c_str()));
          }
        }
      });
}

kj::Promise<std::string> DockerClient::CreateContainer(
    const ContainerSpec& spec) {
  return Expect(kj::HttpMethod::POST,
                "/containers/create?name=" + UriComponent(spec.name),
                "create of " + spec.name, CreateBody(spec))
      .then([](Reply&& reply) {
        capnp::MallocMessageBuilder message;
        std::string id = StringField(Decode(reply.body, &message), "Id");
        KJ_REQUIRE(!id.empty(), "Docker returned no container id",
                   reply.body.c_str());
        return id;
      });
}

kj::Promise<void> DockerClient::StartContainer(const std::string& id) {
  return Expect(kj::HttpMethod::POST, "/containers/" + id + "/start",
                "start of " + id)
      .ignoreResult();
}

kj::Promise<int64_t> DockerClient::WaitContainer(const std::string& id) {
  return Expect(kj::HttpMethod::POST,
                "/containers/" + id + "/wait?condition=not-running",
                "wait of " + id)
      .then([id](Reply&& reply) -> int64_t {
        capnp::MallocMessageBuilder message;
        auto body = Decode(reply.body, &message);
        KJ_IF_MAYBE(error, GetField(body, "Error")) {
          std::string text = StringField(*error, "Message");
          if (!text.empty()) KJ_LOG(WARNING, "Wait reported", id, text);
        }
        KJ_IF_MAYBE(code, GetField(body, "StatusCode")) {
          if (code->which() == JsonValue::NUMBER) {
            return static_cast<int64_t>(code->getNumber());
          }
        }
        KJ_FAIL_REQUIRE("Docker returned no status code", reply.body.c_str());
      });
}

kj::Promise<ContainerLogs> DockerClient::FetchLogs(const std::string& id) {
  return Expect(kj::HttpMethod::GET,
                "/containers/" + id + "/logs?stdout=1&stderr=1",
                "log fetch of " + id)
      .then([](Reply&& reply) { return DemuxLogs(reply.body); });
}

kj::Promise<void> DockerClient::RemoveContainer(const std::string& id) {
  return Expect(kj::HttpMethod::DELETE, "/containers/" + id + "?force=1&v=1",
                "removal of " + id, "", 404)
      .ignoreResult();
}

kj::Promise<std::vector<std::string>> DockerClient::ListContainers(
    const std::string& name_prefix) {
  capnp::MallocMessageBuilder message;
  JsonObject filters(message.initRoot<JsonValue>(), 1);
  SetStrings(filters.Add("name"), {name_prefix});
  std::string query =
      UriComponent(Encode(message.getRoot<JsonValue>().asReader()));
  return Expect(kj::HttpMethod::GET, "/containers/json?all=1&filters=" + query,
                "container listing")
      .then([name_prefix](Reply&& reply) {
        capnp::MallocMessageBuilder message;
        auto body = Decode(reply.body, &message);
        std::vector<std::string> names;
        if (body.which() != JsonValue::ARRAY) return names;
        for (auto container : body.getArray()) {
          KJ_IF_MAYBE(list, GetField(container, "Names")) {
            if (list->which() != JsonValue::ARRAY) continue;
            for (auto name : list->getArray()) {
              if (name.which() != JsonValue::STRING) continue;
              std::string text = name.getString().cStr();
              if (!text.empty() && text[0] == '/') text = text.substr(1);
              // The daemon filters by substring.
              if (text.compare(0, name_prefix.size(), name_prefix) == 0) {
                names.push_back(text);
              }
            }
          }
        }
        return names;
      });
}

ContainerLogs DockerClient::DemuxLogs(const std::string& raw) {
  ContainerLogs logs;
  if (!LooksMultiplexed(raw)) {
    logs.stdout_text = raw;
    return logs;
  }
  size_t pos = 0;
  while (pos + kFrameHeaderSize <= raw.size()) {
    auto header = reinterpret_cast<const unsigned char*>(raw.data() + pos);
    if (header[0] > 2 || header[1] || header[2] || header[3]) {
      KJ_LOG(WARNING, "Malformed log frame, dropping the rest", pos);
      break;
    }
    size_t size = (static_cast<size_t>(header[4]) << 24) |
                  (static_cast<size_t>(header[5]) << 16) |
                  (static_cast<size_t>(header[6]) << 8) |
                  static_cast<size_t>(header[7]);
    std::string payload = raw.substr(pos + kFrameHeaderSize, size);
    if (header[0] == 2) {
      logs.stderr_text += payload;
    } else {
      logs.stdout_text += payload;
    }
    pos += kFrameHeaderSize + size;
  }
  return logs;
}

std::string DockerClient::CreateBody(const ContainerSpec& spec) {
  capnp::MallocMessageBuilder message;
  JsonValue::Builder root = message.initRoot<JsonValue>();
  JsonObject body(root, 10);
  body.Add("Image").setString(AsText(spec.image));
  SetStrings(body.Add("Cmd"), spec.cmd);
  SetStrings(body.Add("Env"), spec.env);
  body.Add("WorkingDir").setString(AsText(spec.working_dir));
  body.Add("NetworkDisabled").setBoolean(spec.network_disabled);
  body.Add("AttachStdout").setBoolean(true);
  body.Add("AttachStderr").setBoolean(true);
  body.Add("Tty").setBoolean(false);
  body.Add("OpenStdin").setBoolean(false);

  JsonObject host_config(body.Add("HostConfig"), 4);
  host_config.Add("NetworkMode").setString(AsText(spec.network_mode));
  host_config.Add("Memory").setNumber(static_cast<double>(spec.memory_bytes));
  host_config.Add("NanoCpus").setNumber(static_cast<double>(spec.nano_cpus));
  SetStrings(host_config.Add("Binds"), spec.binds);
  return Encode(root.asReader());
}

std::pair<std::string, std::string> DockerClient::SplitImage(
    const std::string& image) {
  if (image.find('@') != std::string::npos) return {image, ""};
  size_t slash = image.rfind('/');
  size_t colon = image.rfind(':');
  if (colon == std::string::npos ||
      (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

}  // namespace container
