#include "container/container_executor.hpp"

#include <kj/debug.h>
#include <map>
#include <random>
#include "container/limits.hpp"
#include "executor/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace container {

constexpr const char* ContainerExecutor::kNamePrefix;

namespace {

static const constexpr char* kSourceVar = "CODEBOX_SOURCE";
static const constexpr char* kStdinVar = "CODEBOX_STDIN";
// Linux caps a single environment string, NAME=value and its terminator,
// at 128KiB (MAX_ARG_STRLEN).
static const constexpr size_t kMaxEnvString = 128 * 1024;

// State of one execution after its container has been created.
struct RunState {
  std::string id;
  int64_t status = 0;
  bool timed_out = false;
  ContainerLogs logs;
  kj::Maybe<kj::Exception> error;
};

std::string RandomName() {
  static std::mt19937_64 generator{std::random_device{}()};
  static const char* digits = "0123456789abcdef";
  uint64_t value = generator();
  std::string name = ContainerExecutor::kNamePrefix;
  for (int i = 0; i < 16; i++) {
    name += digits[value & 0xf];
    value >>= 4;
  }
  return name;
}

// Throws unsupported_input if value cannot travel in the variable name.
void CheckEnvValue(const std::string& name, const std::string& value,
                   const std::string& what) {
  if (value.find('\0') != std::string::npos) {
    throw executor::unsupported_input(
        what + " cannot contain NUL bytes in a container");
  }
  if (name.size() + value.size() + 2 > kMaxEnvString) {
    throw executor::unsupported_input(
        what + " is larger than the 128KiB a container accepts");
  }
}

// Keeps at most limit bytes of text.
std::string Capped(const std::string& text, size_t limit, bool* truncated) {
  *truncated = text.size() > limit;
  return util::ToValidUtf8(*truncated ? text.substr(0, limit) : text);
}

}  // namespace

kj::Promise<std::unique_ptr<ContainerExecutor>> ContainerExecutor::Create(
    const executor::SandboxConfig& config, kj::Own<ContainerRuntime> runtime,
    kj::Timer& timer) {
  auto executor = std::make_unique<ContainerExecutor>(config, kj::mv(runtime),
                                                      timer);
  ContainerExecutor* ptr = executor.get();
  return ptr->runtime_->Ping()
      .then([ptr]() { return ptr->runtime_->HasImage(ptr->config_.image); })
      .then([ptr](bool present) -> kj::Promise<void> {
        if (present) return kj::READY_NOW;
        KJ_LOG(INFO, "Image not present locally", ptr->config_.image);
        return ptr->runtime_->PullImage(ptr->config_.image);
      })
      .then([executor = std::move(executor)]() mutable {
        KJ_LOG(INFO, "Container executor ready", executor->config_.image);
        return std::move(executor);
      });
}

ContainerExecutor::ContainerExecutor(const executor::SandboxConfig& config,
                                     kj::Own<ContainerRuntime> runtime,
                                     kj::Timer& timer)
    : executor::Executor(config.default_timeout),
      config_(config.container),
      max_output_bytes_(config.max_output_bytes),
      memory_bytes_(ParseMemoryLimit(config.container.memory_limit)),
      nano_cpus_(CpuToNanoCpus(config.container.cpu_limit)),
      runtime_(kj::mv(runtime)),
      timer_(timer) {}

std::vector<executor::Language> ContainerExecutor::SupportedLanguages() const {
  return {executor::Language::PYTHON, executor::Language::JAVASCRIPT,
          executor::Language::TYPESCRIPT, executor::Language::RUST,
          executor::Language::GO,     executor::Language::SHELL,
          executor::Language::RUBY};
}

kj::Promise<bool> ContainerExecutor::HealthCheck() {
  return runtime_->Ping().then([]() { return true; },
                               [](kj::Exception&& e) {
                                 KJ_LOG(WARNING, "Container runtime is down",
                                        e.getDescription());
                                 return false;
                               });
}

std::vector<std::string> ContainerExecutor::Command(
    executor::Language language, const std::string& code,
    const std::vector<std::string>& args, bool has_stdin) {
  std::vector<std::string> command;
  switch (language) {
    case executor::Language::PYTHON:
      command = {"python3", "-c", code};
      break;
    case executor::Language::JAVASCRIPT:
      command = {"node", "-e", code};
      break;
    case executor::Language::TYPESCRIPT:
      command = {"deno", "eval", code};
      break;
    case executor::Language::SHELL:
      command = {"bash", "-c", code};
      break;
    case executor::Language::RUBY:
      command = {"ruby", "-e", code};
      break;
    case executor::Language::RUST:
      command = {"sh", "-c",
                 "printf '%s' \"$CODEBOX_SOURCE\" > /tmp/main.rs && "
                 "unset CODEBOX_SOURCE && "
                 "rustc --edition=2021 -o /tmp/main /tmp/main.rs && "
                 "exec /tmp/main \"$@\"",
                 "sh"};
      break;
    case executor::Language::GO:
      command = {"sh", "-c",
                 "printf '%s' \"$CODEBOX_SOURCE\" > /tmp/main.go && "
                 "unset CODEBOX_SOURCE && "
                 "exec go run /tmp/main.go \"$@\"",
                 "sh"};
      break;
    default:
      throw executor::unsupported_input(executor::LanguageName(language) +
                                        " cannot run in a container");
  }
  command.insert(command.end(), args.begin(), args.end());
  if (has_stdin) {
    command.insert(command.begin(),
                   {"sh", "-c",
                    "data=$CODEBOX_STDIN; unset CODEBOX_STDIN; "
                    "printf '%s' \"$data\" | \"$@\"",
                    "sh"});
  }
  return command;
}

std::string ContainerExecutor::ResolveWorkingDir(
    const kj::Maybe<std::string>& working_dir) const {
  std::string root = util::File::Normalize(config_.workdir);
  std::string requested;
  KJ_IF_MAYBE(dir, working_dir) { requested = *dir; }
  if (requested.find('\0') != std::string::npos) {
    throw executor::sandbox_violation("Working directory contains NUL");
  }
  std::string resolved =
      util::File::Normalize(util::File::JoinPath(root, requested));
  if (!util::File::IsInside(resolved, root)) {
    throw executor::sandbox_violation("Working directory " + requested +
                                      " is outside " + root);
  }
  return resolved;
}

ContainerSpec ContainerExecutor::BuildSpec(
    const executor::ExecutionRequest& request) const {
  ContainerSpec spec;
  spec.name = RandomName();
  spec.image = config_.image;
  spec.cmd = Command(request.language, request.code, request.args,
                     request.stdin_data != nullptr);
  spec.working_dir = ResolveWorkingDir(request.working_dir);

  std::map<std::string, std::string> env = config_.env;
  for (const auto& kv : request.env) env[kv.first] = kv.second;
  if (request.language == executor::Language::RUST ||
      request.language == executor::Language::GO) {
    CheckEnvValue(kSourceVar, request.code, "Source code");
    env[kSourceVar] = request.code;
  }
  KJ_IF_MAYBE(data, request.stdin_data) {
    CheckEnvValue(kStdinVar, *data, "Standard input");
    env[kStdinVar] = *data;
  }
  for (const auto& kv : env) {
    if (kv.first.empty() || kv.first.find('=') != std::string::npos) {
      throw executor::unsupported_input("Invalid environment variable name: " +
                                        kv.first);
    }
    spec.env.push_back(kv.first + "=" + kv.second);
  }

  spec.network_disabled = config_.network == "none";
  spec.network_mode = config_.network;
  spec.memory_bytes = memory_bytes_;
  spec.nano_cpus = nano_cpus_;
  for (const executor::VolumeMount& volume : config_.volumes) {
    spec.binds.push_back(volume.host_path + ":" + volume.container_path +
                         (volume.read_only ? ":ro" : ""));
  }
  return spec;
}

kj::Promise<executor::ExecutionResult> ContainerExecutor::ExecuteInternal(
    const executor::ExecutionRequest& request) {
  ContainerSpec spec = BuildSpec(request);
  auto start = std::chrono::steady_clock::now();
  std::chrono::milliseconds timeout = request.timeout;
  size_t limit = max_output_bytes_;
  KJ_LOG(INFO, "Creating container", spec.name, spec.image);

  return runtime_->CreateContainer(spec).then([this, start, timeout, limit](
                                                  std::string&& id) {
    auto state = kj::heap<RunState>();
    state->id = kj::mv(id);
    RunState* run = state.get();

    auto deadline = timer_.afterDelay(timeout.count() * kj::MILLISECONDS)
                        .then([]() { return false; });
    auto finished =
        runtime_->StartContainer(run->id)
            .then([this, run]() { return runtime_->WaitContainer(run->id); })
            .then([run](int64_t status) {
              run->status = status;
              return true;
            })
            .exclusiveJoin(kj::mv(deadline))
            .then([run](bool completed) { run->timed_out = !completed; },
                  [run](kj::Exception&& e) { run->error = kj::mv(e); });

    return kj::mv(finished)
        .then([this, run]() -> kj::Promise<void> {
          if (run->error != nullptr) return kj::READY_NOW;
          return runtime_->FetchLogs(run->id).then(
              [run](ContainerLogs&& logs) { run->logs = kj::mv(logs); },
              [run](kj::Exception&& e) {
                KJ_LOG(WARNING, "Cannot fetch logs", run->id,
                       e.getDescription());
              });
        })
        .then([this, run]() {
          return runtime_->RemoveContainer(run->id).catch_(
              [run](kj::Exception&& e) {
                KJ_LOG(ERROR, "Cannot remove container", run->id,
                       e.getDescription());
              });
        })
        .then([run, start, timeout, limit]() {
          KJ_IF_MAYBE(error, run->error) {
            kj::throwFatalException(kj::mv(*error));
          }
          std::chrono::milliseconds duration = executor::ElapsedSince(start);
          bool stdout_truncated = false;
          bool stderr_truncated = false;
          std::string out =
              Capped(run->logs.stdout_text, limit, &stdout_truncated);
          std::string err =
              Capped(run->logs.stderr_text, limit, &stderr_truncated);
          executor::ExecutionResult result;
          if (run->timed_out) {
            if (!err.empty() && err.back() != '\n') err += "\n";
            err += "Execution timed out after " +
                   std::to_string(timeout.count()) + "ms";
            result = executor::ExecutionResult::TimedOut(out, err, duration);
            result.metadata["container_status"] = "timed_out";
          } else {
            result = executor::ExecutionResult::Completed(
                static_cast<int32_t>(run->status), out, err, duration);
            result.metadata["container_status"] = "exited";
          }
          result.metadata["container_id"] = run->id;
          if (stdout_truncated) result.metadata["stdout_truncated"] = "true";
          if (stderr_truncated) result.metadata["stderr_truncated"] = "true";
          return result;
        })
        .attach(kj::mv(state));
  });
}

}  // namespace container
