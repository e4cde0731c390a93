#include "sandbox/os_sandbox.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <kj/debug.h>
#include <kj/io.h>
#include "executor/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/pipe_reader.hpp"
#include "util/which.hpp"

extern char** environ;

namespace sandbox {

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const std::string& prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return prefix + ": " + mystrerror(err, buf, kStrErrorBufSize);  // NOLINT
}

void MakePipe(kj::AutoCloseFd (&fds)[2]) {
  int raw[2];
  if (pipe2(raw, O_CLOEXEC) == -1) {  // NOLINT
    throw executor::infrastructure_error(ErrnoMessage("pipe2", errno));
  }
  fds[0] = kj::AutoCloseFd(raw[0]);
  fds[1] = kj::AutoCloseFd(raw[1]);
}

// The parent environment, with overrides replacing or extending it.
std::vector<std::string> MergeEnv(
    const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr;
       entry++) {
    std::string var = *entry;
    std::string key = var.substr(0, var.find('='));
    if (overrides.count(key)) continue;
    env.push_back(std::move(var));
  }
  for (const auto& kv : overrides) {
    if (kv.first.empty() || kv.first.find('=') != std::string::npos) {
      throw executor::unsupported_input("Invalid environment variable name: " +
                                        kv.first);
    }
    env.push_back(kv.first + "=" + kv.second);
  }
  return env;
}

// Looks binary up in PATH, returning an empty string if it is missing.
std::string FindBinary(const std::string& binary) {
  try {
    return util::which(binary, false);
  } catch (const std::runtime_error& e) {
    throw executor::infrastructure_error("Cannot look up " + binary + ": " +
                                         e.what());
  }
}

std::vector<char*> ToArgv(const std::vector<std::string>& strings) {
  std::vector<char*> argv;
  argv.reserve(strings.size() + 1);
  for (const std::string& s : strings) {
    argv.push_back(const_cast<char*>(s.c_str()));  // NOLINT
  }
  argv.push_back(nullptr);
  return argv;
}

// State of one execution, kept alive until the returned promise is done.
// Destroying it kills whatever is left of the process group.
struct RunState {
  RunState(pid_t pid, size_t max_output_bytes,
           kj::LowLevelAsyncIoProvider& low_level, int stdout_fd,
           int stderr_fd)
      : pid(pid),
        pgid(pid),
        out(low_level.wrapInputFd(
                stdout_fd, kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP),
            max_output_bytes),
        err(low_level.wrapInputFd(
                stderr_fd, kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP),
            max_output_bytes) {}

  ~RunState() { Terminate(); }

  // Kills the process group and reaps the child, unless the event port
  // already did.
  void Terminate() {
    if (kill(-pgid, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(WARNING, "Cannot kill process group", pgid, strerror(errno));
    }
    KJ_IF_MAYBE(child, pid) {
      int ignored = 0;
      while (waitpid(*child, &ignored, 0) == -1 && errno == EINTR) {
      }
      pid = nullptr;
    }
  }

  // Reset by onChildExit() as soon as the child has been reaped.
  kj::Maybe<pid_t> pid;
  pid_t pgid;
  int status = 0;
  util::PipeReader out;
  util::PipeReader err;
  std::chrono::steady_clock::time_point start =
      std::chrono::steady_clock::now();
};

void AddTruncationMetadata(const RunState& run,
                           executor::ExecutionResult* result) {
  if (run.out.Truncated()) result->metadata["stdout_truncated"] = "true";
  if (run.err.Truncated()) result->metadata["stderr_truncated"] = "true";
}

}  // namespace

OsSandbox::OsSandbox(const executor::SandboxConfig& config,
                     kj::AsyncIoContext& io)
    : executor::Executor(config.default_timeout),
      max_output_bytes_(config.max_output_bytes),
      low_level_(*io.lowLevelProvider),
      event_port_(io.unixEventPort),
      timer_(io.provider->getTimer()) {
  try {
    util::File::MakeDirs(config.root);
    root_ = util::File::RealPath(config.root);
  } catch (const std::system_error& e) {
    throw executor::configuration_error("Cannot prepare the sandbox root " +
                                        config.root + ": " + e.what());
  }
  KJ_LOG(INFO, "OS sandbox ready", root_);
}

std::vector<executor::Language> OsSandbox::SupportedLanguages() const {
  return {executor::Language::PYTHON, executor::Language::JAVASCRIPT,
          executor::Language::TYPESCRIPT, executor::Language::SHELL,
          executor::Language::RUBY};
}

kj::Promise<bool> OsSandbox::HealthCheck() {
  return util::File::IsDirectory(root_) && access(root_.c_str(), W_OK) == 0;
}

std::vector<std::string> OsSandbox::InterpreterCommand(
    executor::Language language, const std::string& code) {
  switch (language) {
    case executor::Language::PYTHON:
      return {"python3", "-c", code};
    case executor::Language::JAVASCRIPT:
      return {"node", "-e", code};
    case executor::Language::SHELL:
      return {"bash", "-c", code};
    case executor::Language::RUBY:
      return {"ruby", "-e", code};
    case executor::Language::TYPESCRIPT:
      if (!FindBinary("deno").empty()) return {"deno", "eval", code};
      if (!FindBinary("ts-node").empty()) {
        return {"ts-node", "-e", code};
      }
      throw executor::infrastructure_error(
          "No TypeScript runtime found, install deno or ts-node");
    default:
      throw executor::unsupported_input(
          executor::LanguageName(language) +
          " has no inline execution form in the os sandbox");
  }
}

std::string OsSandbox::ResolveWorkingDir(
    const kj::Maybe<std::string>& working_dir) {
  std::string requested;
  KJ_IF_MAYBE(dir, working_dir) { requested = *dir; }
  if (requested.find('\0') != std::string::npos) {
    throw executor::sandbox_violation("Working directory contains NUL");
  }
  std::string candidate =
      util::File::Normalize(util::File::JoinPath(root_, requested));
  if (!util::File::IsInside(candidate, root_)) {
    throw executor::sandbox_violation("Working directory " + requested +
                                      " is outside the sandbox root");
  }

  if (!util::File::IsDirectory(root_)) {
    throw executor::infrastructure_error("The sandbox root " + root_ +
                                         " no longer exists");
  }

  // Check the deepest existing ancestor before creating anything, so that a
  // symlink cannot make us create directories outside the root. The walk
  // stops at the root, which exists.
  try {
    std::string existing = candidate;
    while (existing != root_ && !existing.empty() &&
           !util::File::Exists(existing)) {
      existing = util::File::BaseDir(existing);
    }
    if (existing.empty()) existing = root_;
    if (!util::File::IsInside(util::File::RealPath(existing), root_)) {
      throw executor::sandbox_violation("Working directory " + requested +
                                        " escapes the sandbox root");
    }
    util::File::MakeDirs(candidate);
    std::string resolved = util::File::RealPath(candidate);
    if (!util::File::IsInside(resolved, root_)) {
      throw executor::sandbox_violation("Working directory " + requested +
                                        " escapes the sandbox root");
    }
    return resolved;
  } catch (const std::system_error& e) {
    throw executor::infrastructure_error(
        "Cannot prepare the working directory " + requested + ": " +
        e.what());
  }
}

OsSandbox::Child OsSandbox::Spawn(const std::string& binary,
                                  const std::vector<std::string>& args,
                                  const std::vector<std::string>& env,
                                  const std::string& cwd) {
  kj::AutoCloseFd stdin_pipe[2];
  kj::AutoCloseFd stdout_pipe[2];
  kj::AutoCloseFd stderr_pipe[2];
  kj::AutoCloseFd error_pipe[2];
  MakePipe(stdin_pipe);
  MakePipe(stdout_pipe);
  MakePipe(stderr_pipe);
  MakePipe(error_pipe);

  // Everything the child needs is prepared before forking.
  std::vector<char*> argv = ToArgv(args);
  std::vector<char*> envp = ToArgv(env);

  int fork_result = fork();
  if (fork_result == -1) {
    throw executor::infrastructure_error(ErrnoMessage("fork", errno));
  }
  if (fork_result == 0) {
    int error_fd = error_pipe[1].get();
    auto die = [error_fd](const char* prefix, int err) {
      char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
      char errbuf[kStrErrorBufSize] = {};
      strncat(buf, prefix, 64);                                       // NOLINT
      strncat(buf, ": ", 3);                                          // NOLINT
      strncat(buf, mystrerror(err, errbuf, kStrErrorBufSize),         // NOLINT
              kStrErrorBufSize);
      ssize_t len = strlen(buf);  // NOLINT
      if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
        ssize_t ignored = write(error_fd, buf, len);
        (void)ignored;
      }
      _Exit(127);
    };

    // The event loop blocks SIGCHLD and ignores SIGPIPE; the interpreter
    // should see the defaults.
    sigset_t no_signals;
    sigemptyset(&no_signals);
    sigprocmask(SIG_SETMASK, &no_signals, nullptr);
    signal(SIGPIPE, SIG_DFL);

    // New session, so that the whole group can be killed at once.
    if (setsid() == -1) die("setsid", errno);

    auto redirect = [&die](int fd, int target) {
      if (fd == target) {
        if (fcntl(fd, F_SETFD, 0) == -1) die("fcntl", errno);
      } else if (dup2(fd, target) == -1) {
        die("dup2", errno);
      }
    };
    redirect(stdin_pipe[0].get(), STDIN_FILENO);
    redirect(stdout_pipe[1].get(), STDOUT_FILENO);
    redirect(stderr_pipe[1].get(), STDERR_FILENO);

    if (chdir(cwd.c_str()) == -1) die("chdir", errno);

    struct rlimit no_core {};
    if (setrlimit(RLIMIT_CORE, &no_core) < 0) die("setrlim CORE", errno);

    execve(binary.c_str(), argv.data(), envp.data());
    die("exec", errno);
  }

  stdin_pipe[0] = kj::AutoCloseFd();
  stdout_pipe[1] = kj::AutoCloseFd();
  stderr_pipe[1] = kj::AutoCloseFd();
  error_pipe[1] = kj::AutoCloseFd();

  // EOF means exec succeeded, since the pipe is close-on-exec.
  ssize_t error_len = 0;
  ssize_t got = 0;
  while ((got = read(error_pipe[0], &error_len, sizeof(error_len))) == -1 &&
         errno == EINTR) {
  }
  if (got == sizeof(error_len) && error_len > 0) {
    std::vector<char> error(error_len + 1, '\0');
    KJ_SYSCALL(read(error_pipe[0], error.data(), error_len),
               "Failed to read from fd");
    int ignored = 0;
    while (waitpid(fork_result, &ignored, 0) == -1 && errno == EINTR) {
    }
    throw executor::infrastructure_error(error.data());
  }

  Child child{};
  child.pid = fork_result;
  child.stdin_fd = stdin_pipe[1].release();
  child.stdout_fd = stdout_pipe[0].release();
  child.stderr_fd = stderr_pipe[0].release();
  return child;
}

kj::Promise<executor::ExecutionResult> OsSandbox::ExecuteInternal(
    const executor::ExecutionRequest& request) {
  std::string cwd = ResolveWorkingDir(request.working_dir);
  std::vector<std::string> command =
      InterpreterCommand(request.language, request.code);
  std::string binary = FindBinary(command[0]);
  if (binary.empty()) {
    throw executor::infrastructure_error("Cannot find " + command[0] +
                                         " in PATH");
  }
  if (!request.args.empty()) {
    KJ_LOG(WARNING, "Arguments are ignored by the os sandbox",
           request.args.size());
  }
  std::vector<std::string> env = MergeEnv(request.env);

  Child child = Spawn(binary, command, env, cwd);
  KJ_LOG(INFO, "Started", binary, child.pid, cwd);

  auto state = kj::heap<RunState>(child.pid, max_output_bytes_, low_level_,
                                  child.stdout_fd, child.stderr_fd);
  RunState* run = state.get();
  // Must be registered before going back to the event loop.
  kj::Promise<int> exited = event_port_.onChildExit(run->pid);

  kj::Promise<void> input = kj::READY_NOW;
  KJ_IF_MAYBE(data, request.stdin_data) {
    kj::Own<kj::AsyncOutputStream> stream = low_level_.wrapOutputFd(
        child.stdin_fd, kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
    kj::AsyncOutputStream* stream_ptr = stream.get();
    kj::String content = kj::heapString(data->data(), data->size());
    const char* begin = content.begin();
    size_t size = content.size();
    // Closing the stream right after writing delivers EOF to the child.
    input = stream_ptr->write(begin, size)
                .then([stream = kj::mv(stream),
                       content = kj::mv(content)]() mutable {
                  stream = nullptr;
                })
                .catch_([](kj::Exception&& e) {
                  KJ_LOG(WARNING, "Cannot write stdin", e.getDescription());
                });
  } else {
    close(child.stdin_fd);
  }

  auto completed =
      kj::joinPromises(kj::arr(kj::mv(exited).then([run](int status) {
                                 run->status = status;
                               }),
                               run->out.ReadAll(), run->err.ReadAll(),
                               kj::mv(input)))
          .then([]() { return true; });
  auto deadline = timer_.afterDelay(request.timeout.count() * kj::MILLISECONDS)
                      .then([]() { return false; });

  std::chrono::milliseconds timeout = request.timeout;
  return kj::mv(completed)
      .exclusiveJoin(kj::mv(deadline))
      .then([run, timeout](bool finished) {
        std::chrono::milliseconds duration = executor::ElapsedSince(run->start);
        if (!finished) {
          run->Terminate();
          KJ_LOG(INFO, "Killed after timeout", run->pgid, timeout.count());
          std::string err = util::ToValidUtf8(run->err.Data());
          if (!err.empty() && err.back() != '\n') err += "\n";
          err += "Execution timed out after " +
                 std::to_string(timeout.count()) + "ms";
          auto result = executor::ExecutionResult::TimedOut(
              util::ToValidUtf8(run->out.Data()), err, duration);
          AddTruncationMetadata(*run, &result);
          return result;
        }
        int exit_code = 0;
        std::string signal_name;
        if (WIFEXITED(run->status)) {
          exit_code = WEXITSTATUS(run->status);
        } else if (WIFSIGNALED(run->status)) {
          exit_code = 128 + WTERMSIG(run->status);
          signal_name = strsignal(WTERMSIG(run->status));
        }
        auto result = executor::ExecutionResult::Completed(
            exit_code, util::ToValidUtf8(run->out.Data()),
            util::ToValidUtf8(run->err.Data()), duration);
        if (!signal_name.empty()) result.metadata["signal"] = signal_name;
        AddTruncationMetadata(*run, &result);
        return result;
      })
      .attach(kj::mv(state));
}

}  // namespace sandbox
