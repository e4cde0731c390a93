#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <kj/main.h>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>

#include "executor/config.hpp"
#include "executor/errors.hpp"
#include "executor/executor_builder.hpp"
#include "executor/run_code.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "wasm/wasm_executor.hpp"

namespace {

const char* kVersion = "codebox 0.1.0";

executor::SandboxConfig ConfigFromFlags() {
  executor::SandboxConfig config;
  config.execution_env = executor::ParseExecutionEnv(Flags::execution_env);
  if (!Flags::root.empty()) config.root = Flags::root;
  config.default_timeout = std::chrono::seconds(Flags::timeout_secs);
  config.max_output_bytes = Flags::max_output_bytes;
  config.container.socket_path = Flags::docker_socket;
  config.container.image = Flags::image;
  config.container.network = Flags::network;
  config.container.memory_limit = Flags::memory_limit;
  config.container.cpu_limit = Flags::cpu_limit;
  config.wasm.max_memory_pages = Flags::wasm_max_memory_pages;
  config.wasm.fuel_limit = Flags::wasm_fuel_limit;
  return config;
}

kj::MainBuilder& AddCommonOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Also log informational messages")
      .addOptionWithArg({"env"}, util::setString(Flags::execution_env),
                        "<ENV>", "Execution environment: os, sandbox or "
                        "container (default sandbox)")
      .addOptionWithArg({'t', "timeout"}, util::setInt(Flags::timeout_secs),
                        "<SECS>", "Timeout in seconds")
      .addOptionWithArg({"max-output"}, util::setUint(Flags::max_output_bytes),
                        "<BYTES>", "Maximum captured bytes per stream")
      .addOptionWithArg({"root"}, util::setString(Flags::root), "<DIR>",
                        "Sandbox root of the os environment")
      .addOptionWithArg({"image"}, util::setString(Flags::image), "<IMAGE>",
                        "Image of the container environment")
      .addOptionWithArg({"network"}, util::setString(Flags::network),
                        "<MODE>", "Network mode of the containers")
      .addOptionWithArg({"memory"}, util::setString(Flags::memory_limit),
                        "<LIMIT>", "Memory limit of the containers (512m, 1g)")
      .addOptionWithArg({"cpus"}, util::setDouble(Flags::cpu_limit), "<CPUS>",
                        "CPU limit of the containers")
      .addOptionWithArg({"socket"}, util::setString(Flags::docker_socket),
                        "<PATH>", "Path of the Docker daemon socket")
      .addOptionWithArg({"fuel"}, util::setUint64(Flags::wasm_fuel_limit),
                        "<FUEL>", "Fuel limit of WebAssembly calls")
      .addOptionWithArg({"pages"}, util::setUint(Flags::wasm_max_memory_pages),
                        "<PAGES>", "Memory limit of WebAssembly modules");
}

}  // namespace

class CodeboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeboxMain(kj::ProcessContext& context) : context_(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context_, kVersion,
                           "Runs untrusted code in a sandbox")
        .addSubCommand("run", KJ_BIND_METHOD(*this, getRunMain),
                       "run a snippet of code")
        .addSubCommand("wasm", KJ_BIND_METHOD(*this, getWasmMain),
                       "call a function of a WebAssembly module")
        .addSubCommand("check", KJ_BIND_METHOD(*this, getCheckMain),
                       "check that the execution environment works")
        .build();
  }

  kj::MainFunc getRunMain() {
    kj::MainBuilder builder(context_, kVersion, "Runs a snippet of code",
                            "Use - as code to read it from standard input.");
    return AddCommonOptions(builder)
        .addOptionWithArg({'e', "setenv"}, util::appendString(Flags::env),
                          "<KEY=VALUE>", "Set an environment variable")
        .addOptionWithArg({'i', "stdin"}, util::setString(Flags::stdin_file),
                          "<FILE>", "File to use as standard input")
        .addOptionWithArg({'w', "workdir"}, util::setString(Flags::working_dir),
                          "<DIR>", "Working directory, relative to the root")
        .addOptionWithArg({'a', "arg"}, util::appendString(Flags::args),
                          "<ARG>", "Argument for the program")
        .addOption({"json"}, util::setBool(Flags::json),
                   "Print the result as JSON")
        .expectArg("<language>", util::setString(language_))
        .expectArg("<code>", util::setString(code_))
        .callAfterParsing(KJ_BIND_METHOD(*this, Run))
        .build();
  }

  kj::MainFunc getWasmMain() {
    kj::MainBuilder builder(context_, kVersion,
                            "Calls a function of a WebAssembly module",
                            "The module may be in text or binary format.");
    return AddCommonOptions(builder)
        .addOption({"json"}, util::setBool(Flags::json),
                   "Print the result as JSON")
        .expectArg("<module>", util::setString(module_file_))
        .expectArg("<function>", util::setString(function_))
        .expectZeroOrMoreArgs("<args>", util::appendString(Flags::args))
        .callAfterParsing(KJ_BIND_METHOD(*this, RunWasm))
        .build();
  }

  kj::MainFunc getCheckMain() {
    kj::MainBuilder builder(context_, kVersion,
                            "Checks that the execution environment works");
    return AddCommonOptions(builder)
        .callAfterParsing(KJ_BIND_METHOD(*this, Check))
        .build();
  }

 private:
  kj::MainBuilder::Validity Run() {
    util::LogManager log_manager(context_);
    executor::SandboxConfig config;
    std::unique_ptr<executor::ExecutionRequest> request;
    try {
      config = ConfigFromFlags();
      request = std::make_unique<executor::ExecutionRequest>(
          executor::ParseLanguage(language_), ReadCode());
    } catch (const executor::execution_error& e) {
      return kj::heapString(e.what());
    }
    for (const std::string& var : Flags::env) {
      size_t eq = var.find('=');
      if (eq == std::string::npos || eq == 0) {
        return kj::str("Invalid environment variable ", var, ", use KEY=VALUE");
      }
      request->env[var.substr(0, eq)] = var.substr(eq + 1);
    }
    if (!Flags::stdin_file.empty()) {
      try {
        request->stdin_data = util::File::Read(Flags::stdin_file);
      } catch (const std::system_error& e) {
        return kj::heapString(e.what());
      }
    }
    if (!Flags::working_dir.empty()) request->working_dir = Flags::working_dir;
    request->args = Flags::args;

    kj::UnixEventPort::captureChildExit();
    auto io = kj::setupAsyncIo();
    auto backend = BuildOrExit(config, io);
    Report(executor::RunCode(*backend, *request, io.waitScope));
    return true;
  }

  kj::MainBuilder::Validity RunWasm() {
    util::LogManager log_manager(context_);
    executor::SandboxConfig config;
    std::string module;
    try {
      config = ConfigFromFlags();
      config.execution_env = executor::ExecutionEnv::SANDBOX;
      executor::ValidateConfig(config);
      module = util::File::Read(module_file_);
    } catch (const executor::execution_error& e) {
      return kj::heapString(e.what());
    } catch (const std::system_error& e) {
      return kj::heapString(e.what());
    }
    executor::ExecutionRequest request(executor::Language::WASM, module);
    request.args.push_back(function_);
    request.args.insert(request.args.end(), Flags::args.begin(),
                        Flags::args.end());

    auto io = kj::setupAsyncIo();
    std::unique_ptr<wasm::WasmExecutor> backend;
    try {
      backend = std::make_unique<wasm::WasmExecutor>(config, io);
    } catch (const executor::execution_error& e) {
      context_.exitError(kj::str("Configuration error: ", e.what()));
    }
    Report(executor::RunCode(*backend, request, io.waitScope));
    return true;
  }

  kj::MainBuilder::Validity Check() {
    util::LogManager log_manager(context_);
    executor::SandboxConfig config;
    try {
      config = ConfigFromFlags();
    } catch (const executor::execution_error& e) {
      return kj::heapString(e.what());
    }
    kj::UnixEventPort::captureChildExit();
    auto io = kj::setupAsyncIo();
    auto backend = BuildOrExit(config, io);
    bool healthy = backend->HealthCheck().wait(io.waitScope);
    std::cout << backend->Name() << ": " << (healthy ? "healthy" : "unhealthy")
              << std::endl;
    if (!healthy) context_.error("health check failed");
    return true;
  }

  std::string ReadCode() {
    if (code_ != "-") return code_;
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }

  std::unique_ptr<executor::Executor> BuildOrExit(
      const executor::SandboxConfig& config, kj::AsyncIoContext& io) {
    try {
      return executor::ExecutorBuilder::Build(config, io).wait(io.waitScope);
    } catch (const executor::execution_error& e) {
      context_.exitError(kj::str("Configuration error: ", e.what()));
    } catch (const kj::Exception& e) {
      context_.exitError(
          kj::str("Configuration error: ", e.getDescription()));
    }
  }

  void Report(const executor::RunReport& report) {
    KJ_IF_MAYBE(result, report.result) {
      if (Flags::json) {
        std::cout << executor::ResultToJson(*result) << std::endl;
      } else {
        std::cout << executor::FormatReport(report);
      }
    } else {
      std::cout << executor::FormatReport(report);
    }
    if (report.outcome != executor::RunReport::Outcome::COMPLETED) {
      context_.error(report.message);
    }
  }

  kj::ProcessContext& context_;
  std::string language_;
  std::string code_;
  std::string module_file_;
  std::string function_;
};

KJ_MAIN(CodeboxMain);
