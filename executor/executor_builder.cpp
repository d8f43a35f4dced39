#include "executor/executor_builder.hpp"

#include "executor/sandboxed_executor.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/flags.hpp"

#include <memory>
#include <stdexcept>

namespace executor {

ExecutorOptions ExecutorBuilder::OptionsFromFlags() {
  ExecutorOptions options;
  options.default_timeout = FLAGS_default_timeout;
  options.max_timeout = FLAGS_max_timeout;
  options.max_concurrent_executions = FLAGS_max_concurrent_executions;
  return options;
}

sandbox::SandboxConfig ExecutorBuilder::SandboxConfigFromFlags() {
  sandbox::SandboxConfig config;
  config.temp_directory = FLAGS_temp_directory;
  config.backend = FLAGS_backend;
  config.container_runtime = FLAGS_container_runtime;
  config.memory_limit_kb = static_cast<int64_t>(FLAGS_memory_limit_mb) * 1024;
  config.max_processes = FLAGS_max_processes;
  config.max_output_kb = FLAGS_max_output_kb;
  config.keep_sandboxes = FLAGS_keep_sandboxes;
  return config;
}

std::unique_ptr<Executor> ExecutorBuilder::Get(
    const ExecutorOptions& options, const sandbox::SandboxConfig& config) {
  if (config.backend != "auto" && config.backend != "container" &&
      config.backend != "local") {
    throw std::invalid_argument("unknown backend " + config.backend);
  }
  if (options.default_timeout < 1 || options.max_timeout < 1) {
    throw std::invalid_argument("timeouts must be at least one second");
  }
  util::File::MakeDirs(config.temp_directory);
  std::vector<std::string> available;
  std::unique_ptr<sandbox::Sandbox> sandbox =
      sandbox::Sandbox::Create(config, &available);
  if (!sandbox) {
    LOG(ERROR) << "No usable sandbox, executions will fail";
  } else if (config.backend == "auto" &&
             std::string(sandbox->Name()) != "container") {
    LOG(WARNING) << "Container runtime " << config.container_runtime
                 << " not reachable, running code with the local toolchain";
  }
  return std::unique_ptr<Executor>(new SandboxedExecutor(
      options, std::move(sandbox), std::move(available)));
}

}  // namespace executor
