#ifndef EXECUTOR_EXECUTOR_BUILDER_HPP
#define EXECUTOR_EXECUTOR_BUILDER_HPP
#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"

#include <memory>

namespace executor {

class ExecutorBuilder {
 public:
  // Options and sandbox configuration from the command line flags.
  static ExecutorOptions OptionsFromFlags();
  static sandbox::SandboxConfig SandboxConfigFromFlags();

  // Probes the sandboxes and builds an executor on the selected one.
  static std::unique_ptr<Executor> Get(const ExecutorOptions& options,
                                       const sandbox::SandboxConfig& config);
};

}  // namespace executor

#endif
