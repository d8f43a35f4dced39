#ifndef SANDBOX_CONTAINER_HPP
#define SANDBOX_CONTAINER_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the harness in a fresh, single-use container started from the base
// image of the language, with no network, a read-only root filesystem and an
// unprivileged user. The harness directory is mounted read-only.
class ContainerSandbox : public Sandbox {
 public:
  static const constexpr char* kName = "container";

  const char* Name() const override { return kName; }
  // The toolchains come with the base images.
  bool CanRun(const language::Language&) const override { return true; }
  bool Execute(const language::Language& language,
               const harness::Harness& harness, int64_t deadline_millis,
               RunResult* result, std::string* error_msg) override;

  static Sandbox* Create(const SandboxConfig& config) {
    return new ContainerSandbox(config);
  }
  // Checks that the runtime is on the PATH and that `runtime info` succeeds
  // within kProbeMillis.
  static int Score(const SandboxConfig& config);

  // Arguments of the runtime that run the language command for the harness
  // in box_dir, in a container with the given name.
  std::vector<std::string> RunArguments(const language::Language& language,
                                        const std::string& name,
                                        const std::string& box_dir) const;

  explicit ContainerSandbox(SandboxConfig config);

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kMountPoint = "/sandbox";
  static const constexpr char* kScratchDir = "/tmp";
  static const constexpr char* kScratchSize = "256m";
  static const constexpr char* kUser = "65534:65534";
  static const constexpr int64_t kProbeMillis = 5000;
  // Exit code of the runtime when the container could not be started.
  static const constexpr int32_t kRuntimeFailure = 125;

  SandboxConfig config_;
  std::string runtime_;
};

}  // namespace sandbox

#endif
