#ifndef SANDBOX_LOCAL_HPP
#define SANDBOX_LOCAL_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the harness with the toolchain installed on the host, as a child of
// this process in its own session, under resource limits.
class LocalSandbox : public Sandbox {
 public:
  static const constexpr char* kName = "local";

  const char* Name() const override { return kName; }
  // True if every toolchain command of the language is on the PATH.
  bool CanRun(const language::Language& language) const override;
  bool Execute(const language::Language& language,
               const harness::Harness& harness, int64_t deadline_millis,
               RunResult* result, std::string* error_msg) override;

  static Sandbox* Create(const SandboxConfig& config) {
    return new LocalSandbox(config);
  }
  static int Score(const SandboxConfig& config);

  explicit LocalSandbox(SandboxConfig config) : config_(std::move(config)) {}

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kScratchDir = "scratch";
  // Compilers write their output to the scratch directory, so the file size
  // limit cannot be lower than this.
  static const constexpr int64_t kMinFileSizeKb = 64 * 1024;
  static const constexpr int32_t kMaxFiles = 1024;

  SandboxConfig config_;
};

}  // namespace sandbox

#endif
