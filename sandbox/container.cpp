#include "sandbox/container.hpp"

#include <random>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "sandbox/process.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {

std::string FindRuntime(const std::string& runtime) {
  if (runtime.find('/') != std::string::npos) return runtime;
  return util::which(runtime);
}

// Runs a command of the runtime, discarding its output.
bool RunRuntime(const std::string& runtime, std::vector<std::string> args,
                int64_t wall_limit_millis, ExecutionInfo* info,
                std::string* error_msg) {
  ExecutionOptions options("/", runtime);
  options.args = std::move(args);
  options.wall_limit_millis = wall_limit_millis;
  options.stdout_file = "/dev/null";
  options.stderr_file = "/dev/null";
  Process process;
  return process.Execute(options, info, error_msg);
}

std::string ContainerName() {
  thread_local std::mt19937_64 generator{std::random_device{}()};
  return absl::StrCat("code-runner-", absl::Hex(generator(), absl::kZeroPad16));
}

// Force-removes a container when going out of scope, whether or not it was
// ever created.
class ContainerGuard {
 public:
  ContainerGuard(std::string runtime, std::string name)
      : runtime_(std::move(runtime)), name_(std::move(name)) {}
  ~ContainerGuard() {
    ExecutionInfo info;
    std::string error_msg;
    if (!RunRuntime(runtime_, {"rm", "-f", name_}, kRemoveMillis, &info,
                    &error_msg)) {
      LOG(WARNING) << "Cannot remove container " << name_ << ": " << error_msg;
    } else if (info.killed) {
      LOG(WARNING) << "Timed out removing container " << name_;
    }
  }
  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;

 private:
  static const constexpr int64_t kRemoveMillis = 10000;
  std::string runtime_;
  std::string name_;
};

}  // namespace

ContainerSandbox::ContainerSandbox(SandboxConfig config)
    : config_(std::move(config)) {
  runtime_ = FindRuntime(config_.container_runtime);
}

std::vector<std::string> ContainerSandbox::RunArguments(
    const language::Language& language, const std::string& name,
    const std::string& box_dir) const {
  std::string memory = absl::StrCat(config_.memory_limit_kb, "k");
  return {
      "run",
      "--name", name,
      "--pull", "never",
      "--network", "none",
      "--memory", memory,
      "--memory-swap", memory,
      "--pids-limit", absl::StrCat(config_.max_processes),
      "--cap-drop", "ALL",
      "--security-opt", "no-new-privileges",
      "--user", kUser,
      "--read-only",
      "--tmpfs", absl::StrCat(kScratchDir, ":rw,exec,size=", kScratchSize),
      "--volume", absl::StrCat(box_dir, ":", kMountPoint, ":ro"),
      "--workdir", kMountPoint,
      "--env", absl::StrCat("HOME=", kScratchDir),
      language.base_image,
      "sh", "-c", language.Command(kMountPoint, kScratchDir),
  };
}

bool ContainerSandbox::Execute(const language::Language& language,
                               const harness::Harness& harness,
                               int64_t deadline_millis, RunResult* result,
                               std::string* error_msg) {
  if (runtime_.empty()) {
    *error_msg = "container runtime " + config_.container_runtime +
                 " not found";
    return false;
  }
  try {
    util::TempDir tmp(config_.temp_directory);
    if (config_.keep_sandboxes) tmp.Keep();
    // The container user is not the owner of the directory.
    std::string box_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
    util::File::MakeDirs(box_dir);
    util::File::SetMode(box_dir, 0755);
    std::string source = util::File::JoinPath(box_dir, harness.file_name);
    util::File::Write(source, harness.source);
    util::File::SetMode(source, 0644);

    std::string name = ContainerName();
    ExecutionOptions options(tmp.Path(), runtime_);
    options.args = RunArguments(language, name, box_dir);
    options.wall_limit_millis = deadline_millis;
    options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

    VLOG(1) << "Starting container " << name << " from "
            << language.base_image;
    ExecutionInfo info;
    {
      ContainerGuard guard(runtime_, name);
      Process process;
      if (!process.Execute(options, &info, error_msg)) return false;
    }

    result->stdout_data = util::File::Read(
        options.stdout_file, config_.max_output_kb * 1024,
        &result->stdout_truncated);
    result->stderr_data = util::File::Read(
        options.stderr_file, config_.max_output_kb * 1024);
    if (!info.killed && info.signal == 0 &&
        info.status_code == kRuntimeFailure) {
      *error_msg = absl::StrCat(
          "container runtime failed: ",
          absl::StripAsciiWhitespace(result->stderr_data));
      return false;
    }
    result->status_code = info.status_code;
    result->signal = info.signal;
    result->timed_out = info.killed;
    result->wall_time_millis = info.wall_time_millis;
    return true;
  } catch (const std::system_error& e) {
    *error_msg = e.what();
    return false;
  }
}

int ContainerSandbox::Score(const SandboxConfig& config) {
  std::string runtime = FindRuntime(config.container_runtime);
  if (runtime.empty()) {
    LOG(INFO) << "Container runtime " << config.container_runtime
              << " not found";
    return -1;
  }
  ExecutionInfo info;
  std::string error_msg;
  if (!RunRuntime(runtime, {"info"}, kProbeMillis, &info, &error_msg)) {
    LOG(WARNING) << "Cannot run " << runtime << ": " << error_msg;
    return -1;
  }
  if (info.killed || info.signal != 0 || info.status_code != 0) {
    LOG(WARNING) << "Container runtime " << runtime << " is not reachable";
    return -1;
  }
  return 2;
}

namespace {
Sandbox::Register<ContainerSandbox> r;
}  // namespace

}  // namespace sandbox
