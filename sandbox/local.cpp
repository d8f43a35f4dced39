#include "sandbox/local.hpp"

#include <stdlib.h>
#include <unistd.h>

#include "glog/logging.h"
#include "sandbox/process.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {

std::vector<std::string> ChildEnvironment(const std::string& scratch_dir) {
  const char* path = getenv("PATH");
  return {
      std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"),
      "HOME=" + scratch_dir,
      "TMPDIR=" + scratch_dir,
      "LANG=C.UTF-8",
  };
}

}  // namespace

bool LocalSandbox::CanRun(const language::Language& language) const {
  for (const std::string& command : language.toolchain) {
    if (util::which(command).empty()) return false;
  }
  return true;
}

bool LocalSandbox::Execute(const language::Language& language,
                           const harness::Harness& harness,
                           int64_t deadline_millis, RunResult* result,
                           std::string* error_msg) {
  for (const std::string& command : language.toolchain) {
    if (util::which(command).empty()) {
      *error_msg = "toolchain command " + command + " not found for " +
                   language.value;
      return false;
    }
  }

  try {
    util::TempDir tmp(config_.temp_directory);
    if (config_.keep_sandboxes) tmp.Keep();
    std::string box_dir = util::File::JoinPath(tmp.Path(), kBoxDir);
    std::string scratch_dir = util::File::JoinPath(tmp.Path(), kScratchDir);
    util::File::MakeDirs(box_dir);
    util::File::MakeDirs(scratch_dir);
    util::File::Write(util::File::JoinPath(box_dir, harness.file_name),
                      harness.source);

    ExecutionOptions options(box_dir, "/bin/sh");
    options.args = {"-c", language.Command(box_dir, scratch_dir)};
    options.env = ChildEnvironment(scratch_dir);
    options.wall_limit_millis = deadline_millis;
    // A margin over the deadline, so that the wall limit is what stops a
    // runaway program.
    options.cpu_limit_millis = deadline_millis + 1000;
    if (language.limit_address_space) {
      options.memory_limit_kb = config_.memory_limit_kb;
    }
    options.max_files = kMaxFiles;
    options.max_file_size_kb = config_.max_output_kb > kMinFileSizeKb
                                   ? config_.max_output_kb
                                   : kMinFileSizeKb;
    options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

    VLOG(1) << "Running " << options.args.back() << " in " << box_dir;
    Process process;
    ExecutionInfo info;
    if (!process.Execute(options, &info, error_msg)) return false;

    result->status_code = info.status_code;
    result->signal = info.signal;
    result->timed_out = info.killed;
    result->wall_time_millis = info.wall_time_millis;
    result->stdout_data = util::File::Read(
        options.stdout_file, config_.max_output_kb * 1024,
        &result->stdout_truncated);
    result->stderr_data = util::File::Read(
        options.stderr_file, config_.max_output_kb * 1024);
    return true;
  } catch (const std::system_error& e) {
    *error_msg = e.what();
    return false;
  }
}

int LocalSandbox::Score(const SandboxConfig& config) {
  if (access("/bin/sh", X_OK) == -1) return -1;
  return 1;
}

namespace {
Sandbox::Register<LocalSandbox> r;
}  // namespace

}  // namespace sandbox
