#include "sandbox/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "glog/logging.h"

extern char** environ;

namespace {

// Failure of the child before exec, sent to the parent through the pipe.
struct ChildError {
  int32_t step;
  int32_t error;
};

enum ChildStep : int32_t {
  kSetsid = 0,
  kOpenStdin,
  kOpenStdout,
  kOpenStderr,
  kChdir,
  kRedirect,
  kRlimit,
  kExec,
};

const char* const kChildStepNames[] = {
    "setsid", "open stdin", "open stdout", "open stderr",
    "chdir",  "redirect",   "setrlimit",   "exec",
};

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[1024] = {};
  return std::string(prefix) + ": " + strerror_r(err, buf, sizeof(buf));
}

std::vector<char*> MakeArgv(const std::vector<std::string>& strings,
                            std::vector<std::vector<char>>* storage) {
  storage->clear();
  for (const std::string& str : strings) {
    storage->emplace_back(str.begin(), str.end());
    storage->back().push_back(0);
  }
  std::vector<char*> argv;
  for (std::vector<char>& str : *storage) argv.push_back(str.data());
  argv.push_back(nullptr);
  return argv;
}

}  // namespace

namespace sandbox {

bool Process::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                      std::string* error_msg) {
  options_ = &options;
  std::vector<std::string> args{options.executable};
  args.insert(args.end(), options.args.begin(), options.args.end());
  args_ = MakeArgv(args, &arg_storage_);
  if (!options.env.empty()) env_ = MakeArgv(options.env, &env_storage_);

  auto program_start = std::chrono::steady_clock::now();
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - program_start)
          .count();
  return true;
}

bool Process::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return true;
}

bool Process::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    ClosePipe();
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  return true;
}

void Process::Child() {
  close(pipe_fds_[0]);
  auto die = [this](ChildStep step, int err) {
    ChildError child_error{step, err};
    ssize_t written = write(pipe_fds_[1], &child_error, sizeof(child_error));
    (void)written;
    _exit(1);
  };

  // New session and process group, so that the whole tree can be killed and
  // we do not receive Ctrl-Cs from the terminal.
  if (setsid() == -1) die(kSetsid, errno);

  int stdin_fd = open(
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file.c_str(),
      O_RDONLY | O_CLOEXEC);
  if (stdin_fd == -1) die(kOpenStdin, errno);
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die(kOpenStdout, errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die(kOpenStderr, errno);
  }

  if (chdir(options_->root.c_str()) == -1) die(kChdir, errno);

  // Handle I/O redirection. dup2 clears FD_CLOEXEC on the new descriptor.
#define DUP(field, fd)                                                \
  if (field##_fd != -1 && dup2(field##_fd, fd) == -1) die(kRedirect, errno);
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                                          \
  {                                                                   \
    rlim_t lim = value;                                               \
    if (lim) {                                                        \
      rlim.rlim_cur = lim;                                            \
      rlim.rlim_max = lim;                                            \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) die(kRlimit, errno);    \
    }                                                                 \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die(kRlimit, errno);

  char** envp = env_.empty() ? environ : env_.data();
  int count = 0;
  do {
    execve(options_->executable.c_str(), args_.data(), envp);
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die(kExec, errno);
  _exit(1);
}

bool Process::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  ChildError child_error{};
  ssize_t num_read;
  do {
    num_read = read(pipe_fds_[0], &child_error, sizeof(child_error));
  } while (num_read == -1 && errno == EINTR);
  ClosePipe();
  if (num_read == sizeof(child_error)) {
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
    child_pid_ = 0;
    *error_msg = ErrnoMessage(kChildStepNames[child_error.step],
                              child_error.error);
    return false;
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  // The leader is not reaped until the rest of its group has been killed, so
  // that the group id cannot be reused in the meantime.
  bool has_exited = false;
  while (true) {
    siginfo_t status{};
    int ret = waitid(P_PID, child_pid_, &status, WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("waitid", errno);
      return false;
    }
    if (status.si_pid == child_pid_) {
      has_exited = true;
      break;
    }
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  info->killed = !has_exited;
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    PLOG(WARNING) << "kill " << -child_pid_;
  }

  int child_status = 0;
  struct rusage rusage {};
  while (wait4(child_pid_, &child_status, 0, &rusage) == -1) {
    if (errno == EINTR) continue;
    *error_msg = ErrnoMessage("wait4", errno);
    return false;
  }
  child_pid_ = 0;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  return true;
}

void Process::ClosePipe() {
  for (int& fd : pipe_fds_) {
    if (fd != -1) close(fd);
    fd = -1;
  }
}

Process::~Process() {
  ClosePipe();
  if (child_pid_ > 0) {
    kill(-child_pid_, SIGKILL);
    int child_status = 0;
    while (waitpid(child_pid_, &child_status, 0) == -1 && errno == EINTR) {
    }
  }
}

}  // namespace sandbox
