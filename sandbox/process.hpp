#ifndef SANDBOX_PROCESS_HPP
#define SANDBOX_PROCESS_HPP

#include <stdint.h>

#include <string>
#include <vector>

namespace sandbox {

// Settings to execute a program.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;

  // Environment of the program. If empty, the environment of the current
  // process is inherited.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // Whether the program was killed because it exceeded the wall limit.
  bool killed = false;
};

// Runs a program in a new session, so that it and all of its descendants can
// be killed as a process group. A Process object runs a single program and is
// not thread safe; concurrent executions use distinct objects.
class Process {
 public:
  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg);

  Process() = default;
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  ~Process();

 private:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates the child process and saves its PID in child_pid_.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Must only use
  // async-signal-safe functions.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process group if it
  // exceeds the wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  void ClosePipe();

  int pipe_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // argv and envp of the child, built before forking.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
  std::vector<std::vector<char>> env_storage_;
  std::vector<char*> env_;
};

}  // namespace sandbox
#endif
