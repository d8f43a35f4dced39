#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "harness/harness.hpp"
#include "language/language.hpp"

namespace sandbox {

// Settings shared by all the executions of a sandbox.
struct SandboxConfig {
  // Where the private directories of the executions are created.
  std::string temp_directory = "/tmp/code-runner";
  // "auto", or the name of the sandbox to use.
  std::string backend = "auto";
  std::string container_runtime = "docker";
  int64_t memory_limit_kb = 512 * 1024;
  int32_t max_processes = 64;
  // Limit on each of the captured streams.
  int64_t max_output_kb = 8192;
  bool keep_sandboxes = false;
};

// Outcome of a program that was started.
struct RunResult {
  std::string stdout_data;
  std::string stderr_data;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The program was killed because it reached the deadline.
  bool timed_out = false;
  // stdout was longer than max_output_kb and was cut there.
  bool stdout_truncated = false;
  int64_t wall_time_millis = 0;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// kName constant and the Create and Score static functions. Create should
// return a pointer to a newly allocated instance of the given implementation,
// while Score should return a value that defines how "good" that sandbox is:
// negative if the sandbox cannot be used in the current configuration,
// positive otherwise (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*(const SandboxConfig&)>;
  using score_t = std::function<int(const SandboxConfig&)>;

  // Returns the best usable sandbox, or the one named by config.backend if it
  // is not "auto". Returns nullptr if none can be used. If available is not
  // null, it is filled with the names of all the usable sandboxes. Scores are
  // computed once per call, so this probes the host.
  static std::unique_ptr<Sandbox> Create(
      const SandboxConfig& config,
      std::vector<std::string>* available = nullptr);

  virtual const char* Name() const = 0;

  // Whether this sandbox has what it needs to run code in the language.
  virtual bool CanRun(const language::Language& language) const = 0;

  // Materializes the harness in a private directory and runs the compile and
  // run command of the language, killing it after deadline_millis. Returns
  // true if the program was started, and sets fields in result. Otherwise,
  // returns false and sets error_msg. The private directory, and any other
  // resource the execution needs, is released before returning.
  // Implementations must be thread safe.
  virtual bool Execute(const language::Language& language,
                       const harness::Harness& harness, int64_t deadline_millis,
                       RunResult* result, std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(T::kName, &T::Create, &T::Score); }
  };

 private:
  struct Entry {
    std::string name;
    create_t create;
    score_t score;
  };
  using store_t = std::vector<Entry>;
  static store_t* Boxes_();
  static void Register_(const char* name, create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
