#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/code-runner",
              "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the sandbox directories after the execution");

DEFINE_string(backend, "auto",
              "Sandbox backend to use: auto, container or local. auto prefers "
              "the container runtime when it is reachable");
DEFINE_string(container_runtime, "docker", "Container runtime command");

DEFINE_int32(default_timeout, 10,
             "Timeout in seconds for requests that do not specify one");
DEFINE_int32(max_timeout, 30,
             "Upper bound in seconds on the timeout of any request");
DEFINE_int32(max_concurrent_executions, 0,
             "Number of executions that may run at the same time. If unset, "
             "autodetect");
DEFINE_int32(memory_limit_mb, 512, "Memory limit of each execution");
DEFINE_int32(max_processes, 64, "Process limit of each execution");
DEFINE_int32(max_output_kb, 8192,
             "Maximum size of the output of each execution");
