#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

DECLARE_string(backend);
DECLARE_string(container_runtime);

DECLARE_int32(default_timeout);
DECLARE_int32(max_timeout);
DECLARE_int32(max_concurrent_executions);
DECLARE_int32(memory_limit_mb);
DECLARE_int32(max_processes);
DECLARE_int32(max_output_kb);

#endif
