#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Execution.
DECLARE_int32(time_budget_ms);
DECLARE_int32(max_payload_bytes);
DECLARE_string(runtime_path);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

// Sandbox resource limits.
DECLARE_int64(sandbox_memory_kb);
DECLARE_int32(sandbox_max_files);
DECLARE_int32(sandbox_max_procs);
DECLARE_int64(sandbox_stack_kb);
DECLARE_bool(sandbox_isolate_network);

// Persistence and content.
DECLARE_int32(progress_upsert_retries);
DECLARE_string(store_directory);
DECLARE_string(battery_directory);

#endif
