#include "util/flags.hpp"

DEFINE_int32(time_budget_ms, 5000,
             "Wall clock budget of a single sandbox execution");
DEFINE_int32(max_payload_bytes, 64 * 1024,
             "Maximum size of each of the markup, style and script payloads");
DEFINE_string(runtime_path, "gradebox_runtime",
              "Sandbox runtime binary. Looked up in PATH if not absolute");
DEFINE_string(temp_directory, "/tmp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove sandbox directories after the execution");

DEFINE_int64(sandbox_memory_kb, 256 * 1024,
             "Address space limit of the sandboxed runtime");
DEFINE_int32(sandbox_max_files, 16,
             "Maximum number of open files in the sandbox");
DEFINE_int32(sandbox_max_procs, 0,
             "Maximum number of processes of the sandbox user, 0 to disable");
DEFINE_int64(sandbox_stack_kb, 64 * 1024, "Stack limit of the sandbox");
DEFINE_bool(sandbox_isolate_network, false,
            "Run the sandbox in a new user and network namespace");

DEFINE_int32(progress_upsert_retries, 5,
             "How many times a conflicting progress update is retried");
DEFINE_string(store_directory, "store", "Where attempts and progress live");
DEFINE_string(battery_directory, "batteries",
              "Where test batteries are read from");
