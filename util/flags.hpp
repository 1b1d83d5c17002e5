#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Scheduling
DECLARE_int32(num_cores);
DECLARE_int64(submission_timeout_ms);

// Limits
DECLARE_int64(execution_timeout_ms);
DECLARE_int64(compile_timeout_ms);
DECLARE_int64(memory_limit_kb);

// Toolchain
DECLARE_string(compiler);
DECLARE_string(compiler_args);

// Layout
DECLARE_string(submissions_directory);
DECLARE_string(reports_directory);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_string(test_locations);
DECLARE_string(input_suffix);
DECLARE_string(output_suffix);
DECLARE_string(source_suffix);
DECLARE_string(task);

#endif
