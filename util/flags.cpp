#include "util/flags.hpp"

DEFINE_int32(num_cores, 0,
             "Number of submissions to evaluate in parallel. If unset, "
             "autodetect");
DEFINE_int64(submission_timeout_ms, 60000,
             "Total time a single submission may take, compilation included");

DEFINE_int64(execution_timeout_ms, 10000, "Wall time limit of each test case");
DEFINE_int64(compile_timeout_ms, 30000, "Wall time limit of the compiler");
DEFINE_int64(memory_limit_kb, 64 * 1024,
             "Memory limit, checked against the peak usage over all the test "
             "cases");

DEFINE_string(compiler, "c++", "Compiler used for the submissions");
DEFINE_string(compiler_args, "-O2 -std=c++14 -DEVAL",
              "Space separated arguments passed to the compiler");

DEFINE_string(submissions_directory, "",
              "Where the submissions are. Defaults to <root>/submissions");
DEFINE_string(reports_directory, "",
              "Where the reports are written. Defaults to <root>/reports");
DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false, "Do not remove the sandbox directories");
DEFINE_string(test_locations, "tests,test-data,test_files,.",
              "Comma separated directories, relative to the root, that are "
              "searched for test cases. '.' is the root itself");
DEFINE_string(input_suffix, ".in", "Suffix of the test input files");
DEFINE_string(output_suffix, ".out", "Suffix of the expected output files");
DEFINE_string(source_suffix, ".cpp", "Suffix of the submission source files");
DEFINE_string(task, "", "If set, only the submissions for this task are run");
