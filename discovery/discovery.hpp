#ifndef DISCOVERY_DISCOVERY_HPP
#define DISCOVERY_DISCOVERY_HPP

#include <string>
#include <vector>

#include "proto/submission.pb.h"

namespace discovery {

// Number of lines at the beginning of a source file that are searched for the
// header.
static const constexpr int kHeaderLines = 10;

// Extracts owner and task from a header comment of the form
//   /* USER: <owner> TASK: <task> */
// where owner and task are made of letters, digits and underscores. Returns
// false if none of the first kHeaderLines lines is a valid header.
bool ParseHeader(const std::string& content, std::string* owner,
                 std::string* task);

// Recursively finds the submissions in directory: the files ending in
// source_suffix that start with a valid header. Files without a header are
// skipped. If task is not empty, only the submissions for that task are
// returned. The result is sorted by path. Throws util::file_not_found if the
// directory does not exist.
std::vector<proto::Submission> Discover(const std::string& directory,
                                        const std::string& source_suffix,
                                        const std::string& task = "");

}  // namespace discovery

#endif
