#ifndef REPORT_REPORT_HPP
#define REPORT_REPORT_HPP

#include <string>
#include <vector>

#include "absl/time/time.h"
#include "proto/evaluation.pb.h"

namespace report {

// Orders records for reporting: passed submissions first, then by
// representative time. The sort is stable.
std::vector<proto::EvaluationRecord> Sort(
    std::vector<proto::EvaluationRecord> records);

// Human readable report with summary, performance statistics and one line
// per submission.
std::string TextReport(const std::vector<proto::EvaluationRecord>& records,
                       absl::Time now,
                       absl::TimeZone tz = absl::LocalTimeZone());

// CSV leaderboard of the passed submissions, fastest first.
std::string Leaderboard(const std::vector<proto::EvaluationRecord>& records);

// All the records, as an EvaluationReport in the protobuf JSON format.
std::string JsonReport(const std::vector<proto::EvaluationRecord>& records);

struct ReportFiles {
  std::string text;
  std::string leaderboard;
  std::string json;
};

// Writes the three reports in directory, creating it if needed. The file
// names contain the timestamp of now. Throws std::system_error on I/O errors.
ReportFiles WriteReports(const std::vector<proto::EvaluationRecord>& records,
                         const std::string& directory, absl::Time now,
                         absl::TimeZone tz = absl::LocalTimeZone());

}  // namespace report

#endif
