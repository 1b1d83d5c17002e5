#include "report/report.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"

namespace {

const std::string kRule(80, '=');

std::string FormatMillis(uint64_t nanos) {
  if (nanos == 0) return "N/A";
  return absl::StrFormat("%.2f", nanos / 1e6);
}

std::string FormatMemory(uint64_t bytes) {
  if (bytes == 0) return "N/A";
  return absl::StrFormat("%.2f", bytes / 1024.0 / 1024.0);
}

bool IsPassed(const proto::EvaluationRecord& record) {
  return record.classification() == proto::PASSED;
}

}  // namespace

namespace report {

std::vector<proto::EvaluationRecord> Sort(
    std::vector<proto::EvaluationRecord> records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const proto::EvaluationRecord& a,
                      const proto::EvaluationRecord& b) {
                     if (IsPassed(a) != IsPassed(b)) return IsPassed(a);
                     return a.representative_time_nanos() <
                            b.representative_time_nanos();
                   });
  return records;
}

std::string TextReport(const std::vector<proto::EvaluationRecord>& records,
                       absl::Time now, absl::TimeZone tz) {
  std::map<proto::Classification, size_t> counts;
  uint64_t total_time = 0;
  uint64_t total_memory = 0;
  for (const proto::EvaluationRecord& record : records) {
    counts[record.classification()]++;
    if (IsPassed(record)) {
      total_time += record.representative_time_nanos();
      total_memory += record.peak_memory_bytes();
    }
  }

  std::string out;
  absl::StrAppend(&out, kRule, "\n", "SUBMISSION TEST REPORT\n", "Generated: ",
                  absl::FormatTime("%Y-%m-%d %H:%M:%S", now, tz), "\n", kRule,
                  "\n\n");

  absl::StrAppend(&out, "SUMMARY STATISTICS\n", std::string(40, '-'), "\n");
  absl::StrAppendFormat(&out, "Total submissions: %d\n", records.size());
  absl::StrAppendFormat(&out, "Successful: %d\n", counts[proto::PASSED]);
  absl::StrAppendFormat(&out, "Failed: %d\n", counts[proto::FAILED]);
  absl::StrAppendFormat(&out, "Compilation errors: %d\n",
                        counts[proto::COMPILE_ERROR]);
  absl::StrAppendFormat(&out, "Runtime errors: %d\n",
                        counts[proto::RUNTIME_ERROR]);
  absl::StrAppendFormat(&out, "Timeouts: %d\n\n", counts[proto::TIMED_OUT]);

  size_t passed = counts[proto::PASSED];
  if (passed > 0) {
    double avg_time = static_cast<double>(total_time) / passed;
    double avg_memory = static_cast<double>(total_memory) / passed;
    absl::StrAppend(&out,
                    "PERFORMANCE STATISTICS (Successful Submissions Only)\n",
                    std::string(50, '-'), "\n");
    absl::StrAppendFormat(&out, "Average execution time: %.2f ms (%.0f ns)\n",
                          avg_time / 1e6, avg_time);
    absl::StrAppendFormat(&out, "Average memory usage: %.2f KB\n\n",
                          avg_memory / 1024);
  }

  absl::StrAppend(&out, "DETAILED RESULTS\n", std::string(40, '-'), "\n");
  absl::StrAppendFormat(&out, "%-20s | %-15s | %-15s | %-10s | %-10s | %-8s\n",
                        "User", "Task", "Result", "Time (ms)", "Memory (MB)",
                        "Compiled");
  for (const proto::EvaluationRecord& record : Sort(records)) {
    absl::StrAppendFormat(
        &out, "%-20s | %-15s | %-15s | %-10s | %-10s | %-8s",
        record.submission().owner(), record.submission().task_id(),
        proto::Classification_Name(record.classification()),
        FormatMillis(record.representative_time_nanos()),
        FormatMemory(record.peak_memory_bytes()),
        record.compiled() ? "YES" : "NO");
    if (!IsPassed(record) && !record.reason().empty()) {
      const std::string& reason = record.reason();
      absl::StrAppend(&out, " | ", reason.substr(0, reason.find('\n')));
    }
    out += '\n';
  }

  absl::StrAppend(&out, "\nLEGEND\n", std::string(20, '-'), "\n",
                  "Time: Mean execution time in milliseconds (ms)\n",
                  "Memory: Peak memory usage in megabytes (MB)\n",
                  "Compiled: Whether compilation was successful\n");
  return out;
}

std::string Leaderboard(const std::vector<proto::EvaluationRecord>& records) {
  std::string out =
      "Rank,Username,Task,Execution Time (ns),Memory Usage (KB),Compilation "
      "Success\n";
  int rank = 0;
  for (const proto::EvaluationRecord& record : Sort(records)) {
    if (!IsPassed(record)) break;
    absl::StrAppendFormat(&out, "%d,%s,%s,%d,%.2f,%s\n", ++rank,
                          record.submission().owner(),
                          record.submission().task_id(),
                          record.representative_time_nanos(),
                          record.peak_memory_bytes() / 1024.0,
                          record.compiled() ? "YES" : "NO");
  }
  return out;
}

std::string JsonReport(const std::vector<proto::EvaluationRecord>& records) {
  proto::EvaluationReport report;
  for (const proto::EvaluationRecord& record : Sort(records))
    *report.add_records() = record;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.always_print_enums_as_ints = false;
  std::string out;
  auto status =
      google::protobuf::util::MessageToJsonString(report, &out, options);
  if (!status.ok()) {
    throw std::runtime_error(
        absl::StrCat("Cannot serialize the report: ", status.ToString()));
  }
  return out;
}

ReportFiles WriteReports(const std::vector<proto::EvaluationRecord>& records,
                         const std::string& directory, absl::Time now,
                         absl::TimeZone tz) {
  std::string timestamp = absl::FormatTime("%Y%m%d_%H%M%S", now, tz);
  ReportFiles files;
  files.text = util::File::JoinPath(
      directory, absl::StrCat("submission_report_", timestamp, ".txt"));
  files.leaderboard = util::File::JoinPath(
      directory, absl::StrCat("leaderboard_", timestamp, ".csv"));
  files.json = util::File::JoinPath(
      directory, absl::StrCat("results_", timestamp, ".json"));

  util::File::MakeDirs(directory);
  util::File::Write(files.text, TextReport(records, now, tz), true);
  util::File::Write(files.leaderboard, Leaderboard(records), true);
  util::File::Write(files.json, JsonReport(records), true);
  LOG(INFO) << "Reports written to " << files.text << ", "
            << files.leaderboard << " and " << files.json;
  return files;
}

}  // namespace report
