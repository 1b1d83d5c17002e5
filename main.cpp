#include <iostream>
#include <stdexcept>
#include <system_error>

#include "absl/time/clock.h"
#include "discovery/discovery.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "judge/compiler.hpp"
#include "judge/configuration.hpp"
#include "judge/execution_cell.hpp"
#include "judge/scheduler.hpp"
#include "judge/test_catalog.hpp"
#include "report/report.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Grades C++ submissions.\nUsage: " +
                          std::string(argv[0]) + " [flags] <root-directory>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (argc != 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "util/flags");
    return 1;
  }
  const std::string root = argv[1];
  std::string submissions_directory = FLAGS_submissions_directory.empty()
                                          ? root + "/submissions"
                                          : FLAGS_submissions_directory;
  std::string reports_directory = FLAGS_reports_directory.empty()
                                      ? root + "/reports"
                                      : FLAGS_reports_directory;

  judge::Configuration config = judge::Configuration::FromFlags(root);
  std::vector<proto::Submission> submissions;
  try {
    config.Validate();
    submissions = discovery::Discover(submissions_directory,
                                      FLAGS_source_suffix, FLAGS_task);
  } catch (const std::invalid_argument& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return 1;
  } catch (const std::system_error& exc) {
    LOG(ERROR) << exc.what();
    return 1;
  }
  if (submissions.empty()) LOG(WARNING) << "No submissions found";

  judge::Compiler compiler(config);
  judge::TestCatalog catalog(config);
  judge::ExecutionCell cell(config);
  judge::Scheduler scheduler(config, &compiler, &catalog, &cell);
  std::vector<proto::EvaluationRecord> records = scheduler.Run(submissions);

  absl::Time now = absl::Now();
  std::cout << report::TextReport(records, now) << std::flush;
  try {
    report::WriteReports(records, reports_directory, now);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Cannot write the reports: " << exc.what();
  }
  return 0;
}
