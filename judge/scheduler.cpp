#include "judge/scheduler.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include "glog/logging.h"
#include "judge/evaluator.hpp"

namespace {
const constexpr auto kStopGracePeriod = std::chrono::milliseconds(1000);
}  // namespace

namespace judge {

std::vector<proto::EvaluationRecord> Scheduler::Run(
    const std::vector<proto::Submission>& submissions) {
  next_submission_ = 0;
  records_.clear();
  if (submissions.empty()) return records_;
  size_t num_threads = config_.EffectiveConcurrency();
  if (num_threads > submissions.size()) num_threads = submissions.size();
  LOG(INFO) << "Evaluating " << submissions.size() << " submissions with "
            << num_threads << " workers";

  std::vector<std::thread> threads(num_threads);
  for (size_t i = 0; i < num_threads; i++)
    threads[i] = std::thread(
        std::bind(&Scheduler::ThreadBody, this, std::cref(submissions)));
  for (std::thread& thread : threads) thread.join();
  if (!stragglers_.empty()) {
    LOG(WARNING) << "Waiting for " << stragglers_.size()
                 << " evaluations that did not stop";
  }
  for (std::thread& thread : stragglers_) thread.join();
  stragglers_.clear();

  CHECK_EQ(records_.size(), submissions.size());
  return std::move(records_);
}

void Scheduler::ThreadBody(const std::vector<proto::Submission>& submissions) {
  while (true) {
    size_t index = 0;
    {
      std::lock_guard<std::mutex> lck(next_submission_mutex_);
      if (next_submission_ >= submissions.size()) return;
      index = next_submission_++;
    }
    const proto::Submission& submission = submissions[index];
    LOG(INFO) << "Evaluating " << submission.owner() << "/"
              << submission.task_id();
    proto::EvaluationRecord record = EvaluateWithTimeout(submission);
    LOG(INFO) << submission.owner() << "/" << submission.task_id() << ": "
              << proto::Classification_Name(record.classification());
    std::lock_guard<std::mutex> lck(records_mutex_);
    records_.push_back(std::move(record));
  }
}

proto::EvaluationRecord Scheduler::EvaluateWithTimeout(
    const proto::Submission& submission) {
  // Shared with the evaluation thread, which may outlive this call.
  auto stop = std::make_shared<std::atomic<bool>>(false);
  auto evaluator =
      std::make_shared<Evaluator>(config_, compiler_, catalog_, cell_);
  std::packaged_task<proto::EvaluationRecord()> task(
      [evaluator, submission, stop]() {
        return evaluator->Evaluate(submission, stop.get());
      });
  std::future<proto::EvaluationRecord> result = task.get_future();
  std::thread helper(std::move(task));

  if (result.wait_for(std::chrono::milliseconds(
          config_.submission_timeout_millis)) == std::future_status::ready) {
    helper.join();
    return result.get();
  }
  LOG(WARNING) << "Stopping " << submission.owner() << "/"
               << submission.task_id() << " after "
               << config_.submission_timeout_millis << "ms";
  *stop = true;

  proto::EvaluationRecord record;
  if (result.wait_for(kStopGracePeriod) == std::future_status::ready) {
    helper.join();
    record = result.get();
  } else {
    LOG(ERROR) << submission.owner() << "/" << submission.task_id()
               << " did not stop, releasing its worker";
    *record.mutable_submission() = submission;
    std::lock_guard<std::mutex> lck(stragglers_mutex_);
    stragglers_.push_back(std::move(helper));
  }
  record.set_classification(proto::TIMED_OUT);
  record.set_reason("submission time limit exceeded");
  record.set_representative_time_nanos(0);
  record.set_peak_memory_bytes(0);
  return record;
}

}  // namespace judge
