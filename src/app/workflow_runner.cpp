#include <modelflow/app/workflow_runner.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace modelflow::app {

FitResult fit_workflow(const workflow::Workflow& w,
                       const data::Table& data,
                       PhaseTimingCallback* timing_cb) {
  return workflow::fit(w, data, timing_cb);
}

void fit_workflow_batch(const std::vector<workflow::Workflow>& workflows,
                        const data::Table& data,
                        FitResultCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < workflows.size(); ++i) {
    callback(i, workflow::fit(workflows[i], data));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void fit_workflow_batch_parallel(const std::vector<workflow::Workflow>& workflows,
                                 const data::Table& data,
                                 FitResultCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = workflows.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    fit_workflow_batch(workflows, data, std::move(callback));
    return;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= n) break;
      callback(idx, workflow::fit(workflows[idx], data));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace modelflow::app
