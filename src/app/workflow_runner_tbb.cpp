#include <modelflow/app/workflow_runner_tbb.hpp>
#include <modelflow/workflow/fit.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#ifdef MODELFLOW_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace modelflow::app {

void fit_workflows_tbb(
    const std::vector<std::pair<std::string, workflow::Workflow>>& work_items,
    const data::Table& data,
    FitResultCallbackWithId callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&work_items, &data, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& id = work_items[i].first;
          auto result = workflow::fit(work_items[i].second, data);
          callback(result, id);
        }
      });
}

}  // namespace modelflow::app

#endif  // MODELFLOW_HAS_TBB
