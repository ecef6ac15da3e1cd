#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tomo_preview::pipeline {

struct TaskFailure {
  size_t index;
  std::string message;
};

using ProgressFn = std::function<void(size_t done, size_t total)>;

// Worker count for `task_count` tasks: `requested` (0 = hardware threads),
// capped by `cap` when > 0 and by the task count, at least 1.
int resolve_worker_count(int requested, size_t task_count, int cap = 0);

// Runs task(index, worker) for every index in [0, count) on `workers`
// threads. Indices are handed out in increasing order; completion order is
// unspecified. A throwing task does not stop the others. Failures are
// returned sorted by index. `progress` calls are serialized.
std::vector<TaskFailure>
run_indexed_tasks(size_t count, int workers,
                  const std::function<void(size_t index, int worker)> &task,
                  const ProgressFn &progress = {});

} // namespace tomo_preview::pipeline
