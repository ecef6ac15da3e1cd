#include "tomo_preview/pipeline/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace tomo_preview::pipeline {

int resolve_worker_count(int requested, size_t task_count, int cap) {
  int workers = requested;
  if (workers < 1) {
    workers = static_cast<int>(std::thread::hardware_concurrency());
  }
  if (workers < 1) {
    workers = 1;
  }
  if (cap > 0) {
    workers = std::min(workers, cap);
  }
  if (task_count > 0) {
    workers = std::min(workers,
                       static_cast<int>(std::min<size_t>(task_count, 1u << 20)));
  }
  return std::max(1, workers);
}

std::vector<TaskFailure>
run_indexed_tasks(size_t count, int workers,
                  const std::function<void(size_t index, int worker)> &task,
                  const ProgressFn &progress) {
  std::vector<TaskFailure> failures;
  if (count == 0) {
    return failures;
  }
  workers = std::max(1, std::min(workers, static_cast<int>(std::min<size_t>(count, 1u << 20))));

  std::atomic<size_t> next{0};
  size_t done = 0; // guarded by progress_mutex
  std::mutex progress_mutex;
  std::mutex error_mutex;

  auto worker_loop = [&](int worker_id) {
    while (true) {
      const size_t i = next.fetch_add(1);
      if (i >= count) {
        break;
      }
      try {
        task(i, worker_id);
      } catch (const std::exception &e) {
        std::lock_guard<std::mutex> lock(error_mutex);
        failures.push_back({i, e.what()});
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        failures.push_back({i, "unknown_error"});
      }

      // Counted and reported under one lock so progress never goes backwards.
      std::lock_guard<std::mutex> lock(progress_mutex);
      ++done;
      if (progress) {
        progress(done, count);
      }
    }
  };

  if (workers > 1) {
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
      threads.emplace_back(worker_loop, w);
    }
    for (auto &t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  } else {
    worker_loop(0);
  }

  std::sort(failures.begin(), failures.end(),
            [](const TaskFailure &a, const TaskFailure &b) { return a.index < b.index; });
  return failures;
}

} // namespace tomo_preview::pipeline
