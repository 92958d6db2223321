#include "score/parallel.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

namespace triage::score {
namespace {

struct JoinAll {
  std::vector<std::thread>& threads;

  ~JoinAll() {
    for (auto& thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }
};

}  // namespace

std::thread spawn_thread(std::function<void()> task) {
  return std::thread(std::move(task));
}

std::size_t run_chunked(const std::size_t total, const std::size_t workers, const ChunkWork& work,
                        const ThreadSpawner& spawn) {
  const std::size_t thread_count = std::min(workers, total);
  if (thread_count <= 1) {
    if (total > 0) {
      work(0, total);
    }
    return 0;
  }

  const std::size_t chunk = (total + thread_count - 1) / thread_count;
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  JoinAll join_all{threads};

  std::size_t begin = 0;
  try {
    for (; begin < total; begin += chunk) {
      const std::size_t end = std::min(begin + chunk, total);
      threads.push_back(spawn([&work, begin, end]() { work(begin, end); }));
    }
  } catch (const std::system_error&) {
    // Out of threads: the remaining chunks run below on this thread.
  }

  for (; begin < total; begin += chunk) {
    work(begin, std::min(begin + chunk, total));
  }

  const std::size_t started = threads.size();
  for (auto& thread : threads) {
    thread.join();
  }
  return started;
}

}  // namespace triage::score
