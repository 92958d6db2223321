#pragma once

#include <cstddef>
#include <functional>
#include <thread>

namespace triage::score {

using ChunkWork = std::function<void(std::size_t begin, std::size_t end)>;
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

std::thread spawn_thread(std::function<void()> task);

// Splits [0, total) into at most `workers` contiguous chunks and runs each on
// its own thread. A chunk whose thread cannot be started (spawn throws
// std::system_error) runs on the calling thread instead, together with every
// chunk after it. All started threads are joined before returning, including
// on exceptions. Returns how many chunks ran on worker threads.
std::size_t run_chunked(std::size_t total, std::size_t workers, const ChunkWork& work,
                        const ThreadSpawner& spawn = spawn_thread);

}  // namespace triage::score
