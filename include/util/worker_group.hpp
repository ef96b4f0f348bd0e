#pragma once

#include <functional>
#include <thread>

namespace ingest {

using ThreadStarter = std::function<std::thread(const std::function<void()>&)>;

std::thread StartThread(const std::function<void()>& fn);

// Runs `count` copies of `worker` and joins them. Workers are expected to pull
// from a shared queue, so fewer threads still drain it: a thread that fails to
// start is logged and skipped, and if none start the worker runs on the
// calling thread. Returns the number of threads actually started.
int RunWorkers(int count, const std::function<void()>& worker, const ThreadStarter& start = StartThread);

} // namespace ingest
