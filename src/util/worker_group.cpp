#include "util/worker_group.hpp"

#include "util/logger.hpp"

#include <system_error>
#include <vector>

namespace ingest {

std::thread StartThread(const std::function<void()>& fn) {
    return std::thread(fn);
}

int RunWorkers(int count, const std::function<void()>& worker, const ThreadStarter& start) {
    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(count > 0 ? count : 0));
    for (int i = 0; i < count; ++i) {
        try {
            pool.push_back(start(worker));
        } catch (const std::system_error& e) {
            LogWarn("started %zu of %d worker threads: %s", pool.size(), count, e.what());
            break;
        }
    }

    if (pool.empty() && count > 0) {
        worker();
    }
    for (auto& t : pool) t.join();
    return static_cast<int>(pool.size());
}

} // namespace ingest
