#pragma once

#include <atomic>

namespace ingest {

// Set by SIGINT/SIGTERM. Long-running I/O polls it and unwinds so scoped
// cleanup (workspace removal) still runs.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() {
    return g_cancel.load(std::memory_order_relaxed);
}

} // namespace ingest
