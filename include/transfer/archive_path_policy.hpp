#pragma once

#include "util/result.hpp"

#include <string>

namespace ingest {

// Maps raw archive member names onto safe paths relative to the output root.
class ArchivePathPolicy {
  public:
    // Empty result (or ".") means the entry names the root itself.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace ingest
