#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ingest {

inline constexpr std::int64_t kUnknownSize = -1;

// One manifest row: the unit of work for a transfer pipeline run.
struct ManifestEntry {
    std::string file_id;
    std::string source_url;
    std::string expected_checksum; // lowercase hex MD5
    std::int64_t expected_size = kUnknownSize; // advisory only
    std::string sample_id;
    std::string destination_prefix;

    bool operator==(const ManifestEntry&) const = default;
};

// URL path without the final segment and without the leading '/'.
// "https://host/a/b/c/file.ext" -> "a/b/c", "https://host/file.ext" -> "".
std::string DerivePathPrefix(std::string_view url);

// Object key for a file published under an entry's prefix.
std::string DestinationKey(std::string_view prefix, std::string_view unit_name);

// Deduplication key an orchestrator uses for one entry.
std::string RunKeyFor(const ManifestEntry& entry);

} // namespace ingest
