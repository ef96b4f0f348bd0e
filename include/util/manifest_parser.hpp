#pragma once

#include "util/manifest.hpp"

#include <expected>
#include <string>
#include <vector>

namespace ingest {

struct ParsedManifest {
    std::vector<ManifestEntry> entries;
    std::size_t skipped_rows = 0;
};

// Tab-separated manifest with a header row naming at least `file_id` and
// `urls`; `md5`, `size` and `sample_id` are optional columns.
class ManifestParser {
  public:
    std::expected<ParsedManifest, std::string> ParseTsv(const std::string& text) const;
    std::expected<ParsedManifest, std::string> ParseTsvFile(const std::string& path) const;
};

} // namespace ingest
