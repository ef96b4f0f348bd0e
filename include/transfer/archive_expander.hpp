#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ingest {

// True for names the pipeline unpacks: .tar, .tar.gz and .tgz.
bool IsArchiveName(std::string_view name);

// Decompresses a gzip file into `dst`. `dst` is removed on failure.
Result GunzipFile(const std::string& src, const std::string& dst);

class ArchiveExpander {
  public:
    struct Options {
        // Replace `*.gz` members by their decompressed sibling.
        bool gunzip_members = true;
        std::size_t read_buffer_bytes = 256 * 1024;
    };

    ArchiveExpander() = default;
    explicit ArchiveExpander(const Options& opt) : opt_(opt) {}

    // Extracts every regular-file member under `output_dir` and returns their
    // relative names in archive order. Directory members are created but not
    // listed; links and special files are skipped. Nested archives are left
    // as they are.
    Result Expand(const std::string& archive_path,
                  const std::string& output_dir,
                  std::vector<std::string>& out_names) const;

  private:
    Result ExtractMembers(const std::string& archive_path,
                          const std::string& output_dir,
                          std::vector<std::string>& out_names) const;

    Options opt_{};
};

} // namespace ingest
