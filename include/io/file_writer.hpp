#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace ingest {

// Truncating writer for a regular file.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace ingest
