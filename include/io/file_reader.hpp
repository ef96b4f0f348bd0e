#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace ingest {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Positional read; does not move the read cursor. Safe to call from
    // several threads on the same reader.
    ssize_t ReadAt(std::span<std::uint8_t> out, std::uint64_t offset) const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace ingest
