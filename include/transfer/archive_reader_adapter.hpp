#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <string>
#include <vector>

namespace ingest {

// Feeds an IReader into libarchive's callback interface. The adapter must
// outlive the archive handle it was opened on.
class ArchiveReaderAdapter {
  public:
    explicit ArchiveReaderAdapter(IReader& reader, std::size_t buffer_size = 256 * 1024);

    int Open(struct archive* ar);

  private:
    static la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf);

    IReader& reader_;
    std::vector<std::uint8_t> buffer_;
};

std::string ArchiveErr(struct archive* ar);

} // namespace ingest
