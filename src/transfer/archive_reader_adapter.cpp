#include "transfer/archive_reader_adapter.hpp"

#include "system/signals.hpp"

#include <cerrno>
#include <span>

namespace ingest {

ArchiveReaderAdapter::ArchiveReaderAdapter(IReader& reader, std::size_t buffer_size)
    : reader_(reader), buffer_(buffer_size) {}

int ArchiveReaderAdapter::Open(struct archive* ar) {
    return archive_read_open2(ar, this, nullptr, ReadCb, nullptr, nullptr);
}

la_ssize_t ArchiveReaderAdapter::ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    if (CancelRequested()) {
        archive_set_error(ar, ECANCELED, "cancelled");
        return -1;
    }

    auto* self = static_cast<ArchiveReaderAdapter*>(client_data);
    const ssize_t n = self->reader_.Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) {
        archive_set_error(ar, EIO, "read failed");
        return -1;
    }

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace ingest
