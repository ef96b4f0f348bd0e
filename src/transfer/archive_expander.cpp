#include "transfer/archive_expander.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "system/signals.hpp"
#include "transfer/archive_path_policy.hpp"
#include "transfer/archive_reader_adapter.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <unistd.h>

namespace ingest {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

Result ArchiveFail(const std::string& msg) {
    if (CancelRequested()) {
        return Result::Fail(ErrorKind::Cancelled, ECANCELED, "extraction cancelled");
    }
    return Result::Fail(ErrorKind::Archive, EIO, msg);
}

} // namespace

bool IsArchiveName(std::string_view name) {
    return EndsWith(name, ".tar") || EndsWith(name, ".tar.gz") || EndsWith(name, ".tgz");
}

Result GunzipFile(const std::string& src, const std::string& dst) {
    auto source = std::make_unique<FileReader>();
    auto r = FileReader::Open(src, *source);
    if (!r.is_ok()) return r;

    std::unique_ptr<GzipReader> gz;
    try {
        gz = std::make_unique<GzipReader>(std::move(source));
    } catch (const std::exception& e) {
        return Result::Fail(ErrorKind::Archive, EIO, std::string("gzip init failed: ") + e.what());
    }

    FileWriter out;
    r = FileWriter::Open(dst, out);
    if (!r.is_ok()) return r;

    std::array<std::uint8_t, 256 * 1024> buf{};
    while (true) {
        if (CancelRequested()) {
            r = Result::Fail(ErrorKind::Cancelled, ECANCELED, "decompression cancelled");
            break;
        }
        const ssize_t n = gz->Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            r = Result::Fail(ErrorKind::Archive, EIO, "gzip decompression failed: " + src);
            break;
        }
        r = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.is_ok()) break;
    }
    if (r.is_ok()) r = out.FsyncNow();
    if (r.is_ok()) r = out.Close();

    if (!r.is_ok()) {
        if (::unlink(dst.c_str()) != 0 && errno != ENOENT) {
            LogWarn("failed to remove %s: %s", dst.c_str(), std::strerror(errno));
        }
        return r;
    }
    return Result::Ok();
}

Result ArchiveExpander::Expand(const std::string& archive_path,
                               const std::string& output_dir,
                               std::vector<std::string>& out_names) const {
    out_names.clear();

    auto r = ExtractMembers(archive_path, output_dir, out_names);
    if (!r.is_ok()) return r;

    if (!opt_.gunzip_members) return Result::Ok();

    namespace fs = std::filesystem;
    for (auto& name : out_names) {
        if (!EndsWith(name, ".gz") || BaseName(name).size() <= 3) continue;

        const std::string plain = name.substr(0, name.size() - 3);
        const std::string src = (fs::path(output_dir) / name).string();
        const std::string dst = (fs::path(output_dir) / plain).string();

        std::error_code ec;
        if (std::find(out_names.begin(), out_names.end(), plain) != out_names.end() ||
            fs::exists(dst, ec) || ec) {
            return Result::Fail(ErrorKind::Archive, EEXIST,
                                "decompressed name collides with member " + plain);
        }

        LogInfo("decompressing %s", name.c_str());
        r = GunzipFile(src, dst);
        if (!r.is_ok()) {
            if (r.kind == ErrorKind::Io) r.kind = ErrorKind::Archive;
            return r.Wrap("decompress " + name);
        }
        if (::unlink(src.c_str()) != 0) {
            return Result::Fail(errno, "cannot remove " + src + ": " + std::strerror(errno));
        }
        name = plain;
    }
    return Result::Ok();
}

Result ArchiveExpander::ExtractMembers(const std::string& archive_path,
                                       const std::string& output_dir,
                                       std::vector<std::string>& out_names) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(output_dir);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorKind::Io, ENOTDIR, "Destination path is not a directory: " + output_dir);
    }

    FileReader file;
    auto r = FileReader::Open(archive_path, file);
    if (!r.is_ok()) return r;

    // Declared before the archive handle so it outlives it.
    ArchiveReaderAdapter adapter(file, opt_.read_buffer_bytes);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return ArchiveFail("archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_tar(ar.get());

    if (adapter.Open(ar.get()) != ARCHIVE_OK) {
        return ArchiveFail("archive_read_open2: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return ArchiveFail("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under output_dir, so
    // NOABSOLUTEPATHS would reject every target.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy;
    archive_entry* entry = nullptr;

    while (true) {
        const int rh = archive_read_next_header(ar.get(), &entry);
        if (rh == ARCHIVE_EOF) break;
        if (rh == ARCHIVE_WARN) {
            LogWarn("%s: %s", archive_path.c_str(), ArchiveErr(ar.get()).c_str());
        } else if (rh != ARCHIVE_OK) {
            return ArchiveFail("archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;

        const auto type = archive_entry_filetype(entry);
        const bool is_dir = (type == AE_IFDIR);
        const bool is_file = (type == AE_IFREG) && archive_entry_hardlink(entry) == nullptr;

        if (rel.empty() || rel == "." || (!is_dir && !is_file)) {
            if (!rel.empty() && rel != ".") LogDebug("skipping non-regular member %s", rel.c_str());
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return ArchiveFail("archive_read_data_skip: " + ArchiveErr(ar.get()));
            }
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());
        // Scratch copies must stay readable and removable by this process.
        if (is_dir) {
            archive_entry_set_perm(entry, 0755);
        } else {
            archive_entry_set_perm(entry, archive_entry_perm(entry) | 0600);
        }

        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return ArchiveFail("archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return ArchiveFail("archive_read_data_block: " + ArchiveErr(ar.get()));

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return ArchiveFail("archive_write_data_block: " + ArchiveErr(aw.get()));
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return ArchiveFail("archive_write_finish_entry: " + ArchiveErr(aw.get()));

        if (is_file) out_names.push_back(rel);
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return ArchiveFail("archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogInfo("extracted %zu files from %s", out_names.size(), archive_path.c_str());
    return Result::Ok();
}

} // namespace ingest
