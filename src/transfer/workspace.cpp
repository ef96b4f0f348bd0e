#include "transfer/workspace.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace ingest {

Workspace::Workspace(Workspace&& other) noexcept : dir_(std::move(other.dir_)) {
    other.dir_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this == &other) return *this;
    Cleanup();
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    return *this;
}

Workspace::~Workspace() {
    Cleanup();
}

Result Workspace::Create(std::string_view scratch_root, std::string_view prefix, Workspace& out) {
    if (scratch_root.empty()) {
        return Result::Fail(ErrorKind::Config, EINVAL, "scratch root is empty");
    }

    const fs::path base(scratch_root);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create scratch root " + base.string() + ": " + ec.message());
    }

    std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    char* created = ::mkdtemp(buf.data());
    if (!created) {
        return Result::Fail(errno, "mkdtemp failed: " + std::string(std::strerror(errno)));
    }

    out = Workspace();
    out.dir_ = created;
    LogDebug("workspace created: %s", out.dir_.c_str());
    return Result::Ok();
}

Result Workspace::Remove() {
    if (dir_.empty()) return Result::Ok();

    std::error_code ec;
    fs::remove_all(fs::path(dir_), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot remove workspace " + dir_ + ": " + ec.message());
    }
    LogDebug("workspace removed: %s", dir_.c_str());
    dir_.clear();
    return Result::Ok();
}

std::string Workspace::PathFor(std::string_view name) const {
    return (fs::path(dir_) / fs::path(name)).string();
}

void Workspace::Cleanup() noexcept {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(fs::path(dir_), ec);
    if (ec) {
        LogWarn("failed to remove workspace %s: %s", dir_.c_str(), ec.message().c_str());
    }
    dir_.clear();
}

} // namespace ingest
