#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace ingest {

// Scoped scratch directory. Everything below Dir() is removed when the
// workspace is destroyed, whichever way the owning scope exits.
class Workspace {
  public:
    Workspace() = default;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    ~Workspace();

    // Creates `<scratch_root>/<prefix>XXXXXX`; scratch_root is created if missing.
    static Result Create(std::string_view scratch_root, std::string_view prefix, Workspace& out);

    // Removes the directory now and reports failures.
    Result Remove();

    const std::string& Dir() const { return dir_; }
    std::string PathFor(std::string_view name) const;

  private:
    void Cleanup() noexcept;

    std::string dir_;
};

} // namespace ingest
