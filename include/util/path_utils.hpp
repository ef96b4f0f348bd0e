#pragma once

#include <string>
#include <string_view>

namespace ingest {

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Final path segment; the whole string when there is no '/'.
inline std::string BaseName(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    const auto pos = path.rfind('/');
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

// Normalize a tar member path:
// - strip leading "./"
// - collapse duplicate slashes
// - drop a trailing "/" (directory members)
// A leading "/" is kept so absolute members can be rejected.
inline std::string NormalizeTarPath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

} // namespace ingest
