#include "util/manifest.hpp"

namespace ingest {

std::string DerivePathPrefix(std::string_view url) {
    std::string_view rest = url;
    const auto scheme = rest.find("://");
    if (scheme != std::string_view::npos) {
        rest.remove_prefix(scheme + 3);
        const auto path_start = rest.find('/');
        if (path_start == std::string_view::npos) return {};
        rest.remove_prefix(path_start);
    }

    // Query and fragment are not part of the path.
    const auto cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);

    const auto last_slash = rest.rfind('/');
    if (last_slash == std::string_view::npos) return {};

    std::string_view dir = rest.substr(0, last_slash);
    if (!dir.empty() && dir.front() == '/') dir.remove_prefix(1);
    return std::string(dir);
}

std::string DestinationKey(std::string_view prefix, std::string_view unit_name) {
    if (prefix.empty()) return std::string(unit_name);
    std::string key(prefix);
    key.push_back('/');
    key.append(unit_name);
    return key;
}

std::string RunKeyFor(const ManifestEntry& entry) {
    return "nemo_manifest_" + entry.file_id;
}

} // namespace ingest
