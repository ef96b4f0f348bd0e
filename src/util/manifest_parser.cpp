#include "util/manifest_parser.hpp"

#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace ingest {

namespace {

std::vector<std::string> SplitTabs(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const auto tab = line.find('\t', start);
        if (tab == std::string::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return out;
}

void StripCr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

std::int64_t ParseSize(const std::string& s) {
    std::int64_t v = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto r = std::from_chars(first, last, v);
    if (r.ec != std::errc() || r.ptr != last || s.empty()) return kUnknownSize;
    return v;
}

} // namespace

std::expected<ParsedManifest, std::string> ManifestParser::ParseTsv(const std::string& text) const {
    std::istringstream is(text);
    std::string line;

    if (!std::getline(is, line)) {
        return std::unexpected("Empty manifest");
    }
    StripCr(line);
    // Tolerate a UTF-8 byte order mark on the header.
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) line.erase(0, 3);

    std::unordered_map<std::string, size_t> col;
    const auto header = SplitTabs(line);
    for (size_t i = 0; i < header.size(); ++i) {
        col.emplace(header[i], i);
    }
    if (!col.contains("file_id") || !col.contains("urls")) {
        return std::unexpected("Manifest header must contain 'file_id' and 'urls' columns");
    }

    auto field = [&col](const std::vector<std::string>& row,
                        const char* name) -> std::optional<std::string> {
        auto it = col.find(name);
        if (it == col.end() || it->second >= row.size()) return std::nullopt;
        return row[it->second];
    };

    ParsedManifest out;
    while (std::getline(is, line)) {
        StripCr(line);
        if (line.empty()) continue;

        const auto row = SplitTabs(line);
        const auto file_id = field(row, "file_id");
        const auto url = field(row, "urls");
        if (!file_id || file_id->empty() || !url || url->empty()) {
            ++out.skipped_rows;
            continue;
        }

        ManifestEntry e;
        e.file_id = *file_id;
        e.source_url = *url;
        e.expected_checksum = field(row, "md5").value_or("NA");
        e.expected_size = ParseSize(field(row, "size").value_or(""));
        e.sample_id = field(row, "sample_id").value_or("");
        e.destination_prefix = DerivePathPrefix(e.source_url);
        out.entries.push_back(std::move(e));
    }

    return out;
}

std::expected<ParsedManifest, std::string>
ManifestParser::ParseTsvFile(const std::string& path) const {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return std::unexpected("cannot open manifest: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    return ParseTsv(text);
}

} // namespace ingest
