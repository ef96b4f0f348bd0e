#include "net/http_client.hpp"

#include <cctype>

namespace ingest {

namespace {

bool IEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string HttpResponse::Header(std::string_view name) const {
    for (const auto& h : headers) {
        if (IEquals(h.name, name)) return h.value;
    }
    return {};
}

} // namespace ingest
