#include "store/s3_signer.hpp"

#include "crypto/digest.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>
#include <vector>

namespace ingest {

namespace {

struct ParsedUrl {
    std::string authority;
    std::string path;  // begins with '/'
    std::string query; // without leading '?'
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl pu;
    const auto scheme_end = url.find("://");
    const std::string rest = scheme_end == std::string::npos ? url : url.substr(scheme_end + 3);
    const auto slash = rest.find_first_of("/?");
    if (slash == std::string::npos) {
        pu.authority = rest;
        pu.path = "/";
        return pu;
    }
    pu.authority = rest.substr(0, slash);
    const std::string path_query = rest.substr(slash);
    const auto qpos = path_query.find('?');
    if (qpos == std::string::npos) {
        pu.path = path_query;
    } else {
        pu.path = path_query.substr(0, qpos);
        pu.query = path_query.substr(qpos + 1);
    }
    if (pu.path.empty()) pu.path = "/";
    return pu;
}

// Query parameters sorted by name, each written as name=value.
std::string CanonicalQuery(const std::string& query) {
    if (query.empty()) return {};
    std::vector<std::pair<std::string, std::string>> params;
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        if (item.empty()) continue;
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            params.emplace_back(item, "");
        } else {
            params.emplace_back(item.substr(0, eq), item.substr(eq + 1));
        }
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i) out.push_back('&');
        out += params[i].first;
        out.push_back('=');
        out += params[i].second;
    }
    return out;
}

std::string FormatTime(std::time_t t, const char* fmt) {
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), fmt, &gmt) == 0) return {};
    return buf;
}

std::span<const std::uint8_t> AsBytes(std::string_view s) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace

std::string UriEncode(std::string_view s, bool keep_slash) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

S3Signer::S3Signer(S3Credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)),
      region_(region.empty() ? std::string("us-east-1") : std::move(region)),
      service_(std::move(service)) {}

Result S3Signer::Sign(HttpRequest& req, std::string_view payload_hash, std::time_t now) const {
    if (credentials_.access_key_id.empty() || credentials_.secret_access_key.empty()) {
        return Result::Fail(ErrorKind::Config, -1, "Missing S3 credentials");
    }

    const ParsedUrl pu = ParseUrl(req.url);
    const std::string amz_date = FormatTime(now, "%Y%m%dT%H%M%SZ");
    const std::string ymd = FormatTime(now, "%Y%m%d");

    std::vector<std::pair<std::string, std::string>> signed_hdrs;
    signed_hdrs.emplace_back("host", pu.authority);
    signed_hdrs.emplace_back("x-amz-content-sha256", std::string(payload_hash));
    signed_hdrs.emplace_back("x-amz-date", amz_date);
    if (!credentials_.session_token.empty()) {
        signed_hdrs.emplace_back("x-amz-security-token", credentials_.session_token);
    }
    std::sort(signed_hdrs.begin(), signed_hdrs.end());

    std::string canonical_headers;
    std::string signed_names;
    for (size_t i = 0; i < signed_hdrs.size(); ++i) {
        canonical_headers += signed_hdrs[i].first + ":" + signed_hdrs[i].second + "\n";
        if (i) signed_names.push_back(';');
        signed_names += signed_hdrs[i].first;
    }

    std::ostringstream cr;
    cr << req.method << "\n"
       << pu.path << "\n"
       << CanonicalQuery(pu.query) << "\n"
       << canonical_headers << "\n"
       << signed_names << "\n"
       << payload_hash;

    const std::string scope = ymd + "/" + region_ + "/" + service_ + "/aws4_request";
    const std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + Sha256Hex(cr.str());

    const std::string secret = "AWS4" + credentials_.secret_access_key;
    const auto k_date = HmacSha256(AsBytes(secret), ymd);
    const auto k_region = HmacSha256(k_date, region_);
    const auto k_service = HmacSha256(k_region, service_);
    const auto k_signing = HmacSha256(k_service, "aws4_request");
    const auto sig = HmacSha256(k_signing, string_to_sign);

    req.headers.push_back({"Host", pu.authority});
    req.headers.push_back({"x-amz-date", amz_date});
    req.headers.push_back({"x-amz-content-sha256", std::string(payload_hash)});
    if (!credentials_.session_token.empty()) {
        req.headers.push_back({"x-amz-security-token", credentials_.session_token});
    }
    req.headers.push_back({"Authorization",
                           "AWS4-HMAC-SHA256 Credential=" + credentials_.access_key_id + "/" +
                               scope + ", SignedHeaders=" + signed_names +
                               ", Signature=" + HexEncode(sig)});
    return Result::Ok();
}

} // namespace ingest
