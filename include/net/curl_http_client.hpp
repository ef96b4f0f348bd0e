#pragma once

#include "net/http_client.hpp"

#include <curl/curl.h>

namespace ingest {

ErrorKind ClassifyCurlError(CURLcode code);

// Blocking libcurl easy-handle client. One instance per thread; instances
// share nothing.
class CurlHttpClient final : public IHttpClient {
  public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    using IHttpClient::Perform;
    Result Perform(const HttpRequest& req, HttpResponse& out, IBodySink* sink) override;

  private:
    CURL* handle_ = nullptr;
};

} // namespace ingest
