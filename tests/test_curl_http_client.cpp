#include "net/curl_http_client.hpp"

#include "loopback_http_server.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <string>

namespace ingest {
namespace {

class CollectingSink final : public IBodySink {
  public:
    Result OnResponseStart(const HttpResponse& head) override {
        status = head.status;
        length = head.content_length;
        return Result::Ok();
    }
    Result OnData(std::span<const std::uint8_t> chunk) override {
        data.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        return Result::Ok();
    }

    long status = 0;
    std::optional<std::uint64_t> length;
    std::string data;
};

class RejectingSink final : public IBodySink {
  public:
    Result OnData(std::span<const std::uint8_t>) override {
        return Result::Fail(ErrorKind::Io, 28, "No space left on device");
    }
};

TEST(CurlHttpClientTest, GetBufferedBody) {
    testutil::LoopbackHttpServer server;
    server.Serve("/a.txt", {200, "hello world"});

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/a.txt");
    HttpResponse resp;
    auto r = client.Perform(req, resp);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "hello world");
    EXPECT_EQ(resp.content_length, 11u);
    EXPECT_EQ(resp.Header("content-length"), "11");
}

TEST(CurlHttpClientTest, StreamsBodyToSink) {
    testutil::LoopbackHttpServer server;
    const std::string body = testutil::Payload(300000);
    server.Serve("/big.bin", {200, body});

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/big.bin");
    HttpResponse resp;
    CollectingSink sink;
    ASSERT_TRUE(client.Perform(req, resp, &sink).is_ok());
    EXPECT_EQ(sink.status, 200);
    EXPECT_EQ(sink.length, body.size());
    EXPECT_EQ(sink.data, body);
    EXPECT_TRUE(resp.body.empty());
}

TEST(CurlHttpClientTest, ErrorStatusIsReturnedByDefault) {
    testutil::LoopbackHttpServer server;

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/missing");
    HttpResponse resp;
    ASSERT_TRUE(client.Perform(req, resp).is_ok());
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "not found");
}

TEST(CurlHttpClientTest, ErrorStatusFailsWhenRequested) {
    testutil::LoopbackHttpServer server;

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/missing");
    req.fail_on_http_error = true;
    HttpResponse resp;
    CollectingSink sink;
    auto r = client.Perform(req, resp, &sink);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Backend);
    EXPECT_EQ(r.err, 404);
    EXPECT_TRUE(sink.data.empty());
}

TEST(CurlHttpClientTest, TruncatedBodyIsTransient) {
    testutil::LoopbackHttpServer server;
    server.Serve("/cut.bin", {200, testutil::Payload(100000), 40000});

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/cut.bin");
    HttpResponse resp;
    CollectingSink sink;
    auto r = client.Perform(req, resp, &sink);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::TransientIo);
}

TEST(CurlHttpClientTest, RefusedConnectionIsTransient) {
    CurlHttpClient client;
    HttpRequest req;
    req.url = "http://127.0.0.1:1/x";
    req.timeouts.connect = std::chrono::seconds(5);
    HttpResponse resp;
    auto r = client.Perform(req, resp);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::TransientIo);
}

TEST(CurlHttpClientTest, SinkFailureIsPropagated) {
    testutil::LoopbackHttpServer server;
    server.Serve("/a.bin", {200, testutil::Payload(5000)});

    CurlHttpClient client;
    HttpRequest req;
    req.url = server.Url("/a.bin");
    HttpResponse resp;
    RejectingSink sink;
    auto r = client.Perform(req, resp, &sink);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Io);
    EXPECT_EQ(r.err, 28);
}

TEST(CurlHttpClientTest, HandleIsReusable) {
    testutil::LoopbackHttpServer server;
    server.Serve("/one", {200, "1"});
    server.Serve("/two", {200, "22"});

    CurlHttpClient client;
    HttpRequest req;
    HttpResponse resp;
    req.url = server.Url("/one");
    ASSERT_TRUE(client.Perform(req, resp).is_ok());
    EXPECT_EQ(resp.body, "1");
    req.url = server.Url("/two");
    ASSERT_TRUE(client.Perform(req, resp).is_ok());
    EXPECT_EQ(resp.body, "22");
    EXPECT_EQ(server.Hits("/one"), 1);
    EXPECT_EQ(server.Hits("/two"), 1);
}

TEST(CurlErrorTest, Classification) {
    EXPECT_EQ(ClassifyCurlError(CURLE_OK), ErrorKind::None);
    EXPECT_EQ(ClassifyCurlError(CURLE_COULDNT_CONNECT), ErrorKind::TransientIo);
    EXPECT_EQ(ClassifyCurlError(CURLE_OPERATION_TIMEDOUT), ErrorKind::TransientIo);
    EXPECT_EQ(ClassifyCurlError(CURLE_RECV_ERROR), ErrorKind::TransientIo);
    EXPECT_EQ(ClassifyCurlError(CURLE_PARTIAL_FILE), ErrorKind::TransientIo);
    EXPECT_EQ(ClassifyCurlError(CURLE_ABORTED_BY_CALLBACK), ErrorKind::Cancelled);
    EXPECT_EQ(ClassifyCurlError(CURLE_HTTP_RETURNED_ERROR), ErrorKind::Backend);
    EXPECT_EQ(ClassifyCurlError(CURLE_URL_MALFORMAT), ErrorKind::Io);
}

} // namespace
} // namespace ingest
