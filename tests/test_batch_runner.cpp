#include "transfer/batch_runner.hpp"

#include "crypto/digest.hpp"
#include "fakes.hpp"
#include "system/signals.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace ingest {
namespace {

constexpr const char* kBucket = "nemo-ingest";
constexpr const char* kBase = "https://data.example.org/biccn/grant/";

class BatchRunnerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        cfg.scratch_root = tmp.Join("scratch");
        cfg.dest_bucket = kBucket;

        http.responder = [this](const testutil::RecordedRequest& req) {
            auto it = bodies.find(req.url);
            if (it == bodies.end()) return testutil::Status(404, "not found");
            return testutil::Ok(it->second);
        };
    }

    void TearDown() override { g_cancel = false; }

    ManifestEntry Add(const std::string& file_id, const std::string& body) {
        ManifestEntry e;
        e.file_id = file_id;
        e.source_url = kBase + file_id;
        e.expected_checksum = Md5Hex(testutil::Bytes(body));
        e.expected_size = static_cast<std::int64_t>(body.size());
        e.destination_prefix = DerivePathPrefix(e.source_url);
        bodies[e.source_url] = body;
        return e;
    }

    BatchRunner Runner(int jobs) {
        return BatchRunner(
            cfg,
            [this] { return std::make_unique<testutil::ForwardingHttpClient>(http); },
            [this] { return std::make_unique<testutil::ForwardingObjectStore>(store); },
            &events,
            jobs);
    }

    testutil::TemporaryDirectory tmp;
    Config cfg;
    std::map<std::string, std::string> bodies;
    testutil::FakeHttpClient http;
    testutil::InMemoryObjectStore store;
    testutil::RecordingEventSink events;
};

TEST_F(BatchRunnerTest, ProcessesEveryEntry) {
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 6; ++i) {
        entries.push_back(Add("f" + std::to_string(i) + ".bam", testutil::Payload(1000 + i, i)));
    }

    const auto summary = Runner(3).Run(entries);
    EXPECT_EQ(summary.succeeded, 6u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_TRUE(summary.AllSucceeded());
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(store.Object(kBucket, "biccn/grant/f" + std::to_string(i) + ".bam"),
                  testutil::Payload(1000 + i, i));
    }
    EXPECT_EQ(testutil::CountEntries(cfg.scratch_root), 0u);
}

TEST_F(BatchRunnerTest, DuplicateRunKeysAreProcessedOnce) {
    const auto a = Add("a.bam", "aaa");
    auto again = a;
    again.sample_id = "other-sample";

    const auto summary = Runner(2).Run({a, again, Add("b.bam", "bbb")});
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.skipped_duplicates, 1u);
    EXPECT_EQ(http.Calls(), 2u);
}

TEST_F(BatchRunnerTest, FailureDoesNotStopSiblings) {
    auto bad = Add("bad.bam", "x");
    bodies.erase(bad.source_url);

    const auto summary = Runner(1).Run({Add("a.bam", "aaa"), bad, Add("c.bam", "ccc")});
    EXPECT_EQ(summary.succeeded, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_FALSE(summary.AllSucceeded());
    EXPECT_EQ(summary.failed_ids, std::vector<std::string>{"bad.bam"});
    EXPECT_TRUE(store.Object(kBucket, "biccn/grant/c.bam").has_value());
}

TEST_F(BatchRunnerTest, ClientSetupFailureIsCounted) {
    BatchRunner runner(
        cfg,
        []() -> std::unique_ptr<IHttpClient> { throw std::runtime_error("curl_easy_init failed"); },
        [this] { return std::make_unique<testutil::ForwardingObjectStore>(store); },
        &events,
        1);

    const auto summary = runner.Run({Add("a.bam", "aaa")});
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(http.Calls(), 0u);
}

TEST_F(BatchRunnerTest, CancelledBatchStartsNothing) {
    g_cancel = true;
    const auto summary = Runner(2).Run({Add("a.bam", "aaa"), Add("b.bam", "bbb")});
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(http.Calls(), 0u);
}

TEST_F(BatchRunnerTest, EmptyManifestIsSuccess) {
    const auto summary = Runner(4).Run({});
    EXPECT_TRUE(summary.AllSucceeded());
    EXPECT_EQ(summary.succeeded, 0u);
}

} // namespace
} // namespace ingest
