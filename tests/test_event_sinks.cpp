#include "transfer/event_sinks.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace ingest {
namespace {

TEST(JsonStatusSinkTest, TracksLatestStatePerFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("status.json");
    JsonStatusSink sink(path);

    sink.Report({.type = EventType::PhaseChanged, .file_id = "a.tar", .phase = Phase::Downloading});
    sink.Report({.type = EventType::Progress, .file_id = "a.tar", .phase = Phase::Downloading, .percent = 40});
    sink.Report({.type = EventType::PhaseChanged, .file_id = "b.bam", .phase = Phase::Uploading});
    sink.Report({.type = EventType::UnitUploaded, .file_id = "b.bam", .message = "p/b.bam"});
    sink.Report({.type = EventType::Completed, .file_id = "b.bam", .phase = Phase::Done});

    const auto doc = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(doc["a.tar"]["phase"], "DOWNLOADING");
    EXPECT_EQ(doc["a.tar"]["percent"], 40);
    EXPECT_EQ(doc["a.tar"]["state"], "running");
    EXPECT_EQ(doc["b.bam"]["state"], "succeeded");
    EXPECT_EQ(doc["b.bam"]["units_uploaded"], 1);
    EXPECT_FALSE(testutil::Exists(path + ".tmp"));
}

TEST(JsonStatusSinkTest, RecordsFailureAndRetries) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("status.json");
    JsonStatusSink sink(path);

    sink.Report({.type = EventType::Retry, .file_id = "x", .phase = Phase::Downloading,
                 .attempt = 1, .max_attempts = 3, .message = "reset"});
    sink.Report({.type = EventType::Failed, .file_id = "x", .phase = Phase::Verifying,
                 .message = "md5 mismatch"});

    const auto doc = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(doc["x"]["state"], "failed");
    EXPECT_EQ(doc["x"]["phase"], "VERIFYING");
    EXPECT_EQ(doc["x"]["attempt"], 1);
    EXPECT_EQ(doc["x"]["message"], "md5 mismatch");
}

class CountingSink final : public IEventSink {
  public:
    void Report(const TransferEvent&) override { ++count; }
    int count = 0;
};

TEST(FanoutEventSinkTest, ForwardsToEverySink) {
    CountingSink a;
    CountingSink b;
    FanoutEventSink fan;
    fan.Add(&a);
    fan.Add(nullptr);
    fan.Add(&b);

    LogEventSink log;
    fan.Add(&log);

    fan.Report({.type = EventType::Completed, .file_id = "f"});
    EXPECT_EQ(a.count, 1);
    EXPECT_EQ(b.count, 1);
}

TEST(EventNamesTest, PhaseNames) {
    EXPECT_STREQ(PhaseName(Phase::Expanding), "EXPANDING");
    EXPECT_STREQ(EventTypeName(EventType::UnitUploaded), "unit_uploaded");
}

} // namespace
} // namespace ingest
