#include "transfer/options.hpp"
#include "util/config.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <map>

namespace ingest {
namespace {

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

Config ValidConfig() {
    Config cfg;
    cfg.scratch_root = "/scratch";
    cfg.dest_bucket = "bucket";
    cfg.endpoint = "https://s3.example.org";
    return cfg;
}

TEST(ConfigTest, DefaultsMatchTransferSettings) {
    Config cfg;
    EXPECT_EQ(cfg.multipart_threshold_bytes, 25ULL * 1024 * 1024);
    EXPECT_EQ(cfg.part_size_bytes, 100ULL * 1024 * 1024);
    EXPECT_EQ(cfg.max_concurrency, 10);
    EXPECT_EQ(cfg.download_attempts, 3);
    EXPECT_EQ(cfg.upload_attempts, 3);
    EXPECT_EQ(cfg.transient_upload_codes, std::vector<std::string>{"InvalidPart"});
    EXPECT_EQ(cfg.connect_timeout_sec, 120);
    EXPECT_EQ(cfg.read_timeout_sec, 7200);
    EXPECT_EQ(cfg.store_read_timeout_sec, 600);
    EXPECT_EQ(cfg.store_max_attempts, 10);
}

TEST(ConfigTest, LoadsJsonFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("cfg.json");
    ASSERT_TRUE(testutil::WriteFile(path, std::string(R"({
        "ScratchRoot": "/data/scratch",
        "DestBucket": "omics",
        "Endpoint": "http://minio:9000",
        "Region": "eu-west-1",
        "PartSizeBytes": 8388608,
        "MaxConcurrency": 4,
        "TransientUploadCodes": ["InvalidPart", "SlowDown"],
        "StatusFile": "/tmp/status.json",
        "LogLevel": "debug"
    })")));

    Config cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.scratch_root, "/data/scratch");
    EXPECT_EQ(cfg.dest_bucket, "omics");
    EXPECT_EQ(cfg.endpoint, "http://minio:9000");
    EXPECT_EQ(cfg.region, "eu-west-1");
    EXPECT_EQ(cfg.part_size_bytes, 8388608u);
    EXPECT_EQ(cfg.max_concurrency, 4);
    EXPECT_EQ(cfg.transient_upload_codes, (std::vector<std::string>{"InvalidPart", "SlowDown"}));
    EXPECT_EQ(cfg.status_file, "/tmp/status.json");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.Validate().is_ok());
}

TEST(ConfigTest, RejectsWrongTypesAndBadJson) {
    testutil::TemporaryDirectory tmp;
    const std::string typed = tmp.Join("typed.json");
    ASSERT_TRUE(testutil::WriteFile(typed, std::string(R"({"MaxConcurrency": "ten"})")));
    Config a;
    auto r = a.LoadFile(typed);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_NE(r.msg.find("MaxConcurrency"), std::string::npos);

    const std::string broken = tmp.Join("broken.json");
    ASSERT_TRUE(testutil::WriteFile(broken, std::string("{not json")));
    Config b;
    EXPECT_EQ(b.LoadFile(broken).kind, ErrorKind::Config);

    Config c;
    EXPECT_EQ(c.LoadFile(tmp.Join("missing.json")).kind, ErrorKind::Config);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    Config cfg = ValidConfig();
    cfg.ApplyEnvironment(FakeEnv({
        {"SCRATCH_PATH", "/env/scratch"},
        {"DEST_BUCKET", "env-bucket"},
        {"AWS_S3_ENDPOINT_URL", "http://localhost:9000"},
        {"AWS_ACCESS_KEY_ID", "AKID"},
        {"AWS_SECRET_ACCESS_KEY", "SECRET"},
        {"AWS_REGION", ""},
    }));
    EXPECT_EQ(cfg.scratch_root, "/env/scratch");
    EXPECT_EQ(cfg.dest_bucket, "env-bucket");
    EXPECT_EQ(cfg.endpoint, "http://localhost:9000");
    EXPECT_EQ(cfg.access_key_id, "AKID");
    EXPECT_EQ(cfg.secret_access_key, "SECRET");
    EXPECT_EQ(cfg.region, "us-east-1");
}

TEST(ConfigTest, ValidateFailsFastOnMissingSettings) {
    Config no_scratch = ValidConfig();
    no_scratch.scratch_root.clear();
    EXPECT_EQ(no_scratch.Validate().kind, ErrorKind::Config);
    EXPECT_TRUE(no_scratch.ValidateStore().is_ok());

    Config no_bucket = ValidConfig();
    no_bucket.dest_bucket.clear();
    EXPECT_EQ(no_bucket.Validate().kind, ErrorKind::Config);

    Config bad_endpoint = ValidConfig();
    bad_endpoint.endpoint = "minio:9000";
    EXPECT_EQ(bad_endpoint.Validate().kind, ErrorKind::Config);

    Config bad_level = ValidConfig();
    bad_level.log_level = "loud";
    EXPECT_EQ(bad_level.Validate().kind, ErrorKind::Config);

    Config zero_parts = ValidConfig();
    zero_parts.part_size_bytes = 0;
    EXPECT_FALSE(zero_parts.Validate().is_ok());
}

TEST(ConfigTest, ValidateRejectsOutOfRangeNumbers) {
    Config small_parts = ValidConfig();
    small_parts.part_size_bytes = 5 * 1024 * 1024 - 1;
    EXPECT_EQ(small_parts.Validate().kind, ErrorKind::Config);
    EXPECT_EQ(small_parts.ValidateStore().kind, ErrorKind::Config);

    Config huge_parts = ValidConfig();
    huge_parts.part_size_bytes = 5ULL * 1024 * 1024 * 1024 + 1;
    EXPECT_FALSE(huge_parts.ValidateStore().is_ok());

    Config negative_connect = ValidConfig();
    negative_connect.connect_timeout_sec = -1;
    EXPECT_EQ(negative_connect.Validate().kind, ErrorKind::Config);

    Config zero_read = ValidConfig();
    zero_read.read_timeout_sec = 0;
    EXPECT_FALSE(zero_read.Validate().is_ok());

    Config store_connect = ValidConfig();
    store_connect.store_connect_timeout_sec = -5;
    EXPECT_FALSE(store_connect.ValidateStore().is_ok());

    Config store_read = ValidConfig();
    store_read.store_read_timeout_sec = 0;
    EXPECT_FALSE(store_read.ValidateStore().is_ok());

    Config minimum = ValidConfig();
    minimum.part_size_bytes = 5 * 1024 * 1024;
    EXPECT_TRUE(minimum.Validate().is_ok());
}

TEST(ConfigTest, OptionsAreDerivedFromConfig) {
    Config cfg = ValidConfig();
    cfg.part_size_bytes = 5 * 1024 * 1024;
    cfg.upload_attempts = 4;
    cfg.download_attempts = 2;
    cfg.read_timeout_sec = 30;
    cfg.access_key_id = "AK";

    const auto up = UploadOptionsFrom(cfg);
    EXPECT_EQ(up.part_size, 5u * 1024 * 1024);
    EXPECT_EQ(up.retry.max_attempts, 4);

    const auto down = DownloadOptionsFrom(cfg);
    EXPECT_EQ(down.retry.max_attempts, 2);
    EXPECT_EQ(down.timeouts.read.count(), 30);
    EXPECT_EQ(down.chunk_size, 1024u * 1024);

    const auto s3 = S3OptionsFrom(cfg);
    EXPECT_EQ(s3.endpoint, "https://s3.example.org");
    EXPECT_EQ(s3.credentials.access_key_id, "AK");
    EXPECT_EQ(s3.max_attempts, 10);
    EXPECT_EQ(s3.timeouts.read.count(), 600);
}

} // namespace
} // namespace ingest
