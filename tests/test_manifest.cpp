#include "util/manifest.hpp"
#include "util/manifest_parser.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace ingest {
namespace {

TEST(ManifestTest, DerivePathPrefix) {
    struct PrefixCase {
        const char* url;
        const char* expected;
    };
    const PrefixCase cases[] = {
        {"https://host/a/b/c/file.ext", "a/b/c"},
        {"https://host/file.ext", ""},
        {"https://host", ""},
        {"https://data.nemoarchive.org/biccn/grant/u19_huang/dulac/transcriptome/sncell/"
         "10x_multiome/mouse/processed/align/E16F_1_RNA.bam.tar",
         "biccn/grant/u19_huang/dulac/transcriptome/sncell/10x_multiome/mouse/processed/align"},
        {"http://127.0.0.1:8080/x/y/a.tar?sig=abc/def", "x/y"},
        {"file.ext", ""},
        {"/dir/file.ext", "dir"},
    };
    for (const auto& c : cases) {
        EXPECT_EQ(DerivePathPrefix(c.url), c.expected) << c.url;
    }
}

TEST(ManifestTest, DestinationKeyJoinsPrefixAndName) {
    EXPECT_EQ(DestinationKey("x/y", "inner.txt"), "x/y/inner.txt");
    EXPECT_EQ(DestinationKey("", "inner.txt"), "inner.txt");
    EXPECT_EQ(DestinationKey("a", "dir/f.fastq"), "a/dir/f.fastq");
}

TEST(ManifestTest, RunKeyIsDerivedFromFileId) {
    ManifestEntry e;
    e.file_id = "SQ_1.fastq.tar";
    EXPECT_EQ(RunKeyFor(e), "nemo_manifest_SQ_1.fastq.tar");
}

TEST(ManifestParserTest, ParsesRowsInAnyColumnOrder) {
    const std::string tsv =
        "sample_id\turls\tmd5\tfile_id\tsize\textra\n"
        "S1\thttps://host/a/b/f1.tar\tABCDEF\tf1.tar\t2048\tignored\n"
        "S2\thttps://host/f2.bam\tNA\tf2.bam\tNA\t\n";

    ManifestParser parser;
    auto parsed = parser.ParseTsv(tsv);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    ASSERT_EQ(parsed->entries.size(), 2u);
    EXPECT_EQ(parsed->skipped_rows, 0u);

    const auto& a = parsed->entries[0];
    EXPECT_EQ(a.file_id, "f1.tar");
    EXPECT_EQ(a.source_url, "https://host/a/b/f1.tar");
    EXPECT_EQ(a.expected_checksum, "ABCDEF");
    EXPECT_EQ(a.expected_size, 2048);
    EXPECT_EQ(a.sample_id, "S1");
    EXPECT_EQ(a.destination_prefix, "a/b");

    const auto& b = parsed->entries[1];
    EXPECT_EQ(b.expected_size, kUnknownSize);
    EXPECT_EQ(b.destination_prefix, "");
}

TEST(ManifestParserTest, SkipsRowsWithoutFileIdOrUrl) {
    const std::string tsv =
        "file_id\turls\tmd5\r\n"
        "\thttps://host/a.tar\tx\r\n"
        "b.tar\t\tx\r\n"
        "c.tar\n"
        "\n"
        "d.tar\thttps://host/p/d.tar\tx\r\n";

    auto parsed = ManifestParser().ParseTsv(tsv);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    ASSERT_EQ(parsed->entries.size(), 1u);
    EXPECT_EQ(parsed->entries[0].file_id, "d.tar");
    EXPECT_EQ(parsed->skipped_rows, 3u);
}

TEST(ManifestParserTest, MissingOptionalColumnsUseDefaults) {
    auto parsed = ManifestParser().ParseTsv("file_id\turls\nf.txt\thttps://h/d/f.txt\n");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->entries.size(), 1u);
    EXPECT_EQ(parsed->entries[0].expected_checksum, "NA");
    EXPECT_EQ(parsed->entries[0].expected_size, kUnknownSize);
    EXPECT_EQ(parsed->entries[0].sample_id, "");
}

TEST(ManifestParserTest, MalformedSizeBecomesUnknown) {
    auto parsed = ManifestParser().ParseTsv("file_id\turls\tsize\nf\thttps://h/f\t12kb\n");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->entries[0].expected_size, kUnknownSize);
}

TEST(ManifestParserTest, RejectsMissingRequiredColumns) {
    EXPECT_FALSE(ManifestParser().ParseTsv("file_id\tmd5\nf\tx\n").has_value());
    EXPECT_FALSE(ManifestParser().ParseTsv("").has_value());
}

TEST(ManifestParserTest, ParsesFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("m.tsv");
    ASSERT_TRUE(testutil::WriteFile(path, std::string("file_id\turls\nf\thttps://h/x/f\n")));

    auto parsed = ManifestParser().ParseTsvFile(path);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->entries.at(0).destination_prefix, "x");

    EXPECT_FALSE(ManifestParser().ParseTsvFile(tmp.Join("missing.tsv")).has_value());
}

} // namespace
} // namespace ingest
