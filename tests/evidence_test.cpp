#include <sys/stat.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "test_env.hpp"
#include "sandbox_probe/evidence.hpp"

namespace {

using ::testing::IsEmpty;
using ::testing::Not;

using namespace sandbox_probe;
using EvidenceTest = sandbox_probe::test_support::ProbeEnvTest;

TEST_F(EvidenceTest, MissingPathIsNotAccessible) {
  const EvidenceReport report = inspect_evidence(scratch_ / "absent.E01");
  EXPECT_FALSE(report.exists);
  EXPECT_THAT(report.error, Not(IsEmpty()));
  EXPECT_FALSE(report.sha256.has_value());
}

TEST_F(EvidenceTest, TextFileReportsSizeAndDigest) {
  const auto path = write_file("notes.txt", "abc");
  const EvidenceReport report = inspect_evidence(path);
  ASSERT_TRUE(report.exists);
  EXPECT_EQ(report.type, "Text");
  ASSERT_TRUE(report.size_bytes.has_value());
  EXPECT_EQ(*report.size_bytes, 3u);
  EXPECT_EQ(report.size_human, std::optional<std::string>("3 B"));
  EXPECT_EQ(report.sha256, std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
  EXPECT_TRUE(report.permissions.has_value());
  EXPECT_THAT(report.warnings, IsEmpty());
}

TEST_F(EvidenceTest, DiskImageClassifiedByExtension) {
  const auto path = write_file("disk.DD", std::string(64, '\0'));
  const EvidenceReport report = inspect_evidence(path);
  ASSERT_TRUE(report.exists);
  EXPECT_EQ(report.type, "Disk Image");
}

TEST_F(EvidenceTest, UnknownBinaryContent) {
  const auto path = write_file("blob", std::string(128, '\0'));
  EXPECT_EQ(inspect_evidence(path).type, "Binary");
}

TEST_F(EvidenceTest, DirectoryCountsEntries) {
  std::filesystem::create_directory(scratch_ / "bundle");
  write_file("bundle/a.txt", "a");
  write_file("bundle/b.txt", "b");
  std::filesystem::create_directory(scratch_ / "bundle" / "nested");

  const EvidenceReport report = inspect_evidence(scratch_ / "bundle");
  ASSERT_TRUE(report.exists);
  EXPECT_EQ(report.type, "Directory");
  EXPECT_EQ(report.entry_count, std::optional<std::size_t>(3));
  EXPECT_FALSE(report.sha256.has_value());
}

TEST_F(EvidenceTest, FifoIsClassifiedWithoutOpening) {
  const auto pipe = scratch_ / "pipe";
  ASSERT_EQ(mkfifo(pipe.c_str(), 0600), 0);

  const EvidenceReport report = inspect_evidence(pipe);
  ASSERT_TRUE(report.exists);
  EXPECT_EQ(report.type, "FIFO");
  EXPECT_FALSE(report.size_bytes.has_value());
  EXPECT_FALSE(report.sha256.has_value());
  EXPECT_FALSE(report.sha256_skipped_above.has_value());
}

TEST_F(EvidenceTest, HashesFileAtTheSizeLimit) {
  const auto path = write_file("small.bin", "abc");
  const EvidenceReport report = inspect_evidence(path, 3);
  EXPECT_EQ(report.sha256, std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
  EXPECT_FALSE(report.sha256_skipped_above.has_value());
}

TEST_F(EvidenceTest, SkipsHashAboveTheSizeLimit) {
  const auto path = write_file("large.bin", "abc");
  const EvidenceReport report = inspect_evidence(path, 2);
  ASSERT_TRUE(report.exists);
  EXPECT_EQ(report.size_bytes, std::optional<uintmax_t>(3));
  EXPECT_FALSE(report.sha256.has_value());
  EXPECT_EQ(report.sha256_skipped_above, std::optional<uintmax_t>(2));
  EXPECT_THAT(report.warnings, IsEmpty());
}

}  // namespace
