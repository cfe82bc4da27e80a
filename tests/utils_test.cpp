#include <gtest/gtest.h>
#include "sandbox_probe/utils.hpp"

namespace {

using namespace sandbox_probe;
namespace fs = std::filesystem;

TEST(FormatTest, Size) {
  EXPECT_EQ(format_size(0), "0 B");
  EXPECT_EQ(format_size(1023), "1023 B");
  EXPECT_EQ(format_size(1024), "1.00 KB");
  EXPECT_EQ(format_size(1536), "1.50 KB");
  EXPECT_EQ(format_size(1024ull * 1024 * 1024 * 3), "3.00 GB");
}

TEST(FormatTest, Permissions) {
  EXPECT_EQ(format_permissions(static_cast<fs::perms>(0750)), "rwxr-x---");
  EXPECT_EQ(format_permissions(static_cast<fs::perms>(0644)), "rw-r--r--");
  EXPECT_EQ(format_permissions(fs::perms::none), "---------");
}

TEST(FormatTest, UtcTimeAndDuration) {
  EXPECT_EQ(format_utc_time(0), "1970-01-01T00:00:00Z");
  EXPECT_EQ(format_duration(3725), "01:02:05");
  EXPECT_EQ(format_duration(-4), "00:00:00");
}

TEST(FormatTest, Lowercase) {
  EXPECT_EQ(to_lowercase(".E01"), ".e01");
}

}  // namespace
