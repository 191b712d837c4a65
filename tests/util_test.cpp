
#include "digest.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace ferry;

TEST(Util, ParseHostPort) {
  std::string host;
  uint16_t port = 0;
  ASSERT_TRUE(parse_host_port("127.0.0.1:46080", host, port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 46080);
  ASSERT_TRUE(parse_host_port("[::1]:9000", host, port));
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 9000);
  EXPECT_FALSE(parse_host_port("localhost", host, port));
  EXPECT_FALSE(parse_host_port("localhost:http", host, port));
  EXPECT_FALSE(parse_host_port("localhost:70000", host, port));
}

TEST(Util, ParseSizeSuffixes) {
  uint64_t n = 0;
  ASSERT_TRUE(parse_size("4096", n));
  EXPECT_EQ(n, 4096u);
  ASSERT_TRUE(parse_size("32K", n));
  EXPECT_EQ(n, 32u * 1024);
  ASSERT_TRUE(parse_size("16MiB", n));
  EXPECT_EQ(n, 16u * 1024 * 1024);
  ASSERT_TRUE(parse_size("2g", n));
  EXPECT_EQ(n, 2ull * 1024 * 1024 * 1024);
  EXPECT_FALSE(parse_size("", n));
  EXPECT_FALSE(parse_size("K", n));
  EXPECT_FALSE(parse_size("10X", n));
}

TEST(Util, SanitizeFileName) {
  EXPECT_EQ(sanitize_file_name("/etc/passwd"), "passwd");
  EXPECT_EQ(sanitize_file_name("..\\..\\boot.ini"), "boot.ini");
  EXPECT_EQ(sanitize_file_name("../.hidden"), "hidden");
  EXPECT_EQ(sanitize_file_name("dir/"), "received.bin");
  EXPECT_EQ(sanitize_file_name("report.pdf"), "report.pdf");
}

TEST(Util, MimeGuessing) {
  EXPECT_EQ(guess_mime_type("a.PNG"), "image/png");
  EXPECT_EQ(guess_mime_type("notes.txt"), "text/plain");
  EXPECT_EQ(guess_mime_type("blob"), "application/octet-stream");
  EXPECT_EQ(guess_mime_type("archive."), "application/octet-stream");
}

TEST(Util, FormatBytes) {
  EXPECT_EQ(format_bytes(512), "512 B");
  EXPECT_EQ(format_bytes(1536), "1.5 KiB");
  EXPECT_EQ(format_bytes(3.0 * 1024 * 1024), "3.0 MiB");
}

TEST(Logging, ParseLevel) {
  LogLevel lvl;
  ASSERT_TRUE(parse_log_level("DEBUG", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  ASSERT_TRUE(parse_log_level("warning", lvl));
  EXPECT_EQ(lvl, LogLevel::WARN);
  EXPECT_FALSE(parse_log_level("loud", lvl));
}

TEST(Digest, IncrementalMatchesOneShot) {
  ASSERT_TRUE(init_sodium());
  std::vector<uint8_t> data(100000);
  for (size_t i = 0; i < data.size(); i++)
    data[i] = (uint8_t)(i * 7);

  PayloadDigest whole;
  whole.update(data.data(), data.size());
  auto a = whole.finish();

  PayloadDigest parts;
  parts.update(data.data(), 333);
  parts.update(data.data() + 333, data.size() - 333);
  auto b = parts.finish();

  EXPECT_EQ(a.size(), kDigestSize);
  EXPECT_EQ(a, b);

  PayloadDigest other;
  data[5] ^= 1;
  other.update(data.data(), data.size());
  EXPECT_NE(other.finish(), a);
}

TEST(Digest, RandomIdsAreNonZeroAndDistinct) {
  std::set<uint32_t> ids;
  for (int i = 0; i < 64; i++) {
    uint32_t id = random_transfer_id();
    EXPECT_NE(id, 0u);
    ids.insert(id);
  }
  EXPECT_GT(ids.size(), 60u);
  auto p = random_peer_id();
  EXPECT_EQ(p.size(), 16u);
  EXPECT_NE(p, random_peer_id());
}
