// File: tests/util_test.cpp
#include <set>

#include <gtest/gtest.h>

#include "runbox/core/util/auth.hpp"
#include "runbox/core/util/file_io.hpp"
#include "runbox/core/util/json_text.hpp"
#include "runbox/core/util/run_id.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

TEST(AuthTest, EmptySecretMeansOpenAccess) {
  EXPECT_TRUE(token_matches("", std::nullopt));
  EXPECT_TRUE(token_matches("", std::string("anything")));
}

TEST(AuthTest, TokenMustMatchExactly) {
  EXPECT_TRUE(token_matches("s3cret", std::string("s3cret")));
  EXPECT_FALSE(token_matches("s3cret", std::nullopt));
  EXPECT_FALSE(token_matches("s3cret", std::string("")));
  EXPECT_FALSE(token_matches("s3cret", std::string("s3cre")));
  EXPECT_FALSE(token_matches("s3cret", std::string("s3cret!")));
  EXPECT_FALSE(token_matches("s3cret", std::string("S3cret")));
}

TEST(RunIdTest, GeneratesDistinctHexIds) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const RunId id = generate_run_id();
    ASSERT_TRUE(is_valid_run_id(id)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 1000u);
}

TEST(RunIdTest, RejectsOtherNames) {
  EXPECT_FALSE(is_valid_run_id(""));
  EXPECT_FALSE(is_valid_run_id("not-a-run"));
  EXPECT_FALSE(is_valid_run_id(std::string(32, 'g')));
  EXPECT_FALSE(is_valid_run_id(std::string(32, 'A')));
  EXPECT_TRUE(is_valid_run_id(std::string(32, 'a')));
}

TEST(JsonTextTest, EscapesControlAndQuoteCharacters) {
  EXPECT_EQ(json_quote("plain"), "\"plain\"");
  EXPECT_EQ(json_quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(json_quote("line\nnext\t"), "\"line\\nnext\\t\"");
  EXPECT_EQ(json_quote(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(JsonTextTest, KeepsUtf8AndReplacesStrayBytes) {
  EXPECT_EQ(json_quote("caf\xc3\xa9"), "\"caf\xc3\xa9\"");
  EXPECT_EQ(json_quote("\xff"), "\"\\ufffd\"");
}

TEST(FileIoTest, WritesAndReadsBinary) {
  test::TempDir dir;
  const std::string bytes("a\0b\xff", 4);
  ASSERT_TRUE(write_file(dir / "blob", bytes).ok());
  auto back = read_file(dir / "blob");
  ASSERT_TRUE(back.ok());
  EXPECT_EQ(*back, bytes);
}

TEST(FileIoTest, MissingFileIsAnError) {
  test::TempDir dir;
  EXPECT_FALSE(read_file(dir / "missing").ok());
  EXPECT_FALSE(write_file(dir / "no" / "such" / "dir", "x").ok());
}

}  // namespace
}  // namespace runbox
