// File: tests/retention_sweeper_test.cpp
#include <algorithm>
#include <chrono>

#include <gtest/gtest.h>

#include "runbox/core/model/retention_sweeper.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

namespace fs = std::filesystem;
using test::TempDir;
using test::write_text;

class RetentionSweeperTest : public ::testing::Test {
 protected:
  // Creates a run workspace whose mtime is `age` before now_.
  fs::path make_run(char fill, std::chrono::hours age) {
    const fs::path p = dir_ / std::string(32, fill);
    write_text(p / "main.py", "print(1)\n");
    fs::last_write_time(p, now_ - age);
    return p;
  }

  std::vector<std::string> removed_names(const SweepReport& r) const {
    std::vector<std::string> names;
    for (const auto& p : r.removed) names.push_back(p.filename().string());
    std::sort(names.begin(), names.end());
    return names;
  }

  TempDir dir_;
  const fs::file_time_type now_ = fs::file_time_type::clock::now();
};

TEST_F(RetentionSweeperTest, DisabledByDefault) {
  make_run('a', std::chrono::hours(1000));
  const RetentionSweeper sweeper(dir_.path().string(), RetentionConfig{});
  auto r = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r->removed.empty());
  EXPECT_TRUE(fs::exists(dir_ / std::string(32, 'a')));
}

TEST_F(RetentionSweeperTest, RemovesRunsOlderThanMaxAge) {
  make_run('a', std::chrono::hours(48));
  make_run('b', std::chrono::hours(1));

  RetentionConfig cfg;
  cfg.max_age_hours = 24;
  const RetentionSweeper sweeper(dir_.path().string(), cfg);
  auto r = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->examined, 2u);
  EXPECT_EQ(removed_names(*r), std::vector<std::string>{std::string(32, 'a')});
  EXPECT_FALSE(fs::exists(dir_ / std::string(32, 'a')));
  EXPECT_TRUE(fs::exists(dir_ / std::string(32, 'b')));
}

TEST_F(RetentionSweeperTest, KeepsOnlyTheNewest) {
  make_run('a', std::chrono::hours(3));
  make_run('b', std::chrono::hours(2));
  make_run('c', std::chrono::hours(1));

  RetentionConfig cfg;
  cfg.keep_last = 2;
  const RetentionSweeper sweeper(dir_.path().string(), cfg);
  auto r = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(removed_names(*r), std::vector<std::string>{std::string(32, 'a')});
}

TEST_F(RetentionSweeperTest, DryRunRemovesNothing) {
  make_run('a', std::chrono::hours(48));
  RetentionConfig cfg;
  cfg.max_age_hours = 1;
  const RetentionSweeper sweeper(dir_.path().string(), cfg);
  auto r = sweeper.sweep_at(now_, true);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->removed.size(), 1u);
  EXPECT_TRUE(fs::exists(dir_ / std::string(32, 'a')));
}

TEST_F(RetentionSweeperTest, IgnoresNonRunEntries) {
  write_text(dir_ / "keep-me" / "file", "x");
  write_text(dir_ / std::string(32, 'f'), "a file, not a run");
  fs::last_write_time(dir_ / "keep-me", now_ - std::chrono::hours(100));

  RetentionConfig cfg;
  cfg.max_age_hours = 1;
  const RetentionSweeper sweeper(dir_.path().string(), cfg);
  auto r = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->examined, 0u);
  EXPECT_TRUE(fs::exists(dir_ / "keep-me"));
}

TEST_F(RetentionSweeperTest, DanglingRunLinkDoesNotFailTheSweep) {
  fs::create_symlink(dir_ / "gone", dir_ / std::string(32, 'c'));

  RetentionConfig cfg;
  cfg.keep_last = 1;
  const RetentionSweeper sweeper(dir_.path().string(), cfg);
  auto r = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->examined, 0u);
  EXPECT_TRUE(r->errors.empty());

  make_run('a', std::chrono::hours(2));
  make_run('b', std::chrono::hours(1));
  auto again = sweeper.sweep_at(now_, false);
  ASSERT_TRUE(again.ok()) << again.status().message();
  EXPECT_EQ(again->examined, 2u);
  EXPECT_EQ(removed_names(*again), std::vector<std::string>{std::string(32, 'a')});
}

TEST_F(RetentionSweeperTest, MissingBaseDirIsNotAnError) {
  RetentionConfig cfg;
  cfg.keep_last = 1;
  const RetentionSweeper sweeper((dir_ / "absent").string(), cfg);
  auto r = sweeper.sweep(false);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->examined, 0u);
}

}  // namespace
}  // namespace runbox
