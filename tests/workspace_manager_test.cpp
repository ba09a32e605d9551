// File: tests/workspace_manager_test.cpp
#include <cstdint>
#include <filesystem>

#include <gtest/gtest.h>

#include "runbox/core/util/zip_archive.hpp"
#include "runbox/core/workspace/workspace_manager.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

namespace fs = std::filesystem;
using test::read_text;
using test::TempDir;
using test::write_text;

const RunId kRunId = "0123456789abcdef0123456789abcdef";

class WorkspaceManagerTest : public ::testing::Test {
 protected:
  WorkspaceManager make(WorkspaceConfig cfg = {}) const {
    cfg.base_dir = (tmp_ / "runs").string();
    return WorkspaceManager(cfg, RuntimeConfig{});
  }

  static std::string zip_of(const std::vector<std::pair<std::string, std::string>>& files) {
    ZipWriter zw;
    for (const auto& f : files) {
      if (!f.first.empty() && f.first.back() == '/') {
        EXPECT_TRUE(zw.add_directory(f.first).ok());
      } else {
        EXPECT_TRUE(zw.add_file(f.first, f.second).ok());
      }
    }
    auto bytes = zw.finish();
    EXPECT_TRUE(bytes.ok());
    return bytes.take_value();
  }

  TempDir tmp_;
};

TEST_F(WorkspaceManagerTest, SingleScriptIsSavedUnderItsName) {
  const auto mgr = make();
  auto ws = mgr.provision(kRunId, "main.py", "print('hello')\n");
  ASSERT_TRUE(ws.ok()) << ws.status().message();

  EXPECT_EQ(ws->root, tmp_ / "runs" / kRunId);
  EXPECT_FALSE(ws->extracted_archive);
  EXPECT_EQ(read_text(ws->root / "main.py"), "print('hello')\n");
}

TEST_F(WorkspaceManagerTest, ClientPathIsReducedToBaseName) {
  EXPECT_EQ(WorkspaceManager::sanitize_filename("C:\\Users\\me\\job.py"), "job.py");
  EXPECT_EQ(WorkspaceManager::sanitize_filename("../../etc/passwd"), "passwd");
  EXPECT_EQ(WorkspaceManager::sanitize_filename(".."), "upload");
  EXPECT_EQ(WorkspaceManager::sanitize_filename(""), "upload");
}

TEST_F(WorkspaceManagerTest, ArchiveIsExtractedAndRemoved) {
  const auto mgr = make();
  const std::string zip = zip_of({{"pkg/", ""}, {"pkg/util.py", "X = 1\n"}, {"main.py", "import pkg.util\n"}});

  auto ws = mgr.provision(kRunId, "project.zip", zip);
  ASSERT_TRUE(ws.ok()) << ws.status().message();
  EXPECT_TRUE(ws->extracted_archive);
  EXPECT_FALSE(fs::exists(ws->root / "project.zip"));
  EXPECT_EQ(read_text(ws->root / "main.py"), "import pkg.util\n");
  EXPECT_EQ(read_text(ws->root / "pkg" / "util.py"), "X = 1\n");
}

TEST_F(WorkspaceManagerTest, ExistingWorkspaceIsACollision) {
  const auto mgr = make();
  ASSERT_TRUE(mgr.provision(kRunId, "main.py", "a").ok());

  auto again = mgr.provision(kRunId, "main.py", "b");
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.status().code(), Status::Code::kWorkspaceCollision);
  EXPECT_EQ(read_text(tmp_ / "runs" / kRunId / "main.py"), "a");
}

TEST_F(WorkspaceManagerTest, TraversalEntriesAreRejectedBeforeWriting) {
  const auto mgr = make();
  const std::string zip = zip_of({{"main.py", "ok"}, {"../escape.py", "bad"}});

  auto ws = mgr.provision(kRunId, "evil.zip", zip);
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidArchive);
  EXPECT_FALSE(fs::exists(tmp_ / "runs" / "escape.py"));
  EXPECT_FALSE(fs::exists(tmp_ / "runs" / kRunId / "main.py"));
}

TEST_F(WorkspaceManagerTest, AbsoluteEntriesAreRejected) {
  const auto mgr = make();
  auto ws = mgr.provision(kRunId, "evil.zip", zip_of({{"/tmp/abs.py", "bad"}}));
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidArchive);
}

TEST_F(WorkspaceManagerTest, SymlinkEntriesAreRejected) {
  ZipWriter zw;
  ASSERT_TRUE(zw.add_symlink("passwd", "/etc/passwd").ok());
  auto zip = zw.finish();
  ASSERT_TRUE(zip.ok());

  const auto mgr = make();
  auto ws = mgr.provision(kRunId, "links.zip", *zip);
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidArchive);
}

TEST_F(WorkspaceManagerTest, ExtractionCapsAreEnforced) {
  WorkspaceConfig cfg;
  cfg.max_extract_bytes = 1000;
  const auto mgr = make(cfg);
  auto ws = mgr.provision(kRunId, "bomb.zip", zip_of({{"big.txt", std::string(5000, 'z')}}));
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidArchive);

  WorkspaceConfig few;
  few.max_archive_entries = 1;
  const auto wm2 = make(few);
  auto ws2 = wm2.provision("ffffffffffffffffffffffffffffffff", "many.zip", zip_of({{"a.py", "1"}, {"b.py", "2"}}));
  ASSERT_FALSE(ws2.ok());
  EXPECT_EQ(ws2.status().code(), Status::Code::kInvalidArchive);
}

void put_le32(std::string& bytes, std::size_t pos, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) bytes[pos + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
}

TEST_F(WorkspaceManagerTest, UnderstatedEntrySizeIsRejected) {
  std::string zip = zip_of({{"main.py", std::string(1 << 20, 'a')}});

  // Claim 10 bytes uncompressed in both the local and the central header.
  ASSERT_EQ(zip.compare(0, 4, "PK\x03\x04"), 0);
  put_le32(zip, 22, 10);
  const auto central = zip.find("PK\x01\x02");
  ASSERT_NE(central, std::string::npos);
  put_le32(zip, central + 24, 10);

  const auto mgr = make();
  auto ws = mgr.provision(kRunId, "bomb.zip", zip);
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidArchive);
  EXPECT_NE(ws.status().message().find("inflates beyond its declared size"), std::string::npos)
      << ws.status().message();
  EXPECT_FALSE(fs::exists(tmp_ / "runs" / kRunId / "main.py"));
}

TEST_F(WorkspaceManagerTest, OversizedUploadIsInvalidRequest) {
  WorkspaceConfig cfg;
  cfg.max_upload_bytes = 4;
  const auto mgr = make(cfg);
  auto ws = mgr.provision(kRunId, "main.py", "12345");
  ASSERT_FALSE(ws.ok());
  EXPECT_EQ(ws.status().code(), Status::Code::kInvalidRequest);
}

class EntrypointTest : public WorkspaceManagerTest {
 protected:
  fs::path root() const { return tmp_ / "ws"; }
};

TEST_F(EntrypointTest, PrefersMainThenAppThenFirstByName) {
  const auto mgr = make();
  write_text(root() / "zeta.py", "");
  write_text(root() / "beta.py", "");

  auto first = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first->filename(), "beta.py");

  write_text(root() / "app.py", "");
  auto app = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_TRUE(app.ok());
  EXPECT_EQ(app->filename(), "app.py");

  write_text(root() / "main.py", "");
  auto main_r = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_TRUE(main_r.ok());
  EXPECT_EQ(main_r->filename(), "main.py");

  // Same contents, same answer.
  auto again = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(*again, *main_r);
}

TEST_F(EntrypointTest, DotfilesTakePartInNameOrder) {
  const auto mgr = make();
  write_text(root() / "b.py", "");
  write_text(root() / ".a.py", "");

  auto r = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->filename(), ".a.py");
}

TEST_F(EntrypointTest, OverrideWinsWhenItExists) {
  const auto mgr = make();
  write_text(root() / "main.py", "");
  write_text(root() / "tools" / "run.py", "");

  auto r = mgr.resolve_entrypoint(root(), std::string("tools/run.py"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r, (root() / "tools" / "run.py").lexically_normal());
}

TEST_F(EntrypointTest, UnusableOverrideFallsThrough) {
  const auto mgr = make();
  write_text(root() / "main.py", "");
  write_text(tmp_ / "outside.py", "");

  auto missing = mgr.resolve_entrypoint(root(), std::string("nope.py"));
  ASSERT_TRUE(missing.ok());
  EXPECT_EQ(missing->filename(), "main.py");

  auto escaping = mgr.resolve_entrypoint(root(), std::string("../outside.py"));
  ASSERT_TRUE(escaping.ok());
  EXPECT_EQ(escaping->filename(), "main.py");
}

TEST_F(EntrypointTest, NoScriptIsNoEntrypoint) {
  const auto mgr = make();
  write_text(root() / "README.md", "docs");
  write_text(root() / "sub" / "main.py", "");  // not searched recursively

  auto r = mgr.resolve_entrypoint(root(), std::nullopt);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kNoEntrypoint);
}

TEST(IsWithinTest, NormalisesBeforeComparing) {
  EXPECT_TRUE(is_within("/r", "/r/a/b"));
  EXPECT_TRUE(is_within("/r", "/r/a/../b"));
  EXPECT_FALSE(is_within("/r", "/r/../x"));
  EXPECT_FALSE(is_within("/r", "/other"));
}

}  // namespace
}  // namespace runbox
