// File: tests/object_store_test.cpp
#include <gtest/gtest.h>

#include "runbox/adapters/local_dir/local_dir_object_store.hpp"
#include "runbox/adapters/s3/s3_object_store.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

using test::read_text;
using test::TempDir;

TEST(LocalDirObjectStoreTest, WritesUnderRootAndReturnsFileUrl) {
  TempDir dir;
  LocalDirObjectStore store((dir / "objects").string());

  auto url = store.put(Artifact{"outputs/abc.txt", "hello\n", "text/plain"});
  ASSERT_TRUE(url.ok()) << url.status().message();
  EXPECT_EQ(*url, "file://" + (dir / "objects" / "outputs" / "abc.txt").string());
  EXPECT_EQ(read_text(dir / "objects" / "outputs" / "abc.txt"), "hello\n");
}

TEST(LocalDirObjectStoreTest, RejectsKeysOutsideRoot) {
  TempDir dir;
  LocalDirObjectStore store(dir.path().string());
  EXPECT_FALSE(store.put(Artifact{"../escape.txt", "x", ""}).ok());
  EXPECT_FALSE(store.put(Artifact{"/abs.txt", "x", ""}).ok());
  EXPECT_FALSE(store.put(Artifact{"", "x", ""}).ok());
}

TEST(S3ObjectStoreTest, VirtualHostedUrlByDefault) {
  StoreConfig cfg;
  cfg.bucket = "my-bucket";
  cfg.region = "eu-central-1";
  const S3ObjectStore store(cfg);
  EXPECT_EQ(store.object_url("outputs/abc.txt"),
            "https://my-bucket.s3.eu-central-1.amazonaws.com/outputs/abc.txt");
  EXPECT_EQ(store.name(), "s3");
}

TEST(S3ObjectStoreTest, PathStyleUnderCustomEndpoint) {
  StoreConfig cfg;
  cfg.bucket = "runs";
  cfg.endpoint = "http://localhost:9000/";
  const S3ObjectStore store(cfg);
  EXPECT_EQ(store.object_url("bundles/a b.zip"), "http://localhost:9000/runs/bundles/a%20b.zip");
}

TEST(S3ObjectStoreTest, UnreachableEndpointIsAnError) {
  StoreConfig cfg;
  cfg.bucket = "runs";
  cfg.endpoint = "http://127.0.0.1:1";
  cfg.timeout_s = 5;
  S3ObjectStore store(cfg);
  auto url = store.put(Artifact{"outputs/x.txt", "x", "text/plain"});
  EXPECT_FALSE(url.ok());
}

}  // namespace
}  // namespace runbox
