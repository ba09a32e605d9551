// include/runbox/core/util/zip_archive.hpp
#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

#include "runbox/core/status.hpp"

namespace runbox {

// Classic (non-zip64) zip archives, stored or deflate entries.
//
// Contract:
// - Reader works on an in-memory archive and never touches the filesystem.
// - Entry names are returned exactly as stored; callers validate them.
// - Writer stores unix modes and symlinks (as `zip -y` does).

struct ZipEntry {
  std::string name;
  bool is_directory = false;
  bool is_symlink = false;
  std::uint16_t method = 0;            // 0 = stored, 8 = deflate
  std::uint32_t crc32 = 0;
  std::uint64_t compressed_size = 0;
  std::uint64_t uncompressed_size = 0;
  std::uint64_t local_header_offset = 0;
  std::uint32_t unix_mode = 0;         // 0 when the archive was not made on unix
};

// True when an end-of-central-directory record is present.
bool looks_like_zip(const std::string& bytes);

class ZipReader {
 public:
  // Parses the central directory. Fails with invalid_archive on malformed,
  // zip64 or encrypted archives.
  static Result<ZipReader> open(std::string bytes);

  const std::vector<ZipEntry>& entries() const { return entries_; }

  // Decompresses one entry and verifies its size and CRC-32.
  Result<std::string> read(const ZipEntry& entry) const;

 private:
  ZipReader() = default;

  std::string data_;
  std::vector<ZipEntry> entries_;
};

class ZipWriter {
 public:
  Status add_file(const std::string& name, const std::string& bytes,
                  std::uint32_t unix_mode = 0100644, std::time_t mtime = 0);
  Status add_directory(const std::string& name, std::uint32_t unix_mode = 040755,
                       std::time_t mtime = 0);
  Status add_symlink(const std::string& name, const std::string& target,
                     std::time_t mtime = 0);

  // Appends the central directory and returns the archive bytes.
  Result<std::string> finish();

  std::size_t entry_count() const { return central_.size(); }

 private:
  struct CentralRecord {
    std::string name;
    std::uint16_t method;
    std::uint16_t dos_time;
    std::uint16_t dos_date;
    std::uint32_t crc32;
    std::uint32_t compressed_size;
    std::uint32_t uncompressed_size;
    std::uint32_t external_attrs;
    std::uint32_t local_header_offset;
  };

  Status add_entry_(const std::string& name, const std::string& bytes, bool compress,
                    std::uint32_t external_attrs, std::time_t mtime);

  std::string out_;
  std::vector<CentralRecord> central_;
  bool finished_{false};
};

// Zips every file, directory and symlink under `root` (symlinks are not
// followed). Paths in `exclude` are relative to `root`. Entries are written
// in lexicographic path order.
Result<std::string> zip_directory(const std::filesystem::path& root,
                                  const std::vector<std::filesystem::path>& exclude = {});

}  // namespace runbox
