// src/core/util/zip_archive.cpp
#include "runbox/core/util/zip_archive.hpp"

#include <algorithm>
#include <limits>
#include <system_error>
#include <utility>

#include <sys/stat.h>
#include <zlib.h>

#include "runbox/core/util/file_io.hpp"

namespace runbox {
namespace {

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSig = 0x06054b50;

constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;

constexpr std::uint16_t kFlagEncrypted = 0x0001;
constexpr std::uint16_t kFlagUtf8 = 0x0800;

constexpr std::uint16_t kVersionNeeded = 20;
constexpr std::uint16_t kVersionMadeByUnix = (3u << 8) | 20u;

constexpr std::uint32_t kModeTypeMask = 0170000;
constexpr std::uint32_t kModeSymlink = 0120000;
constexpr std::uint32_t kModeDirectory = 040000;
constexpr std::uint32_t kDosDirectoryAttr = 0x10;

std::uint16_t get_u16(const std::string& b, std::size_t off) {
  return static_cast<std::uint16_t>(static_cast<std::uint8_t>(b[off]) |
                                    (static_cast<std::uint8_t>(b[off + 1]) << 8));
}

std::uint32_t get_u32(const std::string& b, std::size_t off) {
  return static_cast<std::uint32_t>(get_u16(b, off)) |
         (static_cast<std::uint32_t>(get_u16(b, off + 2)) << 16);
}

void put_u16(std::string& out, std::uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, std::uint32_t v) {
  put_u16(out, static_cast<std::uint16_t>(v & 0xFFFF));
  put_u16(out, static_cast<std::uint16_t>((v >> 16) & 0xFFFF));
}

std::uint32_t crc32_of(const std::string& bytes) {
  uLong crc = ::crc32(0L, Z_NULL, 0);
  const auto* p = reinterpret_cast<const Bytef*>(bytes.data());
  std::size_t left = bytes.size();
  while (left > 0) {
    const uInt chunk = static_cast<uInt>(std::min<std::size_t>(left, std::numeric_limits<uInt>::max()));
    crc = ::crc32(crc, p, chunk);
    p += chunk;
    left -= chunk;
  }
  return static_cast<std::uint32_t>(crc);
}

// Returns the offset of the end-of-central-directory record, or npos.
std::size_t find_eocd(const std::string& b) {
  if (b.size() < kEndOfCentralDirSize) return std::string::npos;
  const std::size_t last = b.size() - kEndOfCentralDirSize;
  const std::size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
  for (std::size_t off = last + 1; off-- > first;) {
    if (get_u32(b, off) != kEndOfCentralDirSig) continue;
    // The comment length must account for exactly the remaining bytes.
    if (off + kEndOfCentralDirSize + get_u16(b, off + 20) == b.size()) return off;
  }
  return std::string::npos;
}

void to_dos_time(std::time_t t, std::uint16_t& dos_time, std::uint16_t& dos_date) {
  std::tm tm{};
  if (t == 0 || localtime_r(&t, &tm) == nullptr || tm.tm_year < 80) {
    dos_time = 0;
    dos_date = (0 << 9) | (1 << 5) | 1;  // 1980-01-01
    return;
  }
  dos_time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  dos_date = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

Result<std::string> deflate_raw(const std::string& in) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return Result<std::string>::err(Status::internal("deflateInit2 failed"));
  }

  std::string out;
  out.resize(deflateBound(&zs, static_cast<uLong>(in.size())));

  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&zs, Z_FINISH);
  const uLong produced = zs.total_out;
  deflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    return Result<std::string>::err(Status::internal("deflate failed: " + std::to_string(rc)));
  }
  out.resize(produced);
  return Result<std::string>::ok(std::move(out));
}

Result<std::string> inflate_raw(const char* data, std::size_t size, std::uint64_t expected) {
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
    return Result<std::string>::err(Status::internal("inflateInit2 failed"));
  }

  std::string out;
  out.resize(static_cast<std::size_t>(expected));

  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  zs.avail_in = static_cast<uInt>(size);
  char scratch = 0;
  zs.next_out = out.empty() ? reinterpret_cast<Bytef*>(&scratch) : reinterpret_cast<Bytef*>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());

  int rc = inflate(&zs, Z_FINISH);
  if (rc == Z_BUF_ERROR && zs.avail_out == 0) {
    // Output is full but the stream has not ended: more data than declared.
    // One spare byte tells "exactly full" from "overflow".
    char spare = 0;
    zs.next_out = reinterpret_cast<Bytef*>(&spare);
    zs.avail_out = 1;
    rc = inflate(&zs, Z_FINISH);
    if (rc != Z_STREAM_END || zs.avail_out == 0) {
      inflateEnd(&zs);
      return Result<std::string>::err(Status::invalid_archive("entry inflates beyond its declared size"));
    }
  }
  const uLong produced = zs.total_out;
  inflateEnd(&zs);

  if (rc != Z_STREAM_END) {
    return Result<std::string>::err(Status::invalid_archive("corrupt deflate stream (zlib " + std::to_string(rc) + ")"));
  }
  if (produced != expected) {
    return Result<std::string>::err(Status::invalid_archive("entry size does not match its header"));
  }
  return Result<std::string>::ok(std::move(out));
}

}  // namespace

bool looks_like_zip(const std::string& bytes) { return find_eocd(bytes) != std::string::npos; }

Result<ZipReader> ZipReader::open(std::string bytes) {
  const std::size_t eocd = find_eocd(bytes);
  if (eocd == std::string::npos) {
    return Result<ZipReader>::err(Status::invalid_archive("no end-of-central-directory record"));
  }

  const std::uint16_t disk = get_u16(bytes, eocd + 4);
  const std::uint16_t cd_disk = get_u16(bytes, eocd + 6);
  const std::uint16_t total = get_u16(bytes, eocd + 10);
  const std::uint32_t cd_size = get_u32(bytes, eocd + 12);
  const std::uint32_t cd_offset = get_u32(bytes, eocd + 16);

  if (disk != 0 || cd_disk != 0) {
    return Result<ZipReader>::err(Status::invalid_archive("multi-disk archives are not supported"));
  }
  if (total == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu) {
    return Result<ZipReader>::err(Status::invalid_archive("zip64 archives are not supported"));
  }
  if (static_cast<std::uint64_t>(cd_offset) + cd_size > eocd) {
    return Result<ZipReader>::err(Status::invalid_archive("central directory out of bounds"));
  }

  ZipReader reader;
  reader.entries_.reserve(total);

  std::size_t pos = cd_offset;
  const std::size_t cd_end = static_cast<std::size_t>(cd_offset) + cd_size;
  for (std::uint16_t i = 0; i < total; ++i) {
    if (pos + kCentralHeaderSize > cd_end || get_u32(bytes, pos) != kCentralHeaderSig) {
      return Result<ZipReader>::err(Status::invalid_archive("bad central directory header"));
    }

    const std::uint16_t made_by = get_u16(bytes, pos + 4);
    const std::uint16_t flags = get_u16(bytes, pos + 8);
    const std::uint16_t name_len = get_u16(bytes, pos + 28);
    const std::uint16_t extra_len = get_u16(bytes, pos + 30);
    const std::uint16_t comment_len = get_u16(bytes, pos + 32);
    const std::uint32_t external = get_u32(bytes, pos + 38);

    if (pos + kCentralHeaderSize + name_len + extra_len + comment_len > cd_end) {
      return Result<ZipReader>::err(Status::invalid_archive("central directory entry out of bounds"));
    }
    if (flags & kFlagEncrypted) {
      return Result<ZipReader>::err(Status::invalid_archive("encrypted entries are not supported"));
    }

    ZipEntry e;
    e.method = get_u16(bytes, pos + 10);
    e.crc32 = get_u32(bytes, pos + 16);
    e.compressed_size = get_u32(bytes, pos + 20);
    e.uncompressed_size = get_u32(bytes, pos + 24);
    e.local_header_offset = get_u32(bytes, pos + 42);
    e.name = bytes.substr(pos + kCentralHeaderSize, name_len);

    if (e.compressed_size == 0xFFFFFFFFu || e.uncompressed_size == 0xFFFFFFFFu ||
        e.local_header_offset == 0xFFFFFFFFu) {
      return Result<ZipReader>::err(Status::invalid_archive("zip64 entries are not supported: " + e.name));
    }
    if (e.method != kMethodStored && e.method != kMethodDeflate) {
      return Result<ZipReader>::err(
          Status::invalid_archive("unsupported compression method " + std::to_string(e.method) + ": " + e.name));
    }

    if ((made_by >> 8) == 3) e.unix_mode = external >> 16;
    e.is_symlink = (e.unix_mode & kModeTypeMask) == kModeSymlink;
    e.is_directory = (!e.name.empty() && e.name.back() == '/') ||
                     (e.unix_mode & kModeTypeMask) == kModeDirectory;

    reader.entries_.push_back(std::move(e));
    pos += kCentralHeaderSize + name_len + extra_len + comment_len;
  }

  reader.data_ = std::move(bytes);
  return Result<ZipReader>::ok(std::move(reader));
}

Result<std::string> ZipReader::read(const ZipEntry& entry) const {
  const std::size_t off = static_cast<std::size_t>(entry.local_header_offset);
  if (off + kLocalHeaderSize > data_.size() || get_u32(data_, off) != kLocalHeaderSig) {
    return Result<std::string>::err(Status::invalid_archive("bad local header: " + entry.name));
  }

  const std::size_t name_len = get_u16(data_, off + 26);
  const std::size_t extra_len = get_u16(data_, off + 28);
  const std::size_t data_off = off + kLocalHeaderSize + name_len + extra_len;
  if (data_off + entry.compressed_size > data_.size()) {
    return Result<std::string>::err(Status::invalid_archive("entry data out of bounds: " + entry.name));
  }

  std::string out;
  if (entry.method == kMethodStored) {
    if (entry.compressed_size != entry.uncompressed_size) {
      return Result<std::string>::err(Status::invalid_archive("stored entry size mismatch: " + entry.name));
    }
    out = data_.substr(data_off, static_cast<std::size_t>(entry.compressed_size));
  } else {
    auto inflated = inflate_raw(data_.data() + data_off, static_cast<std::size_t>(entry.compressed_size),
                                entry.uncompressed_size);
    if (!inflated.ok()) {
      return Result<std::string>::err(
          Status(inflated.status().code(), inflated.status().message() + ": " + entry.name));
    }
    out = inflated.take_value();
  }

  if (crc32_of(out) != entry.crc32) {
    return Result<std::string>::err(Status::invalid_archive("CRC mismatch: " + entry.name));
  }
  return Result<std::string>::ok(std::move(out));
}

Status ZipWriter::add_entry_(const std::string& name, const std::string& bytes, bool compress,
                             std::uint32_t external_attrs, std::time_t mtime) {
  if (finished_) return Status::internal("ZipWriter: add after finish");
  if (name.empty() || name.size() > 0xFFFF) return Status::invalid_request("ZipWriter: bad entry name");
  if (central_.size() >= 0xFFFF) return Status::io_error("ZipWriter: too many entries for a zip32 archive");
  if (bytes.size() >= 0xFFFFFFFFu || out_.size() >= 0xFFFFFFFFu) {
    return Status::io_error("ZipWriter: archive exceeds zip32 limits at " + name);
  }

  CentralRecord rec{};
  rec.name = name;
  rec.crc32 = crc32_of(bytes);
  rec.uncompressed_size = static_cast<std::uint32_t>(bytes.size());
  rec.external_attrs = external_attrs;
  rec.local_header_offset = static_cast<std::uint32_t>(out_.size());
  to_dos_time(mtime, rec.dos_time, rec.dos_date);

  std::string payload;
  rec.method = kMethodStored;
  if (compress && !bytes.empty()) {
    auto deflated = deflate_raw(bytes);
    if (!deflated.ok()) return deflated.status();
    if (deflated->size() < bytes.size()) {
      payload = deflated.take_value();
      rec.method = kMethodDeflate;
    }
  }
  if (rec.method == kMethodStored) payload = bytes;
  rec.compressed_size = static_cast<std::uint32_t>(payload.size());

  put_u32(out_, kLocalHeaderSig);
  put_u16(out_, kVersionNeeded);
  put_u16(out_, kFlagUtf8);
  put_u16(out_, rec.method);
  put_u16(out_, rec.dos_time);
  put_u16(out_, rec.dos_date);
  put_u32(out_, rec.crc32);
  put_u32(out_, rec.compressed_size);
  put_u32(out_, rec.uncompressed_size);
  put_u16(out_, static_cast<std::uint16_t>(name.size()));
  put_u16(out_, 0);
  out_ += name;
  out_ += payload;

  central_.push_back(std::move(rec));
  return Status::ok_status();
}

Status ZipWriter::add_file(const std::string& name, const std::string& bytes, std::uint32_t unix_mode,
                           std::time_t mtime) {
  return add_entry_(name, bytes, /*compress=*/true, unix_mode << 16, mtime);
}

Status ZipWriter::add_directory(const std::string& name, std::uint32_t unix_mode, std::time_t mtime) {
  const std::string dir_name = (!name.empty() && name.back() == '/') ? name : name + "/";
  return add_entry_(dir_name, "", /*compress=*/false, ((unix_mode | kModeDirectory) << 16) | kDosDirectoryAttr,
                    mtime);
}

Status ZipWriter::add_symlink(const std::string& name, const std::string& target, std::time_t mtime) {
  return add_entry_(name, target, /*compress=*/false, (kModeSymlink | 0777u) << 16, mtime);
}

Result<std::string> ZipWriter::finish() {
  if (finished_) return Result<std::string>::err(Status::internal("ZipWriter: finish called twice"));
  finished_ = true;

  const std::size_t cd_offset = out_.size();
  for (const auto& rec : central_) {
    put_u32(out_, kCentralHeaderSig);
    put_u16(out_, kVersionMadeByUnix);
    put_u16(out_, kVersionNeeded);
    put_u16(out_, kFlagUtf8);
    put_u16(out_, rec.method);
    put_u16(out_, rec.dos_time);
    put_u16(out_, rec.dos_date);
    put_u32(out_, rec.crc32);
    put_u32(out_, rec.compressed_size);
    put_u32(out_, rec.uncompressed_size);
    put_u16(out_, static_cast<std::uint16_t>(rec.name.size()));
    put_u16(out_, 0);  // extra
    put_u16(out_, 0);  // comment
    put_u16(out_, 0);  // disk start
    put_u16(out_, 0);  // internal attrs
    put_u32(out_, rec.external_attrs);
    put_u32(out_, rec.local_header_offset);
    out_ += rec.name;
  }
  const std::size_t cd_size = out_.size() - cd_offset;
  if (out_.size() >= 0xFFFFFFFFu) {
    return Result<std::string>::err(Status::io_error("ZipWriter: archive exceeds zip32 limits"));
  }

  put_u32(out_, kEndOfCentralDirSig);
  put_u16(out_, 0);
  put_u16(out_, 0);
  put_u16(out_, static_cast<std::uint16_t>(central_.size()));
  put_u16(out_, static_cast<std::uint16_t>(central_.size()));
  put_u32(out_, static_cast<std::uint32_t>(cd_size));
  put_u32(out_, static_cast<std::uint32_t>(cd_offset));
  put_u16(out_, 0);

  return Result<std::string>::ok(std::move(out_));
}

Result<std::string> zip_directory(const std::filesystem::path& root,
                                  const std::vector<std::filesystem::path>& exclude) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return Result<std::string>::err(Status::not_found("not a directory: " + root.string()));
  }

  std::vector<fs::path> rel_paths;
  fs::recursive_directory_iterator it(root, ec);
  if (ec) return Result<std::string>::err(Status::io_error("failed listing " + root.string() + ": " + ec.message()));
  for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) return Result<std::string>::err(Status::io_error("failed listing " + root.string() + ": " + ec.message()));
    const fs::path rel = it->path().lexically_relative(root);
    if (std::find(exclude.begin(), exclude.end(), rel) != exclude.end()) continue;
    rel_paths.push_back(rel);
  }
  if (ec) return Result<std::string>::err(Status::io_error("failed listing " + root.string() + ": " + ec.message()));
  std::sort(rel_paths.begin(), rel_paths.end());

  ZipWriter zw;
  for (const auto& rel : rel_paths) {
    const fs::path full = root / rel;
    const std::string name = rel.generic_string();

    struct stat st {};
    if (::lstat(full.c_str(), &st) != 0) {
      return Result<std::string>::err(Status::io_error("failed to stat " + full.string()));
    }

    Status added;
    if (S_ISLNK(st.st_mode)) {
      const fs::path target = fs::read_symlink(full, ec);
      if (ec) return Result<std::string>::err(Status::io_error("failed reading link " + full.string()));
      added = zw.add_symlink(name, target.string(), st.st_mtime);
    } else if (S_ISDIR(st.st_mode)) {
      added = zw.add_directory(name, st.st_mode & 07777, st.st_mtime);
    } else if (S_ISREG(st.st_mode)) {
      auto bytes = read_file(full);
      if (!bytes.ok()) return Result<std::string>::err(bytes.status());
      added = zw.add_file(name, *bytes, S_IFREG | (st.st_mode & 07777), st.st_mtime);
    }
    if (!added.ok()) return Result<std::string>::err(added);
    // Sockets, FIFOs and devices are skipped.
  }

  return zw.finish();
}

}  // namespace runbox
