// File: src/adapters/s3/s3_object_store.cpp
#include "runbox/adapters/s3/s3_object_store.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace runbox {
namespace {

std::once_flag g_curl_init;

struct CurlDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

std::size_t collect_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const std::size_t n = size * nmemb;
  // Error bodies are short XML documents; cap what we keep.
  if (body->size() < 4096) body->append(ptr, std::min<std::size_t>(n, 4096 - body->size()));
  return n;
}

bool is_unreserved(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
         c == '.' || c == '~';
}

// Percent-encodes everything except unreserved characters and '/'.
std::string encode_key(const std::string& key) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size());
  for (unsigned char c : key) {
    if (is_unreserved(static_cast<char>(c)) || c == '/') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string trim_trailing_slash(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

}  // namespace

S3ObjectStore::S3ObjectStore(StoreConfig cfg) : cfg_(std::move(cfg)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string S3ObjectStore::object_url(const ObjectKey& key) const {
  if (!cfg_.endpoint.empty()) {
    return trim_trailing_slash(cfg_.endpoint) + "/" + cfg_.bucket + "/" + encode_key(key);
  }
  return "https://" + cfg_.bucket + ".s3." + cfg_.region + ".amazonaws.com/" + encode_key(key);
}

Result<std::string> S3ObjectStore::put(const Artifact& artifact) {
  if (cfg_.bucket.empty()) return Result<std::string>::err(Status::invalid_request("S3ObjectStore: bucket is empty"));
  if (artifact.key.empty()) return Result<std::string>::err(Status::invalid_request("S3ObjectStore: empty key"));

  CurlHandle h(curl_easy_init());
  if (!h) return Result<std::string>::err(Status::internal("S3ObjectStore: curl_easy_init failed"));

  const std::string url = object_url(artifact.key);
  const std::string sigv4 = "aws:amz:" + cfg_.region + ":s3";
  const std::string userpwd = cfg_.access_key_id + ":" + cfg_.secret_access_key;

  curl_slist* raw = nullptr;
  raw = curl_slist_append(raw, ("Content-Type: " + (artifact.content_type.empty()
                                                        ? std::string("application/octet-stream")
                                                        : artifact.content_type)).c_str());
  raw = curl_slist_append(raw, "Expect:");
  if (!cfg_.session_token.empty()) {
    raw = curl_slist_append(raw, ("x-amz-security-token: " + cfg_.session_token).c_str());
  }
  CurlHeaders headers(raw);

  std::string response;
  char errbuf[CURL_ERROR_SIZE] = {0};

  // PUT with an in-memory body so the signer can hash the payload.
  curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, "PUT");
  curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, artifact.bytes.data());
  curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(artifact.bytes.size()));
  curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
  curl_easy_setopt(h.get(), CURLOPT_USERPWD, userpwd.c_str());
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_s));
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);

  spdlog::debug("s3 PUT {} ({} bytes)", url, artifact.bytes.size());
  const CURLcode rc = curl_easy_perform(h.get());
  if (rc != CURLE_OK) {
    const std::string why = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
    return Result<std::string>::err(Status::io_error("S3 PUT " + artifact.key + " failed: " + why));
  }

  long http_code = 0;
  curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    return Result<std::string>::err(
        Status::io_error("S3 PUT " + artifact.key + " returned HTTP " + std::to_string(http_code) + ": " + response));
  }
  return Result<std::string>::ok(url);
}

}  // namespace runbox
