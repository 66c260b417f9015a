#include "duplicate_detectors.hpp"
#include "infrastructure/file_store.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <memory>
#include <openssl/evp.h>

namespace ingest_service {

namespace {

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string toHex(const unsigned char* data, unsigned int len) {
  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; i++) {
    char buf[3];
    snprintf(buf, sizeof(buf), "%02x", data[i]);
    hex += buf;
  }
  return hex;
}

EvpCtx newSha256() {
  EvpCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialise SHA-256 digest");
  }
  return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalise SHA-256 digest");
  }
  return toHex(hash, hash_len);
}

} // namespace

bool KeyedDuplicateDetector::claim(const Submission& submission) {
  auto key = keyOf(submission);
  std::lock_guard<std::mutex> lock{mtx_};
  return keys_.insert(std::move(key)).second;
}

void KeyedDuplicateDetector::abandon(const Submission& submission) {
  auto key = keyOf(submission);
  std::lock_guard<std::mutex> lock{mtx_};
  keys_.erase(key);
}

void KeyedDuplicateDetector::seed(const PublishedArtifact& published) {
  auto key = keyOfArtifact(published);
  if (!key) {
    std::cerr << "[dedup] Skipping " << published.path << ": " << key.error() << std::endl;
    return;
  }
  std::lock_guard<std::mutex> lock{mtx_};
  keys_.insert(std::move(*key));
}

size_t KeyedDuplicateDetector::size() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return keys_.size();
}

std::string ContentDuplicateDetector::sha256Hex(std::string_view content) {
  auto ctx = newSha256();
  if (EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1) {
    throw std::runtime_error("Failed to update SHA-256 digest");
  }
  return finish(ctx.get());
}

std::expected<std::string, std::string> ContentDuplicateDetector::sha256HexOfFile(
    const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected("cannot open " + path.string());
  }
  auto ctx = newSha256();
  std::vector<char> buffer(1 << 16);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (auto n = in.gcount(); n > 0) {
      if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
        return std::unexpected("digest update failed for " + path.string());
      }
    }
  }
  if (in.bad()) {
    return std::unexpected("read error on " + path.string());
  }
  return finish(ctx.get());
}

std::string ContentDuplicateDetector::keyOf(const Submission& submission) const {
  return sha256Hex(submission.content);
}

std::expected<std::string, std::string> ContentDuplicateDetector::keyOfArtifact(
    const PublishedArtifact& artifact) const {
  if (artifact.source) {
    return artifact.source->sha256;
  }
  // Published without a record: only an untranscoded original hashes back to its upload.
  return sha256HexOfFile(artifact.path);
}

std::string FilenameDuplicateDetector::keyOf(const Submission& submission) const {
  return FileStore::sanitize(submission.name);
}

std::expected<std::string, std::string> FilenameDuplicateDetector::keyOfArtifact(
    const PublishedArtifact& artifact) const {
  if (artifact.source) {
    return artifact.source->name;
  }
  return artifact.path.filename().string();
}

std::expected<std::unique_ptr<DuplicateDetector>, std::string> makeDuplicateDetector(const std::string& policy) {
  if (policy == "content") {
    return std::make_unique<ContentDuplicateDetector>();
  }
  if (policy == "filename") {
    return std::make_unique<FilenameDuplicateDetector>();
  }
  if (policy == "none") {
    return std::make_unique<NoDuplicateDetector>();
  }
  return std::unexpected("Unknown dedup policy: " + policy);
}

} // namespace ingest_service
