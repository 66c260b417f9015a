#pragma once
#include "domain/duplicate_detector.hpp"
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace ingest_service {

// Keeps the accepted keys in a process-wide set; subclasses decide the key.
class KeyedDuplicateDetector : public DuplicateDetector {
public:
  bool claim(const Submission& submission) override;
  void abandon(const Submission& submission) override;
  void seed(const PublishedArtifact& published) override;

  size_t size() const;

protected:
  virtual std::string keyOf(const Submission& submission) const = 0;
  virtual std::expected<std::string, std::string> keyOfArtifact(const PublishedArtifact& artifact) const = 0;

private:
  mutable std::mutex mtx_;
  std::unordered_set<std::string> keys_;
};

// SHA-256 of the uploaded bytes.
class ContentDuplicateDetector final : public KeyedDuplicateDetector {
public:
  IngestOutcome duplicateOutcome() const override { return IngestOutcome::SkippedDuplicate; }

  static std::string sha256Hex(std::string_view content);
  static std::expected<std::string, std::string> sha256HexOfFile(const std::filesystem::path& path);

protected:
  std::string keyOf(const Submission& submission) const override;
  std::expected<std::string, std::string> keyOfArtifact(const PublishedArtifact& artifact) const override;
};

// Sanitized client-declared filename.
class FilenameDuplicateDetector final : public KeyedDuplicateDetector {
public:
  IngestOutcome duplicateOutcome() const override { return IngestOutcome::AlreadyExists; }

protected:
  std::string keyOf(const Submission& submission) const override;
  std::expected<std::string, std::string> keyOfArtifact(const PublishedArtifact& artifact) const override;
};

// Accepts everything.
class NoDuplicateDetector final : public DuplicateDetector {
public:
  bool claim(const Submission&) override { return true; }
  void abandon(const Submission&) override {}
  void seed(const PublishedArtifact&) override {}
  IngestOutcome duplicateOutcome() const override { return IngestOutcome::SkippedDuplicate; }
};

// policy: "content", "filename" or "none"
std::expected<std::unique_ptr<DuplicateDetector>, std::string> makeDuplicateDetector(const std::string& policy);

} // namespace ingest_service
