#pragma once
#include "domain/job.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ingest_service {

struct Submission {
  std::string_view name;
  std::string_view content;
};

// What was uploaded to produce a published artifact. A transcoded artifact
// no longer carries the uploaded bytes or name, so this is kept beside it.
struct SourceRecord {
  std::string name;    // sanitized client-declared name
  std::string sha256;  // hex digest of the uploaded bytes
};

struct PublishedArtifact {
  std::filesystem::path path;
  std::optional<SourceRecord> source;
};

// Answers "was an equivalent submission already accepted". A claim is taken
// before admission and abandoned if the upload is not admitted after all.
class DuplicateDetector {
public:
  virtual ~DuplicateDetector() = default;

  // Returns false when the submission duplicates an accepted one.
  virtual bool claim(const Submission& submission) = 0;
  virtual void abandon(const Submission& submission) = 0;

  // Records an artifact found in the final store at startup.
  virtual void seed(const PublishedArtifact& published) = 0;

  // Response reported to the client for a rejected duplicate.
  virtual IngestOutcome duplicateOutcome() const = 0;
};

} // namespace ingest_service
