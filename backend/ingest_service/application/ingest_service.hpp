#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "application/job_store.hpp"
#include "domain/duplicate_detector.hpp"
#include "domain/job.hpp"
#include "domain/name_registry.hpp"
#include "infrastructure/file_store.hpp"

namespace ingest_service {

struct IngestResult {
  IngestOutcome outcome;
  std::string name;     // final name the upload will be published under
  std::string message;
};

struct QueueStatus {
  size_t occupancy{0};
  size_t capacity{0};
  size_t queued{0};
};

class IngestService {
public:
  IngestService(JobStore& store,
                std::shared_ptr<FileStore> file_store,
                std::shared_ptr<DuplicateDetector> duplicate_detector,
                std::shared_ptr<NameRegistry> name_registry);

  // Dedup check, final-name reservation, admission, staging, enqueue. Writes
  // nothing to disk unless the upload is admitted.
  IngestResult upload(std::string_view declared_name, std::string_view content);

  QueueStatus status() const;
  std::vector<std::string> listVideos() const;

  // Rebuilds the dedup records from the final store. Returns the number of
  // artifacts scanned.
  size_t seedDuplicates();

private:
  struct ReservedName {
    std::string candidate;  // unsanitized, used for the staged file
    NameReservation reservation;
  };

  std::expected<ReservedName, std::string> reserveFinalName(const std::string& base);
  static std::string newJobId();

  JobStore& store_;
  std::shared_ptr<FileStore> file_store_;
  std::shared_ptr<DuplicateDetector> duplicate_detector_;
  std::shared_ptr<NameRegistry> name_registry_;
};

} // namespace ingest_service
