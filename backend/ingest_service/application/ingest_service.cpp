#include "ingest_service.hpp"
#include <iostream>
#include <system_error>
#include <uuid/uuid.h>

namespace ingest_service {

namespace {

constexpr int kMaxNameVariants = 100000;

// Last path component of a client-declared name, either separator style.
std::string baseName(std::string_view declared) {
  auto pos = declared.find_last_of("/\\");
  if (pos != std::string_view::npos) {
    declared.remove_prefix(pos + 1);
  }
  return std::string(declared);
}

} // namespace

IngestService::IngestService(JobStore& store,
                             std::shared_ptr<FileStore> file_store,
                             std::shared_ptr<DuplicateDetector> duplicate_detector,
                             std::shared_ptr<NameRegistry> name_registry)
  : store_(store),
    file_store_(std::move(file_store)),
    duplicate_detector_(std::move(duplicate_detector)),
    name_registry_(std::move(name_registry)) {}

IngestResult IngestService::upload(std::string_view declared_name, std::string_view content) {
  const std::string base = baseName(declared_name);
  if (base.empty() || base == "." || base == ".." || base.find('\0') != std::string::npos) {
    return {IngestOutcome::BadRequest, base, "invalid file name"};
  }

  const Submission submission{base, content};
  if (!duplicate_detector_->claim(submission)) {
    std::cout << "[ingest] Duplicate upload skipped: " << base << std::endl;
    return {duplicate_detector_->duplicateOutcome(), base, "duplicate of an accepted upload"};
  }

  auto reserved = reserveFinalName(base);
  if (!reserved) {
    duplicate_detector_->abandon(submission);
    std::cerr << "[ingest] " << reserved.error() << std::endl;
    return {IngestOutcome::Failed, base, reserved.error()};
  }
  const std::string final_name = reserved->reservation.name();

  if (!store_.tryAdmit()) {
    duplicate_detector_->abandon(submission);
    std::cout << "[ingest] Queue full, rejecting " << base << std::endl;
    return {IngestOutcome::QueueFull, final_name, "queue full"};
  }

  auto staged = file_store_->stage(reserved->candidate, content);
  if (!staged) {
    store_.release();
    duplicate_detector_->abandon(submission);
    std::cerr << "[ingest] " << staged.error() << std::endl;
    return {IngestOutcome::Failed, final_name, staged.error()};
  }

  Job job;
  job.id = newJobId();
  job.staged_path = *staged;
  job.display_name = final_name;
  job.source_name = FileStore::sanitize(base);
  job.reservation = std::move(reserved->reservation);
  const std::string job_id = job.id;

  if (auto queued = store_.enqueue(std::move(job)); !queued) {
    std::error_code ec;
    std::filesystem::remove(queued.error().staged_path, ec);
    store_.release();
    duplicate_detector_->abandon(submission);
    return {IngestOutcome::Failed, final_name, "service is shutting down"};
  }

  std::cout << "[ingest] Queued " << final_name << " as job " << job_id
            << " (" << store_.occupancy() << "/" << store_.capacity() << ")" << std::endl;
  return {IngestOutcome::Queued, final_name, "queued"};
}

QueueStatus IngestService::status() const {
  return {store_.occupancy(), store_.capacity(), store_.queued()};
}

std::vector<std::string> IngestService::listVideos() const {
  return file_store_->listPublished();
}

size_t IngestService::seedDuplicates() {
  auto artifacts = file_store_->publishedArtifacts();
  for (const auto& artifact : artifacts) {
    duplicate_detector_->seed(artifact);
  }
  return artifacts.size();
}

std::expected<IngestService::ReservedName, std::string> IngestService::reserveFinalName(const std::string& base) {
  for (int n = 0; n <= kMaxNameVariants; ++n) {
    std::string candidate = n == 0 ? base : FileStore::numberedVariant(base, n);
    std::string final_name = FileStore::sanitize(candidate);
    if (file_store_->publishedExists(final_name)) {
      continue;
    }
    if (auto reservation = name_registry_->reserve(final_name)) {
      return ReservedName{std::move(candidate), std::move(*reservation)};
    }
  }
  return std::unexpected("No free name for " + base);
}

std::string IngestService::newJobId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

} // namespace ingest_service
