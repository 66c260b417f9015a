#pragma once

// project
#include "domain/name_registry.hpp"

// std
#include <chrono>
#include <filesystem>
#include <string>

namespace ingest_service {

// One admitted upload. Move-only: exactly one owner at a time (the job store
// while queued, then the worker that dequeued it).
struct Job {
  std::string id;                      // uuid, also the temp output token
  std::filesystem::path staged_path;   // file in the temp area
  std::string display_name;            // sanitized, collision-resolved final name
  std::string source_name;             // sanitized client-declared name
  NameReservation reservation;         // holds display_name until the job dies
  std::chrono::steady_clock::time_point admitted_at{std::chrono::steady_clock::now()};

  Job() = default;
  Job(Job&&) = default;
  Job& operator=(Job&&) = default;
  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;
};

enum class IngestOutcome {
  Queued,
  AlreadyExists,
  SkippedDuplicate,
  QueueFull,
  BadRequest,
  Failed
};

inline const char* toString(IngestOutcome outcome) {
  switch (outcome) {
    case IngestOutcome::Queued: return "queued";
    case IngestOutcome::AlreadyExists: return "already exists";
    case IngestOutcome::SkippedDuplicate: return "skipped duplicate";
    case IngestOutcome::QueueFull: return "queue full";
    case IngestOutcome::BadRequest: return "bad request";
    case IngestOutcome::Failed: return "failed";
  }
  return "unknown";
}

// Container the transcoder always writes.
#define TRANSCODED_EXTENSION ".mp4"
#define STAGING_OUTPUT_SUFFIX ".transcoding" TRANSCODED_EXTENSION

} // namespace ingest_service
