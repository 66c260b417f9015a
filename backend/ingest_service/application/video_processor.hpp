#pragma once

// project
#include "domain/duplicate_detector.hpp"
#include "domain/job.hpp"
#include "domain/transcoding_service.hpp"
#include "infrastructure/file_store.hpp"

// std
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ingest_service {

enum class ProcessOutcome {
  Transcoded,  // compressed output published
  Fallback,    // transcode failed, original published
  Dropped      // nothing published
};

struct ProcessReport {
  ProcessOutcome outcome{ProcessOutcome::Dropped};
  std::optional<std::filesystem::path> published;
  std::string message;
};

// Sanitize -> transcode -> publish -> clean up, for one job.
class VideoProcessor {
public:
  VideoProcessor(std::shared_ptr<TranscodingService> transcoding_service,
                 std::shared_ptr<FileStore> file_store);

  // Never throws. Every temp path created for the job is gone on return.
  ProcessReport process(Job job);

  // "clip.avi" -> "clip.mp4": transcoded output is published in its own container.
  static std::string transcodedName(const std::string& name);

private:
  ProcessReport run(const Job& job, std::vector<std::filesystem::path>& temp_paths);
  ProcessReport publishOriginal(const Job& job, const std::filesystem::path& source,
                                const std::string& name, const SourceRecord& record,
                                const std::string& reason);
  void keepSource(const Job& job, const std::filesystem::path& published, const SourceRecord& record);
  static void cleanup(const std::vector<std::filesystem::path>& temp_paths);

  std::shared_ptr<TranscodingService> transcoding_service_;
  std::shared_ptr<FileStore> file_store_;
};

} // namespace ingest_service
