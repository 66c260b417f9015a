#include "video_processor.hpp"
#include "infrastructure/duplicate_detectors.hpp"
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest_service {

VideoProcessor::VideoProcessor(std::shared_ptr<TranscodingService> transcoding_service,
                               std::shared_ptr<FileStore> file_store)
  : transcoding_service_(std::move(transcoding_service)),
    file_store_(std::move(file_store)) {}

ProcessReport VideoProcessor::process(Job job) {
  std::vector<fs::path> temp_paths{job.staged_path};
  ProcessReport report;
  try {
    report = run(job, temp_paths);
  } catch (const std::exception& e) {
    report = {ProcessOutcome::Dropped, std::nullopt, std::string("unexpected error: ") + e.what()};
    std::cerr << "[job " << job.id << "] " << report.message << std::endl;
  }
  cleanup(temp_paths);
  return report;
}

ProcessReport VideoProcessor::run(const Job& job, std::vector<fs::path>& temp_paths) {
  std::error_code ec;
  fs::path source = job.staged_path;
  if (!fs::exists(source, ec)) {
    std::cerr << "[job " << job.id << "] Staged file missing: " << source << std::endl;
    return {ProcessOutcome::Dropped, std::nullopt, "staged file missing: " + source.string()};
  }

  const std::string name = FileStore::sanitize(source.filename().string());
  if (name != source.filename().string()) {
    auto renamed = source.parent_path() / name;
    temp_paths.push_back(renamed);
    if (auto moved = FileStore::moveFile(source, renamed); !moved) {
      std::cerr << "[job " << job.id << "] " << moved.error() << std::endl;
      return {ProcessOutcome::Dropped, std::nullopt, moved.error()};
    }
    source = renamed;
  }

  // Taken before transcoding; the published artifact may no longer hash back to the upload.
  auto digest = ContentDuplicateDetector::sha256HexOfFile(source);
  if (!digest) {
    std::cerr << "[job " << job.id << "] No source digest: " << digest.error() << std::endl;
  }
  const SourceRecord record{job.source_name.empty() ? name : job.source_name, digest.value_or("")};

  const fs::path output = file_store_->tempPath(job.id + "_" + name + STAGING_OUTPUT_SUFFIX);
  temp_paths.push_back(output);

  auto result = transcoding_service_->transcode(source, output);
  if (!result) {
    // The transcoder never ran; still publish what we have.
    std::cerr << "[job " << job.id << "] Transcoder launch failed: " << result.error().message << std::endl;
    return publishOriginal(job, source, name, record, "transcoder launch failed: " + result.error().message);
  }

  const auto& run_report = *result;
  if (!run_report.succeeded()) {
    std::string reason = run_report.timed_out
      ? std::string("transcoder timed out")
      : "transcoder exited with code " + std::to_string(run_report.exit_code);
    std::cout << "[job " << job.id << "] " << reason << ", publishing original. "
              << run_report.diagnostics << std::endl;
    return publishOriginal(job, source, name, record, reason);
  }
  if (!fs::exists(output, ec)) {
    return publishOriginal(job, source, name, record, "transcoder produced no output");
  }

  auto published = file_store_->publish(output, transcodedName(name));
  if (!published) {
    std::cerr << "[job " << job.id << "] " << published.error() << std::endl;
    return publishOriginal(job, source, name, record, published.error());
  }
  keepSource(job, *published, record);

  fs::remove(source, ec);
  if (ec) {
    std::cerr << "[job " << job.id << "] Could not delete staged file " << source << ": " << ec.message() << std::endl;
  }
  std::cout << "[job " << job.id << "] Published " << published->filename().string() << std::endl;
  return {ProcessOutcome::Transcoded, *published, "transcoded"};
}

ProcessReport VideoProcessor::publishOriginal(const Job& job, const fs::path& source,
                                              const std::string& name, const SourceRecord& record,
                                              const std::string& reason) {
  auto published = file_store_->publish(source, name);
  if (!published) {
    std::cerr << "[job " << job.id << "] Fallback publish failed: " << published.error() << std::endl;
    return {ProcessOutcome::Dropped, std::nullopt, reason + "; " + published.error()};
  }
  keepSource(job, *published, record);
  std::cout << "[job " << job.id << "] Published original as " << published->filename().string() << std::endl;
  return {ProcessOutcome::Fallback, *published, reason};
}

std::string VideoProcessor::transcodedName(const std::string& name) {
  return fs::path(name).replace_extension(TRANSCODED_EXTENSION).string();
}

void VideoProcessor::keepSource(const Job& job, const fs::path& published, const SourceRecord& record) {
  if (record.sha256.empty()) {
    return;
  }
  if (auto kept = file_store_->recordSource(published, record); !kept) {
    std::cerr << "[job " << job.id << "] " << kept.error() << std::endl;
  }
}

void VideoProcessor::cleanup(const std::vector<fs::path>& temp_paths) {
  for (const auto& path : temp_paths) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      std::cerr << "[cleanup] Could not delete " << path << ": " << ec.message() << std::endl;
    }
  }
}

} // namespace ingest_service
