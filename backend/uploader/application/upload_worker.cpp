#include "upload_worker.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

namespace uploader {

UploadWorker::UploadWorker(std::filesystem::path folder,
                           std::shared_ptr<UploadTransport> transport,
                           BackoffPolicy backoff,
                           int max_retries,
                           Sleeper sleeper)
  : folder_(std::move(folder)),
    transport_(std::move(transport)),
    backoff_(std::move(backoff)),
    max_retries_(max_retries),
    sleeper_(std::move(sleeper)),
    tag_("[uploader " + folder_.filename().string() + "] ") {}

std::vector<std::filesystem::path> UploadWorker::listFiles(const std::filesystem::path& folder) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

UploadSummary UploadWorker::run() {
  UploadSummary summary;
  summary.folder = folder_.string();

  auto files = listFiles(folder_);
  std::cout << tag_ << files.size() << " file(s) to upload" << std::endl;

  for (const auto& file : files) {
    switch (uploadFile(file)) {
      case FileOutcome::Uploaded: summary.uploaded++; break;
      case FileOutcome::Abandoned: summary.abandoned++; break;
      case FileOutcome::Failed: summary.failed++; break;
    }
  }

  std::cout << tag_ << "done: " << summary.uploaded << " uploaded, "
            << summary.abandoned << " abandoned, " << summary.failed << " failed" << std::endl;
  return summary;
}

FileOutcome UploadWorker::uploadFile(const std::filesystem::path& file) {
  const auto name = file.filename().string();
  int backpressure = 0;

  while (true) {
    UploadResult result;
    try {
      result = transport_->upload(file);
    } catch (const std::exception& e) {
      std::cerr << tag_ << "Upload of " << name << " failed: " << e.what() << std::endl;
      return FileOutcome::Failed;
    }

    switch (result.status) {
      case UploadStatus::Accepted:
        std::cout << tag_ << "Uploaded " << name << ": " << result.message << std::endl;
        return FileOutcome::Uploaded;

      case UploadStatus::Backpressure: {
        if (++backpressure >= max_retries_) {
          std::cerr << tag_ << "Giving up on " << name << " after "
                    << backpressure << " queue-full responses" << std::endl;
          return FileOutcome::Abandoned;
        }
        auto wait = backoff_.delay(backpressure - 1);
        std::cout << tag_ << "Queue full, retrying " << name << " in "
                  << wait.count() << " ms" << std::endl;
        sleeper_(wait);
        break;
      }

      case UploadStatus::Rejected:
        std::cerr << tag_ << "Upload of " << name << " rejected with HTTP "
                  << result.http_code << ": " << result.message << std::endl;
        return FileOutcome::Failed;

      case UploadStatus::TransportError:
        std::cerr << tag_ << "Upload of " << name << " failed: " << result.message << std::endl;
        return FileOutcome::Failed;
    }
  }
}

} // namespace uploader
