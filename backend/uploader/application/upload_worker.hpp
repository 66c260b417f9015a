#pragma once
#include "domain/upload_transport.hpp"
#include "backoff_policy.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace uploader {

enum class FileOutcome { Uploaded, Abandoned, Failed };

struct UploadSummary {
  std::string folder;
  size_t uploaded{0};
  size_t abandoned{0};
  size_t failed{0};
};

// Uploads the regular files of one folder, one at a time, in name order.
class UploadWorker {
public:
  UploadWorker(std::filesystem::path folder,
               std::shared_ptr<UploadTransport> transport,
               BackoffPolicy backoff,
               int max_retries,
               Sleeper sleeper = sleepFor);

  UploadSummary run();

  // Retries on backpressure until accepted or max_retries 503s were seen
  FileOutcome uploadFile(const std::filesystem::path& file);

  static std::vector<std::filesystem::path> listFiles(const std::filesystem::path& folder);

private:
  std::filesystem::path folder_;
  std::shared_ptr<UploadTransport> transport_;
  BackoffPolicy backoff_;
  int max_retries_;
  Sleeper sleeper_;
  std::string tag_;
};

} // namespace uploader
