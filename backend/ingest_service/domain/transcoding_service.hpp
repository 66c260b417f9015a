#pragma once
#include <expected>
#include <filesystem>
#include <string>

namespace ingest_service {

// Outcome of a transcoder process that was started.
struct TranscodeReport {
  int exit_code{-1};
  bool timed_out{false};
  std::string diagnostics;  // tail of the process' stderr

  bool succeeded() const { return !timed_out && exit_code == 0; }
};

// The transcoder could not be started at all.
struct TranscodeError {
  std::string message;
};

class TranscodingService {
public:
  virtual ~TranscodingService() = default;
  virtual std::expected<TranscodeReport, TranscodeError> transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path
  ) = 0;
};

} // namespace ingest_service
