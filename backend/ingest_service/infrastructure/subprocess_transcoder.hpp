// subprocess_transcoder.hpp
#pragma once

#include "domain/transcoding_service.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace ingest_service {

// Runs an ffmpeg-compatible binary as a child process, one call per job.
class SubprocessTranscoder : public TranscodingService {
public:
  struct Options {
    std::string binary{"ffmpeg"};  // absolute, or looked up on PATH
    std::string codec{"libx264"};
    std::string preset{"medium"};
    int crf{28};
    std::string audio_bitrate{"128k"};
    int max_width{1280};
    int max_height{720};
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  };

  explicit SubprocessTranscoder(Options options);

  std::expected<TranscodeReport, TranscodeError> transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path
  ) override;

  std::vector<std::string> buildArguments(const std::filesystem::path& input_path,
                                          const std::filesystem::path& output_path) const;

  // Kept from the child's stderr for diagnostics.
  static constexpr size_t kDiagnosticsTail = 4096;

private:
  Options options_;
};

} // namespace ingest_service
