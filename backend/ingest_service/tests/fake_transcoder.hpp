#pragma once
#include <atomic>
#include <fstream>
#include <mutex>
#include <vector>

#include "domain/transcoding_service.hpp"

namespace ingest_service::test_support {

// Scripted stand-in for the ffmpeg subprocess.
class FakeTranscoder : public TranscodingService {
public:
  enum class Mode { Succeed, ExitNonZero, LaunchFailure, TimeOut, SucceedWithoutOutput };

  explicit FakeTranscoder(Mode mode = Mode::Succeed) : mode_(mode) {}

  std::expected<TranscodeReport, TranscodeError> transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path) override {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      inputs_.push_back(input_path);
    }
    calls_++;

    TranscodeReport report;
    switch (mode_) {
      case Mode::Succeed: {
        std::ofstream out(output_path, std::ios::binary);
        out << "transcoded";
        report.exit_code = 0;
        return report;
      }
      case Mode::ExitNonZero:
        // Real encoders often leave a partial file behind.
        std::ofstream(output_path, std::ios::binary) << "partial";
        report.exit_code = 1;
        report.diagnostics = "Invalid data found when processing input";
        return report;
      case Mode::LaunchFailure:
        return std::unexpected(TranscodeError{"ffmpeg is not installed or not found in PATH"});
      case Mode::TimeOut:
        report.timed_out = true;
        report.exit_code = -1;
        return report;
      case Mode::SucceedWithoutOutput:
        report.exit_code = 0;
        return report;
    }
    return report;
  }

  int calls() const { return calls_.load(); }

  std::vector<std::filesystem::path> inputs() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return inputs_;
  }

private:
  Mode mode_;
  std::atomic<int> calls_{0};
  mutable std::mutex mtx_;
  std::vector<std::filesystem::path> inputs_;
};

} // namespace ingest_service::test_support
