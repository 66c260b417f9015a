// subprocess_transcoder.cpp
#include "subprocess_transcoder.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace ingest_service {

namespace {

std::string tail(std::string text, size_t max) {
  if (text.size() > max) {
    text.erase(0, text.size() - max);
  }
  return text;
}

} // namespace

SubprocessTranscoder::SubprocessTranscoder(Options options) : options_(std::move(options)) {}

std::vector<std::string> SubprocessTranscoder::buildArguments(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path) const {
  const std::string scale =
    "scale=w='min(" + std::to_string(options_.max_width) + ",iw)'" +
    ":h='min(" + std::to_string(options_.max_height) + ",ih)'" +
    ":force_original_aspect_ratio=decrease:force_divisible_by=2";

  return {
    "-hide_banner", "-nostdin", "-y",
    "-i", input_path.string(),
    "-c:v", options_.codec,
    "-preset", options_.preset,
    "-crf", std::to_string(options_.crf),
    "-vf", scale,
    "-c:a", "aac",
    "-b:a", options_.audio_bitrate,
    "-movflags", "+faststart",
    output_path.string()
  };
}

std::expected<TranscodeReport, TranscodeError> SubprocessTranscoder::transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path) {
  boost::filesystem::path exe(options_.binary);
  if (!exe.has_parent_path()) {
    exe = bp::search_path(options_.binary);
    if (exe.empty()) {
      return std::unexpected(TranscodeError{options_.binary + " is not installed or not found in PATH"});
    }
  }

  boost::asio::io_context ios;
  std::future<std::string> stderr_output;
  std::error_code ec;

  bp::child child(exe, bp::args(buildArguments(input_path, output_path)),
                  bp::std_in < bp::null,
                  bp::std_out > bp::null,
                  bp::std_err > stderr_output,
                  ios, ec);
  if (ec) {
    return std::unexpected(TranscodeError{"Failed to launch " + exe.string() + ": " + ec.message()});
  }

  TranscodeReport report;
  const auto deadline = std::chrono::steady_clock::now() + options_.timeout;

  // Returns once the child has closed stderr or the deadline passes.
  ios.run_until(deadline);

  // stderr can close a moment before the process is reaped.
  while (child.running(ec) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (child.running(ec)) {
    report.timed_out = true;
    child.terminate(ec);
    // Let the pipe reader observe EOF now that the process is gone.
    ios.restart();
    ios.run_for(std::chrono::seconds(1));
  }
  child.wait(ec);
  report.exit_code = ec ? -1 : child.exit_code();

  if (stderr_output.valid() &&
      stderr_output.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    try {
      report.diagnostics = tail(stderr_output.get(), kDiagnosticsTail);
    } catch (const std::exception& e) {
      report.diagnostics = std::string("stderr unavailable: ") + e.what();
    }
  }
  return report;
}

} // namespace ingest_service
