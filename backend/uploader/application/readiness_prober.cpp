#include "readiness_prober.hpp"
#include <iostream>

namespace uploader {

ReadinessProber::ReadinessProber(std::shared_ptr<UploadTransport> transport,
                                 int max_attempts,
                                 std::chrono::milliseconds interval,
                                 Sleeper sleeper)
  : transport_(std::move(transport)),
    max_attempts_(max_attempts),
    interval_(interval),
    sleeper_(std::move(sleeper)) {}

std::expected<int, std::string> ReadinessProber::waitUntilReady() {
  for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
    bool ready = false;
    try {
      ready = transport_->probe();
    } catch (const std::exception& e) {
      std::cerr << "[readiness] probe error: " << e.what() << std::endl;
    }
    if (ready) {
      std::cout << "[readiness] Ingest service is up (attempt " << attempt << ")" << std::endl;
      return attempt;
    }
    std::cout << "[readiness] Ingest service not ready (attempt " << attempt
              << "/" << max_attempts_ << ")" << std::endl;
    if (attempt < max_attempts_) {
      sleeper_(interval_);
    }
  }
  return std::unexpected("Ingest service did not become ready after " +
                         std::to_string(max_attempts_) + " attempts");
}

} // namespace uploader
