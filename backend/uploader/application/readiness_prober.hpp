#pragma once
#include "domain/upload_transport.hpp"
#include "backoff_policy.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace uploader {

class ReadinessProber {
public:
  ReadinessProber(std::shared_ptr<UploadTransport> transport,
                  int max_attempts,
                  std::chrono::milliseconds interval,
                  Sleeper sleeper = sleepFor);

  // Returns the number of attempts used, or an error once max_attempts
  // probes have failed.
  std::expected<int, std::string> waitUntilReady();

private:
  std::shared_ptr<UploadTransport> transport_;
  int max_attempts_;
  std::chrono::milliseconds interval_;
  Sleeper sleeper_;
};

} // namespace uploader
