#pragma once
#include "domain/upload_transport.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <curl/curl.h>

namespace uploader {

// libcurl client. Each call uses its own easy handle, so one instance can be
// shared by several upload workers.
class CurlUploadTransport : public UploadTransport {
public:
  struct Timeouts {
    std::chrono::milliseconds connect{5000};
    // Abort an upload that makes no progress for this long.
    std::chrono::milliseconds read{60000};
    std::chrono::milliseconds probe{5000};
  };

  CurlUploadTransport(std::string base_url, Timeouts timeouts);

  UploadResult upload(const std::filesystem::path& file) override;
  bool probe() override;

  const std::string& uploadUrl() const { return upload_url_; }

private:
  static size_t writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata);

  std::string upload_url_;
  std::string probe_url_;
  Timeouts timeouts_;
};

} // namespace uploader
