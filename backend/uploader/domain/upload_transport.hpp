#pragma once
#include <filesystem>
#include <string>

namespace uploader {

enum class UploadStatus {
  Accepted,        // 200
  Backpressure,    // 503, queue full on the ingest side
  Rejected,        // any other HTTP status
  TransportError   // no HTTP response at all
};

struct UploadResult {
  UploadStatus status{UploadStatus::TransportError};
  long http_code{0};
  std::string message;
};

class UploadTransport {
public:
  virtual ~UploadTransport() = default;

  // Sends the whole file as one multipart/form-data POST (field "file").
  virtual UploadResult upload(const std::filesystem::path& file) = 0;

  // One readiness check against the ingest service.
  virtual bool probe() = 0;
};

inline const char* toString(UploadStatus status) {
  switch (status) {
    case UploadStatus::Accepted: return "accepted";
    case UploadStatus::Backpressure: return "backpressure";
    case UploadStatus::Rejected: return "rejected";
    case UploadStatus::TransportError: return "transport error";
  }
  return "unknown";
}

} // namespace uploader
