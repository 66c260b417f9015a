#include "curl_upload_transport.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>

namespace uploader {

namespace {

struct EasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct MimeDeleter {
  void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using Easy = std::unique_ptr<CURL, EasyDeleter>;

Easy newEasy() {
  // curl_global_init is not thread-safe; run it once per process.
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

  Easy curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("Failed to initialize CURL");
  }
  return curl;
}

} // namespace

CurlUploadTransport::CurlUploadTransport(std::string base_url, Timeouts timeouts)
  : upload_url_(base_url + "/upload"),
    probe_url_(base_url + "/queue-status"),
    timeouts_(timeouts) {}

UploadResult CurlUploadTransport::upload(const std::filesystem::path& file) {
  auto curl = newEasy();
  std::string body;

  std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
  curl_mimepart* part = curl_mime_addpart(mime.get());
  curl_mime_name(part, "file");
  // Streams the file from disk while sending; filename is the basename.
  if (curl_mime_filedata(part, file.c_str()) != CURLE_OK) {
    return {UploadStatus::TransportError, 0, "cannot read " + file.string()};
  }
  curl_mime_type(part, "application/octet-stream");

  // The ingest server does not answer "Expect: 100-continue".
  std::unique_ptr<curl_slist, SlistDeleter> headers(curl_slist_append(nullptr, "Expect:"));

  curl_easy_setopt(curl.get(), CURLOPT_URL, upload_url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts_.connect.count()));
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                   static_cast<long>(std::chrono::ceil<std::chrono::seconds>(timeouts_.read).count()));

  auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    return {UploadStatus::TransportError, 0, curl_easy_strerror(res)};
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code == 200) {
    return {UploadStatus::Accepted, http_code, body};
  }
  if (http_code == 503) {
    return {UploadStatus::Backpressure, http_code, body};
  }
  return {UploadStatus::Rejected, http_code, body};
}

bool CurlUploadTransport::probe() {
  auto curl = newEasy();
  std::string body;

  curl_easy_setopt(curl.get(), CURLOPT_URL, probe_url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts_.connect.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeouts_.probe.count()));

  if (curl_easy_perform(curl.get()) != CURLE_OK) {
    return false;
  }
  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  return http_code == 200;
}

size_t CurlUploadTransport::writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(static_cast<char*>(ptr), size * nmemb);
  return size * nmemb;
}

} // namespace uploader
