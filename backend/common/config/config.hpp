#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>
#include <expected>
#include <map>
#include <nlohmann/json.hpp>

namespace config {

struct IngestConfig {
  std::string host{"0.0.0.0"};
  unsigned int port{8080};
  unsigned int io_threads{2};
  std::uint64_t max_upload_bytes{2ULL * 1024 * 1024 * 1024};
};

struct QueueConfig {
  size_t capacity{4};
};

struct WorkerConfig {
  unsigned int threads{2};
};

struct StorageConfig {
  std::string temp_dir{"/tmp/vidferry/staging"};
  std::string final_dir{"/tmp/vidferry/uploads"};
  std::string published_extension{".mp4"};
};

struct TranscoderConfig {
  std::string binary{"ffmpeg"};
  std::string codec{"libx264"};
  std::string preset{"medium"};
  int crf{28};
  std::string audio_bitrate{"128k"};
  int max_width{1280};
  int max_height{720};
  std::chrono::seconds timeout{600};
};

struct DedupConfig {
  std::string policy{"content"};  // "content", "filename" or "none"
};

struct UploaderConfig {
  unsigned int threads{1};
  std::string root_video_path;
  std::string folder_prefix{"folder"};
  std::map<std::string, std::string> hosts{
    {"local", "localhost:8080"},
    {"docker", "consumer:8080"}
  };
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{30000};
  std::chrono::milliseconds max_jitter{1000};
  int max_retries{10};
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds read_timeout{60000};
};

struct ReadinessConfig {
  int max_attempts{10};
  std::chrono::milliseconds interval{5000};
  std::chrono::milliseconds timeout{5000};
};

class Config {
public:
  static std::expected<Config, std::string> loadFile(const std::string& path);
  static std::expected<Config, std::string> fromJson(const nlohmann::json& root);

  Config() = default;

  // Startup checks, one per program. hardware_threads is normally
  // std::thread::hardware_concurrency().
  std::expected<void, std::string> validateIngest(unsigned int hardware_threads) const;
  std::expected<void, std::string> validateUploader(unsigned int hardware_threads) const;

  // Getters
  const std::string& getEnvironment() const { return environment_; }
  const IngestConfig& getIngest() const { return ingest_; }
  const QueueConfig& getQueue() const { return queue_; }
  const WorkerConfig& getWorkers() const { return workers_; }
  const StorageConfig& getStorage() const { return storage_; }
  const TranscoderConfig& getTranscoder() const { return transcoder_; }
  const DedupConfig& getDedup() const { return dedup_; }
  const UploaderConfig& getUploader() const { return uploader_; }
  const ReadinessConfig& getReadiness() const { return readiness_; }

  // "http://host:port" of the ingest service for the configured environment
  std::expected<std::string, std::string> getIngestBaseUrl() const;

private:
  std::string environment_{"local"};
  IngestConfig ingest_;
  QueueConfig queue_;
  WorkerConfig workers_;
  StorageConfig storage_;
  TranscoderConfig transcoder_;
  DedupConfig dedup_;
  UploaderConfig uploader_;
  ReadinessConfig readiness_;
};

} // namespace config
