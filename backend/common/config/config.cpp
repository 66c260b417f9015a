#include "config.hpp"
#include <filesystem>
#include <fstream>

namespace config {

namespace {

template <typename T>
void read(const nlohmann::json& section, const char* key, T& target) {
  if (auto it = section.find(key); it != section.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

template <typename Duration>
void readDuration(const nlohmann::json& section, const char* key, Duration& target) {
  if (auto it = section.find(key); it != section.end() && !it->is_null()) {
    target = Duration(it->get<typename Duration::rep>());
  }
}

const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
  static const nlohmann::json empty = nlohmann::json::object();
  auto it = root.find(name);
  if (it == root.end()) {
    return empty;
  }
  if (!it->is_object()) {
    throw std::runtime_error(std::string("section '") + name + "' must be an object");
  }
  return *it;
}

} // namespace

std::expected<Config, std::string> Config::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected("Could not open config file: " + path);
  }
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected("Invalid JSON in " + path + ": " + e.what());
  }
  return fromJson(root);
}

std::expected<Config, std::string> Config::fromJson(const nlohmann::json& root) {
  if (!root.is_object()) {
    return std::unexpected("config root must be an object");
  }

  Config cfg;
  try {
    read(root, "environment", cfg.environment_);

    const auto& ingest = sectionOf(root, "ingest");
    read(ingest, "host", cfg.ingest_.host);
    read(ingest, "port", cfg.ingest_.port);
    read(ingest, "io_threads", cfg.ingest_.io_threads);
    read(ingest, "max_upload_bytes", cfg.ingest_.max_upload_bytes);

    read(sectionOf(root, "queue"), "capacity", cfg.queue_.capacity);
    read(sectionOf(root, "workers"), "threads", cfg.workers_.threads);

    const auto& storage = sectionOf(root, "storage");
    read(storage, "temp_dir", cfg.storage_.temp_dir);
    read(storage, "final_dir", cfg.storage_.final_dir);
    read(storage, "published_extension", cfg.storage_.published_extension);

    const auto& transcoder = sectionOf(root, "transcoder");
    read(transcoder, "binary", cfg.transcoder_.binary);
    read(transcoder, "codec", cfg.transcoder_.codec);
    read(transcoder, "preset", cfg.transcoder_.preset);
    read(transcoder, "crf", cfg.transcoder_.crf);
    read(transcoder, "audio_bitrate", cfg.transcoder_.audio_bitrate);
    read(transcoder, "max_width", cfg.transcoder_.max_width);
    read(transcoder, "max_height", cfg.transcoder_.max_height);
    readDuration(transcoder, "timeout_seconds", cfg.transcoder_.timeout);

    read(sectionOf(root, "dedup"), "policy", cfg.dedup_.policy);

    const auto& uploader = sectionOf(root, "uploader");
    read(uploader, "threads", cfg.uploader_.threads);
    read(uploader, "root_video_path", cfg.uploader_.root_video_path);
    read(uploader, "folder_prefix", cfg.uploader_.folder_prefix);
    if (auto it = uploader.find("hosts"); it != uploader.end()) {
      cfg.uploader_.hosts = it->get<std::map<std::string, std::string>>();
    }
    readDuration(uploader, "initial_backoff_ms", cfg.uploader_.initial_backoff);
    readDuration(uploader, "max_backoff_ms", cfg.uploader_.max_backoff);
    readDuration(uploader, "max_jitter_ms", cfg.uploader_.max_jitter);
    read(uploader, "max_retries", cfg.uploader_.max_retries);
    readDuration(uploader, "connect_timeout_ms", cfg.uploader_.connect_timeout);
    readDuration(uploader, "read_timeout_ms", cfg.uploader_.read_timeout);

    const auto& readiness = sectionOf(root, "readiness");
    read(readiness, "max_attempts", cfg.readiness_.max_attempts);
    readDuration(readiness, "interval_ms", cfg.readiness_.interval);
    readDuration(readiness, "timeout_ms", cfg.readiness_.timeout);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(std::string("Invalid config value: ") + e.what());
  } catch (const std::runtime_error& e) {
    return std::unexpected(std::string("Invalid config: ") + e.what());
  }

  if (cfg.environment_ != "local" && cfg.environment_ != "docker") {
    return std::unexpected("Invalid environment: " + cfg.environment_ + ". Must be either 'local' or 'docker'");
  }
  return cfg;
}

std::expected<void, std::string> Config::validateIngest(unsigned int hardware_threads) const {
  const unsigned int max_threads = hardware_threads + 2;
  if (workers_.threads == 0) {
    return std::unexpected("workers.threads must be set to a positive number");
  }
  if (workers_.threads > max_threads) {
    return std::unexpected("workers.threads must not exceed " + std::to_string(max_threads) +
                           " (available CPU cores + 2)");
  }
  if (queue_.capacity == 0) {
    return std::unexpected("queue.capacity must be set to a positive number");
  }
  if (ingest_.io_threads == 0) {
    return std::unexpected("ingest.io_threads must be set to a positive number");
  }
  if (ingest_.port == 0 || ingest_.port > 65535) {
    return std::unexpected("ingest.port is out of range: " + std::to_string(ingest_.port));
  }
  if (storage_.temp_dir.empty() || storage_.final_dir.empty()) {
    return std::unexpected("storage.temp_dir and storage.final_dir must be set");
  }
  if (std::filesystem::path(storage_.temp_dir) == std::filesystem::path(storage_.final_dir)) {
    return std::unexpected("storage.temp_dir must differ from storage.final_dir");
  }
  if (dedup_.policy != "content" && dedup_.policy != "filename" && dedup_.policy != "none") {
    return std::unexpected("dedup.policy must be one of content, filename, none");
  }
  if (transcoder_.timeout.count() <= 0) {
    return std::unexpected("transcoder.timeout_seconds must be positive");
  }
  return {};
}

std::expected<void, std::string> Config::validateUploader(unsigned int hardware_threads) const {
  const unsigned int max_threads = hardware_threads * 3;
  if (uploader_.threads == 0) {
    return std::unexpected("uploader.threads must be set to a positive number");
  }
  if (uploader_.threads > max_threads) {
    return std::unexpected("uploader.threads must not exceed " + std::to_string(max_threads) +
                           " (available CPU cores * 3)");
  }

  if (uploader_.root_video_path.empty()) {
    return std::unexpected("uploader.root_video_path must be set");
  }
  std::filesystem::path base_dir(uploader_.root_video_path);
  if (!base_dir.is_absolute()) {
    return std::unexpected("uploader.root_video_path must be an absolute path");
  }
  std::error_code ec;
  if (!std::filesystem::exists(base_dir, ec)) {
    return std::unexpected("Video directory does not exist: " + base_dir.string());
  }
  if (!std::filesystem::is_directory(base_dir, ec)) {
    return std::unexpected("Specified path is not a directory: " + base_dir.string());
  }

  if (uploader_.initial_backoff.count() <= 0 || uploader_.initial_backoff > uploader_.max_backoff) {
    return std::unexpected("uploader.initial_backoff_ms must be positive and not above max_backoff_ms");
  }
  if (uploader_.max_jitter.count() < 0) {
    return std::unexpected("uploader.max_jitter_ms must not be negative");
  }
  if (uploader_.max_retries <= 0) {
    return std::unexpected("uploader.max_retries must be set to a positive number");
  }
  if (readiness_.max_attempts <= 0) {
    return std::unexpected("readiness.max_attempts must be set to a positive number");
  }
  if (auto url = getIngestBaseUrl(); !url) {
    return std::unexpected(url.error());
  }
  return {};
}

std::expected<std::string, std::string> Config::getIngestBaseUrl() const {
  auto it = uploader_.hosts.find(environment_);
  if (it == uploader_.hosts.end()) {
    return std::unexpected("uploader.hosts has no entry for environment '" + environment_ + "'");
  }
  return "http://" + it->second;
}

} // namespace config
