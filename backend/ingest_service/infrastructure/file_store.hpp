#pragma once

#include "domain/duplicate_detector.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ingest_service {

// Owns the two storage areas: the temp (staging) area and the final store the
// listing endpoint reads from.
class FileStore {
public:
  FileStore(std::filesystem::path temp_dir, std::filesystem::path final_dir,
            std::string published_extension);

  // Creates both directories if missing.
  std::expected<void, std::string> bootstrap() const;

  // Replaces \ / : * ? " < > | and whitespace with '_'.
  static std::string sanitize(std::string_view name);
  // "clip.mp4", 2 -> "clip_2.mp4"
  static std::string numberedVariant(const std::string& name, int n);

  // Renames src to dst; across filesystems falls back to copy + delete, which
  // leaves a partially written dst visible while the copy runs.
  static std::expected<void, std::string> moveFile(const std::filesystem::path& src,
                                                   const std::filesystem::path& dst);

  bool publishedExists(const std::string& name) const;

  std::expected<std::filesystem::path, std::string> stage(const std::string& name,
                                                          std::string_view content) const;

  // Moves src into the final store as name, or name_1, name_2, ... if taken.
  // Never replaces an existing artifact.
  std::expected<std::filesystem::path, std::string> publish(const std::filesystem::path& src,
                                                            const std::string& name);

  // Stores what an artifact was published from under <final>/.sources/.
  std::expected<void, std::string> recordSource(const std::filesystem::path& published,
                                                const SourceRecord& source) const;
  std::optional<SourceRecord> sourceOf(const std::filesystem::path& published) const;

  // Published artifact names carrying the media extension, sorted.
  std::vector<std::string> listPublished() const;
  std::vector<std::filesystem::path> publishedFiles() const;
  // Every published file with its source record, if one was kept.
  std::vector<PublishedArtifact> publishedArtifacts() const;

  std::filesystem::path tempPath(const std::string& name) const { return temp_dir_ / name; }
  const std::filesystem::path& tempDir() const { return temp_dir_; }
  const std::filesystem::path& finalDir() const { return final_dir_; }

private:
  std::filesystem::path sourcePath(const std::filesystem::path& published) const;

  std::filesystem::path temp_dir_;
  std::filesystem::path final_dir_;
  std::string published_extension_;
  std::mutex publish_mtx_;
};

} // namespace ingest_service
