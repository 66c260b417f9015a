#include "file_store.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace ingest_service {

namespace {

constexpr std::string_view kUnsafeChars = "\\/:*?\"<>|";

// Bound on name_N probing; a final store this crowded is a configuration problem.
constexpr int kMaxNameVariants = 100000;

// Regular files only are published, so a directory never shows up in listings.
constexpr std::string_view kSourcesDir = ".sources";

} // namespace

FileStore::FileStore(fs::path temp_dir, fs::path final_dir, std::string published_extension)
  : temp_dir_(std::move(temp_dir)),
    final_dir_(std::move(final_dir)),
    published_extension_(std::move(published_extension)) {}

std::expected<void, std::string> FileStore::bootstrap() const {
  std::error_code ec;
  for (const auto& dir : {temp_dir_, final_dir_}) {
    fs::create_directories(dir, ec);
    if (ec) {
      return std::unexpected("Failed to create " + dir.string() + ": " + ec.message());
    }
  }
  return {};
}

std::string FileStore::sanitize(std::string_view name) {
  std::string out(name);
  for (auto& c : out) {
    if (kUnsafeChars.find(c) != std::string_view::npos || std::isspace(static_cast<unsigned char>(c))) {
      c = '_';
    }
  }
  return out;
}

std::string FileStore::numberedVariant(const std::string& name, int n) {
  fs::path p(name);
  auto stem = p.stem().string();
  auto ext = p.extension().string();
  return stem + "_" + std::to_string(n) + ext;
}

std::expected<void, std::string> FileStore::moveFile(const fs::path& src, const fs::path& dst) {
  std::error_code ec;
  fs::rename(src, dst, ec);
  if (!ec) {
    return {};
  }
  if (ec != std::errc::cross_device_link) {
    return std::unexpected("Failed to move " + src.string() + " to " + dst.string() + ": " + ec.message());
  }

  // Not atomic: readers may observe dst before the copy completes.
  fs::copy_file(src, dst, fs::copy_options::none, ec);
  if (ec) {
    if (ec != std::errc::file_exists) {
      std::error_code cleanup_ec;
      fs::remove(dst, cleanup_ec);
    }
    return std::unexpected("Failed to copy " + src.string() + " to " + dst.string() + ": " + ec.message());
  }
  fs::remove(src, ec);
  if (ec) {
    return std::unexpected("Copied " + src.string() + " but could not delete it: " + ec.message());
  }
  return {};
}

bool FileStore::publishedExists(const std::string& name) const {
  std::error_code ec;
  return fs::exists(final_dir_ / name, ec);
}

std::expected<fs::path, std::string> FileStore::stage(const std::string& name,
                                                      std::string_view content) const {
  auto path = temp_dir_ / name;
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected("Failed to open staging file " + path.string());
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (!file) {
    std::error_code ec;
    fs::remove(path, ec);
    return std::unexpected("Failed to write staging file " + path.string());
  }
  return path;
}

std::expected<fs::path, std::string> FileStore::publish(const fs::path& src, const std::string& name) {
  std::lock_guard<std::mutex> lock{publish_mtx_};

  std::error_code ec;
  auto target = final_dir_ / name;
  for (int n = 1;; ++n) {
    const bool taken = fs::exists(target, ec);
    if (ec) {
      return std::unexpected("Failed to inspect " + target.string() + ": " + ec.message());
    }
    if (!taken) {
      break;
    }
    if (n > kMaxNameVariants) {
      return std::unexpected("No free name for " + name + " in " + final_dir_.string());
    }
    target = final_dir_ / numberedVariant(name, n);
  }

  if (auto moved = moveFile(src, target); !moved) {
    return std::unexpected(moved.error());
  }
  return target;
}

std::vector<fs::path> FileStore::publishedFiles() const {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(final_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

fs::path FileStore::sourcePath(const fs::path& published) const {
  return final_dir_ / kSourcesDir / (published.filename().string() + ".json");
}

std::expected<void, std::string> FileStore::recordSource(const fs::path& published,
                                                         const SourceRecord& source) const {
  std::error_code ec;
  const auto path = sourcePath(published);
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return std::unexpected("Failed to create " + path.parent_path().string() + ": " + ec.message());
  }

  nlohmann::json record = {
    {"name", source.name},
    {"sha256", source.sha256}
  };
  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return std::unexpected("Failed to open " + path.string());
  }
  file << record.dump();
  file.close();
  if (!file) {
    fs::remove(path, ec);
    return std::unexpected("Failed to write " + path.string());
  }
  return {};
}

std::optional<SourceRecord> FileStore::sourceOf(const fs::path& published) const {
  const auto path = sourcePath(published);
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }
  try {
    auto record = nlohmann::json::parse(file);
    return SourceRecord{record.at("name").get<std::string>(), record.at("sha256").get<std::string>()};
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[store] Ignoring unreadable source record " << path << ": " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::vector<PublishedArtifact> FileStore::publishedArtifacts() const {
  std::vector<PublishedArtifact> artifacts;
  for (auto& path : publishedFiles()) {
    auto source = sourceOf(path);
    artifacts.push_back({std::move(path), std::move(source)});
  }
  return artifacts;
}

std::vector<std::string> FileStore::listPublished() const {
  std::vector<std::string> names;
  for (const auto& path : publishedFiles()) {
    if (published_extension_.empty() || path.extension() == published_extension_) {
      names.push_back(path.filename().string());
    }
  }
  return names;
}

} // namespace ingest_service
