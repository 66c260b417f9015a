#include "application/backoff_policy.hpp"
#include "application/readiness_prober.hpp"
#include "application/upload_worker.hpp"
#include "infrastructure/curl_upload_transport.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {

std::string configPath(int argc, char** argv) {
  if (argc > 1) {
    return argv[1];
  }
  if (const char* env = std::getenv("VIDFERRY_CONFIG")) {
    return env;
  }
  return "config/vidferry.json";
}

} // namespace

int main(int argc, char** argv) {
  using namespace uploader;

  try {
    auto cfg = config::Config::loadFile(configPath(argc, argv));
    if (!cfg) {
      std::cerr << "Configuration error: " << cfg.error() << std::endl;
      return 1;
    }
    if (auto valid = cfg->validateUploader(std::thread::hardware_concurrency()); !valid) {
      std::cerr << "Configuration error: " << valid.error() << std::endl;
      return 1;
    }

    const auto& settings = cfg->getUploader();
    const auto& readiness = cfg->getReadiness();
    auto base_url = cfg->getIngestBaseUrl();
    if (!base_url) {
      std::cerr << "Configuration error: " << base_url.error() << std::endl;
      return 1;
    }

    CurlUploadTransport::Timeouts timeouts;
    timeouts.connect = settings.connect_timeout;
    timeouts.read = settings.read_timeout;
    timeouts.probe = readiness.timeout;
    auto transport = std::make_shared<CurlUploadTransport>(*base_url, timeouts);

    std::cout << "[uploader] Environment '" << cfg->getEnvironment() << "', uploading to "
              << transport->uploadUrl() << std::endl;

    ReadinessProber prober(transport, readiness.max_attempts, readiness.interval);
    if (auto ready = prober.waitUntilReady(); !ready) {
      std::cerr << "[uploader] " << ready.error() << std::endl;
      return 1;
    }

    const std::filesystem::path root(settings.root_video_path);
    common::ThreadPool pool(settings.threads);
    std::vector<std::future<UploadSummary>> results;

    for (unsigned int i = 1; i <= settings.threads; ++i) {
      auto folder = root / (settings.folder_prefix + std::to_string(i));
      std::error_code ec;
      if (!std::filesystem::is_directory(folder, ec)) {
        std::cerr << "[uploader] Skipping missing folder " << folder.string() << std::endl;
        continue;
      }
      results.push_back(pool.commit([folder, transport, &settings]() {
        UploadWorker worker(folder, transport,
                            BackoffPolicy(settings.initial_backoff, settings.max_backoff,
                                          settings.max_jitter),
                            settings.max_retries);
        return worker.run();
      }));
    }

    UploadSummary total;
    for (auto& result : results) {
      auto summary = result.get();
      std::cout << "[uploader] " << summary.folder << ": " << summary.uploaded << " uploaded, "
                << summary.abandoned << " abandoned, " << summary.failed << " failed" << std::endl;
      total.uploaded += summary.uploaded;
      total.abandoned += summary.abandoned;
      total.failed += summary.failed;
    }
    pool.shutdown();

    std::cout << "[uploader] Finished: " << total.uploaded << " uploaded, "
              << total.abandoned << " abandoned, " << total.failed << " failed" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
