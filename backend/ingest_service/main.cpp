#include "application/ingest_service.hpp"
#include "application/job_store.hpp"
#include "application/video_processor.hpp"
#include "application/worker_pool.hpp"
#include "infrastructure/duplicate_detectors.hpp"
#include "infrastructure/file_store.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

namespace {

constexpr std::chrono::seconds kDrainReport{10};

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
  using namespace ingest_service;

  try {
    auto cfg = config::Config::loadFile(configPath(argc, argv));
    if (!cfg) {
      std::cerr << "Configuration error: " << cfg.error() << std::endl;
      return 1;
    }
    if (auto valid = cfg->validateIngest(std::thread::hardware_concurrency()); !valid) {
      std::cerr << "Configuration error: " << valid.error() << std::endl;
      return 1;
    }

    const auto& storage = cfg->getStorage();
    auto file_store = std::make_shared<FileStore>(storage.temp_dir, storage.final_dir,
                                                  storage.published_extension);
    if (auto ready = file_store->bootstrap(); !ready) {
      std::cerr << "Storage error: " << ready.error() << std::endl;
      return 1;
    }

    auto detector = makeDuplicateDetector(cfg->getDedup().policy);
    if (!detector) {
      std::cerr << "Configuration error: " << detector.error() << std::endl;
      return 1;
    }
    std::shared_ptr<DuplicateDetector> duplicate_detector = std::move(*detector);

    JobStore store(cfg->getQueue().capacity);
    auto ingest = std::make_shared<IngestService>(store, file_store, duplicate_detector,
                                                  std::make_shared<NameRegistry>());
    auto seeded = ingest->seedDuplicates();
    std::cout << "[ingest] Dedup policy '" << cfg->getDedup().policy << "', "
              << seeded << " published artifacts scanned" << std::endl;

    const auto& tc = cfg->getTranscoder();
    SubprocessTranscoder::Options options;
    options.binary = tc.binary;
    options.codec = tc.codec;
    options.preset = tc.preset;
    options.crf = tc.crf;
    options.audio_bitrate = tc.audio_bitrate;
    options.max_width = tc.max_width;
    options.max_height = tc.max_height;
    options.timeout = tc.timeout;
    std::shared_ptr<TranscodingService> transcoder = std::make_shared<SubprocessTranscoder>(options);

    VideoProcessor processor(transcoder, file_store);
    WorkerPool workers(store, processor, cfg->getWorkers().threads);
    workers.start();

    const auto& ingest_config = cfg->getIngest();
    const int io_threads = static_cast<int>(ingest_config.io_threads);
    boost::asio::io_context ioc{io_threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(ingest_config.host),
      static_cast<unsigned short>(ingest_config.port)
    };

    auto api_handler = std::make_shared<RestApiHandler>(ingest);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, ingest_config.max_upload_bytes};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int signal_number) {
      std::cout << "[ingest] Signal " << signal_number << " received, shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    std::cout << "[ingest] Queue capacity " << store.capacity() << ", "
              << workers.size() << " workers" << std::endl;
    std::cout << "HTTP Server listening on " << ingest_config.host << ":" << http_server.port() << std::endl;

    http_server.run();

    std::vector<std::thread> io_pool;
    io_pool.reserve(io_threads - 1);
    for (int i = 1; i < io_threads; ++i) {
      io_pool.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& thread : io_pool) {
      thread.join();
    }

    // Workers finish everything already admitted before exiting.
    store.shutdown();
    while (!store.waitUntilIdle(kDrainReport)) {
      std::cout << "[ingest] Draining, " << store.occupancy() << " admitted jobs left" << std::endl;
    }
    workers.stop();
    std::cout << "[ingest] Stopped after " << workers.processed() << " jobs" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
