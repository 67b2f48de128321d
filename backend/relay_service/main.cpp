#include "application/pipeline.hpp"
#include "application/task_manager.hpp"
#include "common/config/config.hpp"
#include "common/logging/logger.hpp"
#include "common/restful/http_server.hpp"
#include "common/subprocess.hpp"
#include "infrastructure/ffmpeg_thumbnailer.hpp"
#include "infrastructure/ffmpeg_transcoder.hpp"
#include "infrastructure/libav_prober.hpp"
#include "infrastructure/ytdlp_extractor.hpp"
#include "interface/download_registry.hpp"
#include "interface/rest_api_handler.hpp"
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();
    common::initLogging(cfg.getLogging());

    // make sure that the process can reach the external tools
    const auto& tools = cfg.getTools();
    for (const auto& tool : {tools.ytdlp, tools.ffmpeg}) {
      if (!common::isExecutableAvailable(tool)) {
        throw std::runtime_error("failed to find " + tool + " in PATH");
      }
    }

    const auto& storage_path = cfg.getStoragePath();
    std::filesystem::create_directories(storage_path);

    const auto& limits = cfg.getLimits();
    auto pipeline = std::make_shared<const relay_service::Pipeline>(
      std::make_shared<relay_service::YtDlpExtractor>(tools.ytdlp),
      std::make_shared<relay_service::LibavProber>(),
      std::make_shared<relay_service::FfmpegTranscoder>(tools.ffmpeg, limits.transcode_ceiling_mb),
      std::make_shared<relay_service::FfmpegThumbnailer>(tools.ffmpeg),
      relay_service::PipelineLimits{
        .max_filesize_mb = limits.max_filesize_mb,
        .fallback_filesize_mb = limits.fallback_filesize_mb,
        .upload_limit_mb = limits.upload_limit_mb,
        .work_root = storage_path,
      }
    );

    relay_service::TaskManager task_manager{pipeline};
    relay_service::DownloadRegistry registry{task_manager, cfg.getResultRetention()};

    const auto& http_config = cfg.getHttp();
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host),
      static_cast<unsigned short>(http_config.port)
    };

    auto api_handler = std::make_shared<relay_service::RestApiHandler>(task_manager, registry);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      spdlog::info("received signal {}, shutting down", signal_number);
      http_server.stop();
      ioc.stop();
    });

    task_manager.start();
    http_server.run();
    spdlog::info("application started, HTTP server listening on {}", cfg.getHttpIpPort());
    spdlog::info("size limits: {} MB, {} MB with fallback, {} MB upload",
                 limits.max_filesize_mb, limits.fallback_filesize_mb, limits.upload_limit_mb);

    ioc.run();

    // the task in flight, if any, finishes before this returns
    task_manager.stop();
    spdlog::info("application stopped");
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
