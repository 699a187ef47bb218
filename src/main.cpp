// hunt: order-book microstructure hunter.
//   hunt [config-path]
#include "hunt/app/Orchestrator.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"
#include "hunt/ws/StreamClient.hpp"
#include "hunt/ws/WsTransport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

int main(int argc, char* argv[]) {
  using namespace hunt;
  using util::LogLevel;
  using util::logger;

  // ---------------------------
  // 1) Config: file, then environment
  // ---------------------------
  util::Config cfg;
  if (argc > 1 && !cfg.loadFromFile(argv[1])) {
    std::cerr << "[config] cannot read " << argv[1] << "\n";
    return EXIT_FAILURE;
  }
  cfg.applyEnvironment();

  // ---------------------------
  // 2) Logging / metrics
  // ---------------------------
  logger().setLevel(util::parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty()) logger().setFile(cfg.logFile);

  std::string why;
  if (!cfg.validate(&why)) {
    logger().log(LogLevel::Critical, "config.invalid", { {"why", why} });
    return EXIT_FAILURE;
  }

  if (cfg.metricsReportSec > 0) {
    util::MetricRegistry::instance().startReporter(static_cast<unsigned>(cfg.metricsReportSec));
  }

  logger().log(LogLevel::Info, "boot",
               { {"inst", cfg.instrument}, {"mode", cfg.tradingMode},
                 {"config", argc > 1 ? argv[1] : "defaults"} });

  Orchestrator orch(cfg, std::make_unique<ws::WsTransport>());

  // ---------------------------
  // 3) SIGINT / SIGTERM -> graceful stop
  // ---------------------------
  boost::asio::io_context sigIo;
  boost::asio::signal_set signals(sigIo, SIGINT, SIGTERM);
  signals.async_wait([&orch](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", { {"sig", std::to_string(sig)} });
    orch.stop();
  });
  std::thread sigThread([&sigIo] { sigIo.run(); });

  // ---------------------------
  // 4) Run
  // ---------------------------
  int rc = EXIT_SUCCESS;
  try {
    orch.run();
  } catch (const ws::AuthError& ex) {
    logger().log(LogLevel::Critical, "auth.failed", { {"err", ex.what()} });
    rc = EXIT_FAILURE;
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Critical, "run.failed", { {"err", ex.what()} });
    rc = EXIT_FAILURE;
  }

  orch.stop();
  sigIo.stop();
  sigThread.join();

  logger().log(LogLevel::Info, "stopped", {});
  return rc;
}
