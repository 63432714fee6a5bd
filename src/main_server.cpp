#include "ledger/errors.h"
#include "service/RestServer.h"
#include "service/ToolService.h"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include <algorithm>
#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ledgerproof;

int main(int argc, char *argv[]) {
  Config cfg;
  try {
    cfg = argc > 1 ? loadConfigFile(argv[1]) : loadConfig();
    if (argc > 1)
      applyEnvironment(cfg);
    validate(cfg);
  } catch (const ConfigError &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  try {
    Logger::init(cfg.logFile, cfg.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  Logger::getInstance().log(LogLevel::INFO, "ledgerproof server starting",
                            {{"contract", cfg.contractId()},
                             {"archive", cfg.archiveDir},
                             {"port", cfg.listenPort},
                             {"workers", cfg.workers}});

  try {
    Engine engine(cfg);
    engine.start();
    ToolService tools(engine);

    boost::asio::io_context ioc;
    RestServer server(ioc, cfg.listenPort, tools, cfg.jwtSecret);
    server.run();

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &, int signo) {
      Logger::getInstance().log(LogLevel::INFO, "Shutting down",
                                {{"signal", signo}});
      server.stop();
      ioc.stop();
    });

    const unsigned ioThreads = std::max(2u, cfg.workers);
    std::vector<std::thread> threads;
    for (unsigned i = 1; i < ioThreads; ++i)
      threads.emplace_back([&ioc] { ioc.run(); });
    ioc.run();
    for (auto &t : threads)
      t.join();
    engine.stop();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL, "Server failed",
                              {{"error", e.what()}});
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  Logger::getInstance().log(LogLevel::INFO, "ledgerproof server stopped");
  return 0;
}
