#include "Server.h"
#include "Logger.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"payledger-server - Tenant ledger and payment gateway reconciliation service"};

  std::string workDir;
  pl::Server::Overrides overrides;
  bool debug = false;

  app.add_option("-d,--work-dir", workDir,
                 "Work directory holding config.json and the journals")
      ->required();
  app.add_option("--bind", overrides.host, "Listen address (overrides config.json)");
  app.add_option("-p,--port", overrides.port, "Listen port (overrides config.json)")
      ->check(CLI::Range(1, 65535));
  app.add_flag("--debug", debug, "Enable debug logging on the console");

  CLI11_PARSE(app, argc, argv);

  auto &logger = pl::logging::getLogger("main");
  if (debug) {
    pl::logging::getRootLogger().setLevel(pl::logging::Level::DEBUG);
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  pl::Server server;
  auto result = server.start(workDir, overrides);
  if (!result) {
    logger.error << "Failed to start server: " << result.error().message;
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }

  std::cout << "Server running on " << server.getConfig().host << ":"
            << server.getConfig().port << "\n";
  std::cout << "Work directory: " << workDir << "\n";
  std::cout << "Press Ctrl+C to stop the server...\n";

  std::unique_lock<std::mutex> lock(g_mutex);
  g_cv.wait(lock, [] { return !g_running.load(); });

  server.stop();
  logger.info << "Server stopped";
  return 0;
}
