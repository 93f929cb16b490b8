#ifndef PAYLEDGER_SERVER_H
#define PAYLEDGER_SERVER_H

#include "LedgerService.h"
#include "Reconciler.h"
#include "TenantDirectory.h"
#include "CelcoinGateway.h"
#include "HttplibClient.h"
#include "LedgerStore.h"
#include "TransactionLog.h"
#include "ResultOrError.hpp"
#include "Service.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace pl {

/**
 * Server - wires the ledger, the gateway adapter and the reconciler
 * together and exposes them over HTTP.
 *
 * start() reads <work-dir>/config.json (written with defaults when missing),
 * opens the journals in the work directory, starts the reconciler and begins
 * serving requests on a listener thread.
 */
class Server : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *CONFIG_FILE = "config.json";
  static constexpr uint16_t DEFAULT_PORT = 8090;
  static constexpr const char *DEFAULT_GATEWAY_URL = "https://sandbox.openfinance.celcoin.dev/v5";

  struct Config {
    std::string host{ "0.0.0.0" };
    uint16_t port{ DEFAULT_PORT };
    HttplibClient::Config http;
    CelcoinGateway::Config gateway;
    LedgerService::Config ledger;
    Reconciler::Config reconciliation;
    nlohmann::json tenants = nlohmann::json::array();
    std::string logLevel{ "INFO" };
    std::string logFile;
    std::string auditFile;
  };

  /** Command line values that take precedence over the config file */
  struct Overrides {
    std::string host;
    uint16_t port{ 0 };
  };

  Server();
  ~Server() override;

  Roe<void> start(const std::string &workDir, const Overrides &overrides);

  const Config &getConfig() const { return config_; }

  static nlohmann::json defaultConfigJson();
  static Roe<Config> parseConfig(const nlohmann::json &json);
  /** CELCOIN_API_URL, CELCOIN_CLIENT_ID, CELCOIN_CLIENT_SECRET, CELCOIN_WEBHOOK_SECRET */
  static void applyEnvironment(Config &config);

  static Roe<LedgerService::CashInRequest> parseCashInRequest(uint64_t tenantId,
                                                              const nlohmann::json &body);
  static Roe<LedgerService::CashOutRequest> parseCashOutRequest(uint64_t tenantId,
                                                                const nlohmann::json &body);
  static Roe<LedgerService::AdjustmentRequest> parseAdjustmentRequest(uint64_t tenantId,
                                                                      const nlohmann::json &body);

  /** HTTP status for an error code of the shared taxonomy */
  static int httpStatusFor(int32_t errorCode);

protected:
  Service::Roe<void> onStart() override;
  void onStop() override;
  void runLoop() override;

private:
  Roe<void> loadConfig(const std::string &configPath);
  Roe<void> setupLogging();
  Roe<void> setupComponents();
  void registerRoutes();

  std::string workDir_;
  Overrides overrides_;
  Config config_;

  LedgerStore store_;
  TransactionLog txLog_;
  TenantDirectory tenants_;
  std::shared_ptr<HttplibClient> spHttpClient_;
  std::unique_ptr<CelcoinGateway> upGateway_;
  std::unique_ptr<LedgerService> upLedgerService_;
  std::unique_ptr<Reconciler> upReconciler_;

  std::unique_ptr<httplib::Server> upHttp_;
  std::thread httpThread_;
};

} // namespace pl

#endif // PAYLEDGER_SERVER_H
