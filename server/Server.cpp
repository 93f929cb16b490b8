#include "Server.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "Money.h"
#include "Utilities.h"

#include <httplib.h>

#include <filesystem>
#include <fstream>

namespace pl {

namespace {

using json = nlohmann::json;

void setJsonError(httplib::Response &res, int status, const std::string &message,
                  int32_t code) {
  res.status = status;
  res.set_content(json{ { "error", message }, { "code", err::errorName(code) } }.dump(),
                  "application/json");
}

void setJson(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

/** Read an optional string member; false if present with another type */
bool readString(const json &obj, const char *key, std::string &out) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return true;
  }
  if (!obj[key].is_string()) {
    return false;
  }
  out = obj[key].get<std::string>();
  return true;
}

bool readInt64(const json &obj, const char *key, int64_t &out) {
  if (!obj.contains(key)) {
    return true;
  }
  if (!obj[key].is_number_integer()) {
    return false;
  }
  out = obj[key].get<int64_t>();
  return true;
}

bool readUInt32(const json &obj, const char *key, uint32_t &out) {
  if (!obj.contains(key)) {
    return true;
  }
  if (!obj[key].is_number_unsigned()) {
    return false;
  }
  out = obj[key].get<uint32_t>();
  return true;
}

bool readAmount(const json &obj, const char *key, Amount &out) {
  if (!obj.contains(key)) {
    return true;
  }
  return money::fromJson(obj[key], out);
}

Server::Error wrongType(const std::string &field, const char *expected) {
  return Server::Error(err::E_INVALID_INPUT,
                       "Configuration field '" + field + "' is not " + expected);
}

bool parseTenantId(const std::string &str, uint64_t &tenantId) {
  return utl::parseUInt64(str, tenantId) && tenantId != 0;
}

void sendResult(httplib::Response &res, const LedgerService::OperationResult &result) {
  int status = result.errorCode == 0 ? 200 : Server::httpStatusFor(result.errorCode);
  setJson(res, status, result.toJson());
}

} // namespace

Server::Server() : Service("server") {}

Server::~Server() { stop(); }

json Server::defaultConfigJson() {
  LedgerService::Config ledger;
  Reconciler::Config reconciliation;

  json config;
  config["host"] = "0.0.0.0";
  config["port"] = DEFAULT_PORT;
  config["gateway"] = { { "baseUrl", DEFAULT_GATEWAY_URL },
                        { "clientId", "" },
                        { "clientSecret", "" },
                        { "webhookSecret", "" },
                        { "timeoutMs", 30000 },
                        { "tokenSafetyMarginSec", 60 } };
  config["ledger"] = {
    { "maxTransactionAmount", money::format(ledger.limits.maxTransactionAmount) },
    { "dailyCashOutLimit", money::format(ledger.limits.dailyCashOutLimit) },
    { "minCashOutAmount", money::format(ledger.limits.minCashOutAmount) },
    { "maxPendingAgeSec", ledger.limits.maxPendingAgeSec },
    { "retry",
      { { "maxAttempts", ledger.retry.maxAttempts },
        { "initialBackoffMs", ledger.retry.initialBackoffMs },
        { "maxBackoffMs", ledger.retry.maxBackoffMs } } }
  };
  config["rateLimit"] = { { "cashInPerWindow", ledger.rateLimits.cashInPerWindow },
                          { "cashOutPerWindow", ledger.rateLimits.cashOutPerWindow },
                          { "windowSec", ledger.rateLimits.windowSec } };
  config["reconciliation"] = { { "intervalSec", reconciliation.intervalSec },
                               { "lookbackSec", reconciliation.lookbackSec },
                               { "toleranceMinor", reconciliation.toleranceMinor },
                               { "maxReports", reconciliation.maxReports } };
  config["tenants"] = json::array();
  config["logging"] = { { "level", "INFO" }, { "file", "payledger.log" }, { "auditFile", "audit.log" } };
  return config;
}

Server::Roe<Server::Config> Server::parseConfig(const json &root) {
  if (!root.is_object()) {
    return Error(err::E_INVALID_INPUT, "Configuration must be a JSON object");
  }

  Config config;
  config.http.baseUrl = DEFAULT_GATEWAY_URL;

  if (!readString(root, "host", config.host)) {
    return wrongType("host", "a string");
  }
  if (root.contains("port")) {
    if (!root["port"].is_number_unsigned() || root["port"].get<uint64_t>() > 65535) {
      return wrongType("port", "a port number");
    }
    config.port = root["port"].get<uint16_t>();
  }

  if (root.contains("gateway")) {
    const json &gateway = root["gateway"];
    if (!gateway.is_object()) {
      return wrongType("gateway", "an object");
    }
    if (!readString(gateway, "baseUrl", config.http.baseUrl)) {
      return wrongType("gateway.baseUrl", "a string");
    }
    if (!readString(gateway, "clientId", config.gateway.clientId)) {
      return wrongType("gateway.clientId", "a string");
    }
    if (!readString(gateway, "clientSecret", config.gateway.clientSecret)) {
      return wrongType("gateway.clientSecret", "a string");
    }
    if (!readString(gateway, "webhookSecret", config.gateway.webhookSecret)) {
      return wrongType("gateway.webhookSecret", "a string");
    }
    if (!readInt64(gateway, "timeoutMs", config.http.timeoutMs) || config.http.timeoutMs <= 0) {
      return wrongType("gateway.timeoutMs", "a positive integer");
    }
    if (!readInt64(gateway, "tokenSafetyMarginSec", config.gateway.tokenSafetyMarginSec)) {
      return wrongType("gateway.tokenSafetyMarginSec", "an integer");
    }
  }

  auto &limits = config.ledger.limits;
  auto &retry = config.ledger.retry;
  if (root.contains("ledger")) {
    const json &ledger = root["ledger"];
    if (!ledger.is_object()) {
      return wrongType("ledger", "an object");
    }
    if (!readAmount(ledger, "maxTransactionAmount", limits.maxTransactionAmount) ||
        limits.maxTransactionAmount <= 0) {
      return wrongType("ledger.maxTransactionAmount", "a positive amount");
    }
    if (!readAmount(ledger, "dailyCashOutLimit", limits.dailyCashOutLimit) ||
        limits.dailyCashOutLimit < 0) {
      return wrongType("ledger.dailyCashOutLimit", "a non-negative amount");
    }
    if (!readAmount(ledger, "minCashOutAmount", limits.minCashOutAmount) ||
        limits.minCashOutAmount <= 0) {
      return wrongType("ledger.minCashOutAmount", "a positive amount");
    }
    if (!readInt64(ledger, "maxPendingAgeSec", limits.maxPendingAgeSec) ||
        limits.maxPendingAgeSec <= 0) {
      return wrongType("ledger.maxPendingAgeSec", "a positive integer");
    }
    if (ledger.contains("retry")) {
      const json &jRetry = ledger["retry"];
      if (!jRetry.is_object()) {
        return wrongType("ledger.retry", "an object");
      }
      if (jRetry.contains("maxAttempts")) {
        if (!jRetry["maxAttempts"].is_number_integer() || jRetry["maxAttempts"].get<int>() < 1) {
          return wrongType("ledger.retry.maxAttempts", "a positive integer");
        }
        retry.maxAttempts = jRetry["maxAttempts"].get<int>();
      }
      if (!readInt64(jRetry, "initialBackoffMs", retry.initialBackoffMs) ||
          retry.initialBackoffMs < 0) {
        return wrongType("ledger.retry.initialBackoffMs", "a non-negative integer");
      }
      if (!readInt64(jRetry, "maxBackoffMs", retry.maxBackoffMs) ||
          retry.maxBackoffMs < retry.initialBackoffMs) {
        return wrongType("ledger.retry.maxBackoffMs", "an integer >= initialBackoffMs");
      }
    }
  }

  if (root.contains("rateLimit")) {
    const json &rateLimit = root["rateLimit"];
    auto &rates = config.ledger.rateLimits;
    if (!rateLimit.is_object()) {
      return wrongType("rateLimit", "an object");
    }
    if (!readUInt32(rateLimit, "cashInPerWindow", rates.cashInPerWindow)) {
      return wrongType("rateLimit.cashInPerWindow", "a non-negative integer");
    }
    if (!readUInt32(rateLimit, "cashOutPerWindow", rates.cashOutPerWindow)) {
      return wrongType("rateLimit.cashOutPerWindow", "a non-negative integer");
    }
    if (!readInt64(rateLimit, "windowSec", rates.windowSec) || rates.windowSec <= 0) {
      return wrongType("rateLimit.windowSec", "a positive integer");
    }
  }

  auto &reconciliation = config.reconciliation;
  if (root.contains("reconciliation")) {
    const json &jRecon = root["reconciliation"];
    if (!jRecon.is_object()) {
      return wrongType("reconciliation", "an object");
    }
    if (!readInt64(jRecon, "intervalSec", reconciliation.intervalSec) ||
        reconciliation.intervalSec <= 0) {
      return wrongType("reconciliation.intervalSec", "a positive integer");
    }
    if (!readInt64(jRecon, "lookbackSec", reconciliation.lookbackSec) ||
        reconciliation.lookbackSec <= 0) {
      return wrongType("reconciliation.lookbackSec", "a positive integer");
    }
    if (!readInt64(jRecon, "toleranceMinor", reconciliation.toleranceMinor) ||
        reconciliation.toleranceMinor < 1) {
      return wrongType("reconciliation.toleranceMinor", "a positive integer");
    }
    uint32_t maxReports = static_cast<uint32_t>(reconciliation.maxReports);
    if (!readUInt32(jRecon, "maxReports", maxReports) || maxReports < 1) {
      return wrongType("reconciliation.maxReports", "a positive integer");
    }
    reconciliation.maxReports = maxReports;
  }
  reconciliation.maxPendingAgeSec = limits.maxPendingAgeSec;
  reconciliation.retry = retry;

  if (root.contains("tenants")) {
    if (!root["tenants"].is_array()) {
      return wrongType("tenants", "an array");
    }
    config.tenants = root["tenants"];
  }

  if (root.contains("logging")) {
    const json &logging = root["logging"];
    if (!logging.is_object()) {
      return wrongType("logging", "an object");
    }
    if (!readString(logging, "level", config.logLevel)) {
      return wrongType("logging.level", "a string");
    }
    logging::Level level;
    if (!logging::parseLevel(config.logLevel, level)) {
      return Error(err::E_INVALID_INPUT, "Unknown log level: " + config.logLevel);
    }
    if (!readString(logging, "file", config.logFile)) {
      return wrongType("logging.file", "a string");
    }
    if (!readString(logging, "auditFile", config.auditFile)) {
      return wrongType("logging.auditFile", "a string");
    }
  }

  return config;
}

void Server::applyEnvironment(Config &config) {
  config.http.baseUrl = utl::getEnv("CELCOIN_API_URL", config.http.baseUrl);
  config.gateway.clientId = utl::getEnv("CELCOIN_CLIENT_ID", config.gateway.clientId);
  config.gateway.clientSecret = utl::getEnv("CELCOIN_CLIENT_SECRET", config.gateway.clientSecret);
  config.gateway.webhookSecret =
      utl::getEnv("CELCOIN_WEBHOOK_SECRET", config.gateway.webhookSecret);
}

Server::Roe<LedgerService::CashInRequest> Server::parseCashInRequest(uint64_t tenantId,
                                                                     const json &body) {
  LedgerService::CashInRequest request;
  request.tenantId = tenantId;

  if (!body.contains("amount") || !money::fromJson(body["amount"], request.amount)) {
    return Error(err::E_INVALID_INPUT, "amount must be a decimal with at most two places");
  }
  if (!readString(body, "referenceId", request.referenceId) || request.referenceId.empty()) {
    return Error(err::E_INVALID_INPUT, "referenceId is required");
  }
  std::string method = "pix";
  if (!readString(body, "paymentMethod", method) ||
      !IGateway::parsePaymentMethod(method, request.method)) {
    return Error(err::E_INVALID_INPUT, "paymentMethod must be pix, boleto or credit_card");
  }
  if (!body.contains("payer") || !body["payer"].is_object()) {
    return Error(err::E_INVALID_INPUT, "payer is required");
  }
  const json &payer = body["payer"];
  if (!readString(payer, "name", request.payer.name) ||
      !readString(payer, "email", request.payer.email) ||
      !readString(payer, "document", request.payer.document)) {
    return Error(err::E_INVALID_INPUT, "payer fields must be strings");
  }
  if (request.payer.name.empty() || request.payer.document.empty()) {
    return Error(err::E_INVALID_INPUT, "payer name and document are required");
  }
  if (!readString(body, "description", request.description)) {
    return Error(err::E_INVALID_INPUT, "description must be a string");
  }
  if (body.contains("metadata")) {
    if (!body["metadata"].is_object()) {
      return Error(err::E_INVALID_INPUT, "metadata must be an object");
    }
    request.metadata = body["metadata"];
  }
  return request;
}

Server::Roe<LedgerService::CashOutRequest> Server::parseCashOutRequest(uint64_t tenantId,
                                                                       const json &body) {
  LedgerService::CashOutRequest request;
  request.tenantId = tenantId;

  if (!body.contains("amount") || !money::fromJson(body["amount"], request.amount)) {
    return Error(err::E_INVALID_INPUT, "amount must be a decimal with at most two places");
  }
  if (!readString(body, "referenceId", request.referenceId) || request.referenceId.empty()) {
    return Error(err::E_INVALID_INPUT, "referenceId is required");
  }
  if (!body.contains("bankAccount") || !body["bankAccount"].is_object()) {
    return Error(err::E_INVALID_INPUT, "bankAccount is required");
  }
  const json &bank = body["bankAccount"];
  auto &account = request.bankAccount;
  account.accountType = "checking";
  if (!readString(bank, "bank", account.bank) || !readString(bank, "agency", account.agency) ||
      !readString(bank, "account", account.account) ||
      !readString(bank, "accountType", account.accountType) ||
      !readString(bank, "holderName", account.holderName) ||
      !readString(bank, "holderDocument", account.holderDocument)) {
    return Error(err::E_INVALID_INPUT, "bankAccount fields must be strings");
  }
  if (account.bank.empty() || account.agency.empty() || account.account.empty() ||
      account.holderName.empty() || account.holderDocument.empty()) {
    return Error(err::E_INVALID_INPUT,
                 "bankAccount requires bank, agency, account, holderName and holderDocument");
  }
  if (account.accountType != "checking" && account.accountType != "savings") {
    return Error(err::E_INVALID_INPUT, "bankAccount.accountType must be checking or savings");
  }
  if (!readString(body, "description", request.description)) {
    return Error(err::E_INVALID_INPUT, "description must be a string");
  }
  if (body.contains("metadata")) {
    if (!body["metadata"].is_object()) {
      return Error(err::E_INVALID_INPUT, "metadata must be an object");
    }
    request.metadata = body["metadata"];
  }
  return request;
}

Server::Roe<LedgerService::AdjustmentRequest>
Server::parseAdjustmentRequest(uint64_t tenantId, const json &body) {
  LedgerService::AdjustmentRequest request;
  request.tenantId = tenantId;
  if (!body.contains("amount") || !money::fromJson(body["amount"], request.amount)) {
    return Error(err::E_INVALID_INPUT, "amount must be a decimal with at most two places");
  }
  if (!readString(body, "referenceId", request.referenceId) || request.referenceId.empty()) {
    return Error(err::E_INVALID_INPUT, "referenceId is required");
  }
  if (!readString(body, "reason", request.reason) || request.reason.empty()) {
    return Error(err::E_INVALID_INPUT, "reason is required");
  }
  return request;
}

int Server::httpStatusFor(int32_t errorCode) {
  switch (errorCode) {
  case 0:
  case err::E_DUPLICATE_REFERENCE:
    return 200;
  case err::E_GATEWAY_TIMEOUT:
    return 202;
  case err::E_INVALID_INPUT:
    return 400;
  case err::E_INVALID_WEBHOOK_SIGNATURE:
    return 401;
  case err::E_NOT_FOUND:
  case err::E_TENANT:
    return 404;
  case err::E_INSUFFICIENT_BALANCE:
  case err::E_INVALID_STATE_TRANSITION:
    return 409;
  case err::E_LIMIT_EXCEEDED:
    return 422;
  case err::E_RATE_LIMITED:
    return 429;
  case err::E_AUTHENTICATION:
  case err::E_GATEWAY_REJECTED:
  case err::E_GATEWAY_NETWORK:
  case err::E_GATEWAY_PROTOCOL:
    return 502;
  default:
    return 500;
  }
}

Server::Roe<void> Server::start(const std::string &workDir, const Overrides &overrides) {
  if (isRunning()) {
    return Error(err::E_INVALID_STATE_TRANSITION, "Server is already running");
  }
  workDir_ = workDir;
  overrides_ = overrides;

  log().info << "Starting server with work directory: " << workDir_;
  auto result = Service::start();
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return {};
}

Server::Roe<void> Server::loadConfig(const std::string &configPath) {
  auto jsonResult = utl::loadJsonFile(configPath);
  if (!jsonResult) {
    return Error(jsonResult.error().code, jsonResult.error().message);
  }

  auto parsed = parseConfig(jsonResult.value());
  if (!parsed) {
    return parsed.error();
  }
  config_ = parsed.value();
  applyEnvironment(config_);
  if (!overrides_.host.empty()) {
    config_.host = overrides_.host;
  }
  if (overrides_.port != 0) {
    config_.port = overrides_.port;
  }

  log().info << "Configuration loaded from " << configPath;
  log().info << "  Listen: " << config_.host << ":" << config_.port;
  log().info << "  Gateway: " << config_.http.baseUrl << " (timeout " << config_.http.timeoutMs
             << " ms)";
  log().info << "  Limits: max " << money::format(config_.ledger.limits.maxTransactionAmount)
             << ", daily cash-out " << money::format(config_.ledger.limits.dailyCashOutLimit)
             << ", min cash-out " << money::format(config_.ledger.limits.minCashOutAmount);
  log().info << "  Rate limits: " << config_.ledger.rateLimits.cashInPerWindow << " cash-in / "
             << config_.ledger.rateLimits.cashOutPerWindow << " cash-out per "
             << config_.ledger.rateLimits.windowSec << "s";
  log().info << "  Reconciliation every " << config_.reconciliation.intervalSec
             << "s, lookback " << config_.reconciliation.lookbackSec << "s";
  if (config_.gateway.webhookSecret.empty()) {
    log().warning << "No webhook secret configured; all webhooks will be rejected";
  }
  return {};
}

Server::Roe<void> Server::setupLogging() {
  logging::Level level = logging::Level::INFO;
  if (!logging::parseLevel(config_.logLevel, level)) {
    log().warning << "Unknown log level " << config_.logLevel << ", using INFO";
  }
  logging::getRootLogger().setLevel(level);

  std::filesystem::path dir(workDir_);
  try {
    if (!config_.logFile.empty()) {
      logging::getRootLogger().addFileHandler((dir / config_.logFile).string(), level);
    }
    if (!config_.auditFile.empty()) {
      logging::getAuditLogger().addFileHandler((dir / config_.auditFile).string(),
                                               logging::Level::WARNING);
    }
  } catch (const std::exception &e) {
    return Error(err::E_STORAGE, std::string("Failed to open log file: ") + e.what());
  }
  return {};
}

Server::Roe<void> Server::setupComponents() {
  LedgerStore::InitConfig storeConfig;
  storeConfig.workDir = workDir_;
  auto storeResult = store_.init(storeConfig);
  if (!storeResult) {
    return Error(storeResult.error().code, "Failed to open ledger: " + storeResult.error().message);
  }

  TransactionLog::InitConfig logConfig;
  logConfig.workDir = workDir_;
  auto logResult = txLog_.init(logConfig);
  if (!logResult) {
    return Error(logResult.error().code,
                 "Failed to open transaction log: " + logResult.error().message);
  }

  auto tenantsResult = tenants_.load(config_.tenants);
  if (!tenantsResult) {
    return Error(tenantsResult.error().code, tenantsResult.error().message);
  }
  log().info << "Loaded " << tenants_.size() << " tenant accounts";

  spHttpClient_ = std::make_shared<HttplibClient>();
  auto httpResult = spHttpClient_->init(config_.http);
  if (!httpResult) {
    return Error(httpResult.error().code, httpResult.error().message);
  }

  upGateway_ = std::make_unique<CelcoinGateway>(spHttpClient_, config_.gateway);
  upLedgerService_ = std::make_unique<LedgerService>(store_, txLog_, *upGateway_, tenants_,
                                                     config_.ledger);
  upReconciler_ = std::make_unique<Reconciler>(store_, *upLedgerService_, *upGateway_, tenants_,
                                               config_.reconciliation);
  Reconciler::InitConfig reconcilerConfig;
  reconcilerConfig.workDir = workDir_;
  auto reconcilerResult = upReconciler_->init(reconcilerConfig);
  if (!reconcilerResult) {
    return Error(reconcilerResult.error().code, reconcilerResult.error().message);
  }
  return {};
}

Service::Roe<void> Server::onStart() {
  std::filesystem::path configPath = std::filesystem::path(workDir_) / CONFIG_FILE;
  std::error_code ec;
  std::filesystem::create_directories(workDir_, ec);
  if (ec) {
    return Service::Error(err::E_STORAGE, "Failed to create work directory: " + ec.message());
  }

  if (!std::filesystem::exists(configPath)) {
    log().info << "No config.json found, creating with default values";
    std::ofstream configFile(configPath);
    if (!configFile) {
      return Service::Error(err::E_STORAGE, "Failed to create " + configPath.string());
    }
    configFile << defaultConfigJson().dump(2) << std::endl;
    log().info << "Created config.json at: " << configPath.string();
  }

  auto configResult = loadConfig(configPath.string());
  if (!configResult) {
    return Service::Error(configResult.error().code,
                          "Failed to load configuration: " + configResult.error().message);
  }
  auto loggingResult = setupLogging();
  if (!loggingResult) {
    return Service::Error(loggingResult.error().code, loggingResult.error().message);
  }
  auto componentsResult = setupComponents();
  if (!componentsResult) {
    return Service::Error(componentsResult.error().code, componentsResult.error().message);
  }

  upHttp_ = std::make_unique<httplib::Server>();
  registerRoutes();
  if (!upHttp_->bind_to_port(config_.host, config_.port)) {
    return Service::Error(err::E_STORAGE, "Failed to bind " + config_.host + ":" +
                                              std::to_string(config_.port));
  }

  auto reconcilerResult = upReconciler_->start();
  if (!reconcilerResult) {
    return Service::Error(reconcilerResult.error().code, reconcilerResult.error().message);
  }

  httpThread_ = std::thread([this]() { upHttp_->listen_after_bind(); });
  log().info << "HTTP API listening on " << config_.host << ":" << config_.port;
  return {};
}

void Server::onStop() {
  if (upHttp_) {
    upHttp_->stop();
  }
  if (httpThread_.joinable()) {
    httpThread_.join();
  }
  if (upReconciler_) {
    upReconciler_->stop();
  }
  log().info << "Server resources cleaned up";
}

void Server::runLoop() {
  while (!isStopSet()) {
    if (!waitFor(std::chrono::seconds(60))) {
      break;
    }
    size_t pruned = upLedgerService_->pruneRateLimits();
    if (pruned > 0) {
      log().debug << "Dropped " << pruned << " idle rate limit windows";
    }
  }
}

void Server::registerRoutes() {
  auto &svr = *upHttp_;
  auto &httpLog = logging::getLogger("server.http");
  LedgerService &service = *upLedgerService_;
  Reconciler &reconciler = *upReconciler_;

  svr.set_logger([&httpLog](const httplib::Request &req, const httplib::Response &res) {
    httpLog.info << req.method << " " << req.path << " " << res.status << " ("
                 << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });
  svr.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
    if (req.method == "OPTIONS") {
      res.status = 204;
      return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
  });

  // POST /api/tenants/:id/cash-in
  svr.Post(R"(/api/tenants/(\d+)/cash-in)",
           [&service](const httplib::Request &req, httplib::Response &res) {
             uint64_t tenantId = 0;
             if (!parseTenantId(req.matches[1].str(), tenantId)) {
               setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
               return;
             }
             auto body = utl::parseJsonObject(req.body);
             if (!body) {
               setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
               return;
             }
             auto request = parseCashInRequest(tenantId, body.value());
             if (!request) {
               setJsonError(res, 400, request.error().message, request.error().code);
               return;
             }
             sendResult(res, service.processCashIn(request.value()));
           });

  // POST /api/tenants/:id/cash-out
  svr.Post(R"(/api/tenants/(\d+)/cash-out)",
           [&service](const httplib::Request &req, httplib::Response &res) {
             uint64_t tenantId = 0;
             if (!parseTenantId(req.matches[1].str(), tenantId)) {
               setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
               return;
             }
             auto body = utl::parseJsonObject(req.body);
             if (!body) {
               setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
               return;
             }
             auto request = parseCashOutRequest(tenantId, body.value());
             if (!request) {
               setJsonError(res, 400, request.error().message, request.error().code);
               return;
             }
             sendResult(res, service.processCashOut(request.value()));
           });

  // POST /api/tenants/:id/adjustments
  svr.Post(R"(/api/tenants/(\d+)/adjustments)",
           [&service](const httplib::Request &req, httplib::Response &res) {
             uint64_t tenantId = 0;
             if (!parseTenantId(req.matches[1].str(), tenantId)) {
               setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
               return;
             }
             auto body = utl::parseJsonObject(req.body);
             if (!body) {
               setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
               return;
             }
             auto request = parseAdjustmentRequest(tenantId, body.value());
             if (!request) {
               setJsonError(res, 400, request.error().message, request.error().code);
               return;
             }
             sendResult(res, service.postAdjustment(request.value()));
           });

  // POST /api/webhooks/gateway - raw body, signature in X-Signature
  svr.Post("/api/webhooks/gateway",
           [&service](const httplib::Request &req, httplib::Response &res) {
             auto outcome = service.handleWebhook(req.body, req.get_header_value("X-Signature"));
             if (!outcome) {
               int status = outcome.error().code == err::E_INVALID_WEBHOOK_SIGNATURE
                                ? 401
                                : httpStatusFor(outcome.error().code);
               setJsonError(res, status, outcome.error().message, outcome.error().code);
               return;
             }
             setJson(res, 200, outcome.value().toJson());
           });

  // GET /api/tenants/:id/balance
  svr.Get(R"(/api/tenants/(\d+)/balance)",
          [&service](const httplib::Request &req, httplib::Response &res) {
            uint64_t tenantId = 0;
            if (!parseTenantId(req.matches[1].str(), tenantId)) {
              setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
              return;
            }
            auto balance = service.getBalance(tenantId);
            if (!balance) {
              setJsonError(res, httpStatusFor(balance.error().code), balance.error().message,
                           balance.error().code);
              return;
            }
            setJson(res, 200, balance.value().toJson());
          });

  // GET /api/tenants/:id/entries?offset=&limit=
  svr.Get(R"(/api/tenants/(\d+)/entries)",
          [this](const httplib::Request &req, httplib::Response &res) {
            uint64_t tenantId = 0;
            if (!parseTenantId(req.matches[1].str(), tenantId)) {
              setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
              return;
            }
            uint64_t offset = 0;
            uint64_t limit = 50;
            if (req.has_param("offset") &&
                !utl::parseUInt64(req.get_param_value("offset"), offset)) {
              setJsonError(res, 400, "Invalid offset", err::E_INVALID_INPUT);
              return;
            }
            if (req.has_param("limit") &&
                (!utl::parseUInt64(req.get_param_value("limit"), limit) || limit == 0 ||
                 limit > 500)) {
              setJsonError(res, 400, "limit must be between 1 and 500", err::E_INVALID_INPUT);
              return;
            }
            auto account = tenants_.get(tenantId);
            if (!account) {
              setJsonError(res, 404, account.error().message, account.error().code);
              return;
            }
            setJson(res, 200, store_.listEntries(tenantId, offset, limit).toJson());
          });

  // POST /api/entries/:id/reverse
  svr.Post(R"(/api/entries/([A-Za-z0-9_]+)/reverse)",
           [&service](const httplib::Request &req, httplib::Response &res) {
             auto body = utl::parseJsonObject(req.body);
             if (!body) {
               setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
               return;
             }
             std::string reason;
             if (!readString(body.value(), "reason", reason) || reason.empty()) {
               setJsonError(res, 400, "reason is required", err::E_INVALID_INPUT);
               return;
             }
             auto reversal = service.reverseEntry(req.matches[1].str(), reason);
             if (!reversal) {
               setJsonError(res, httpStatusFor(reversal.error().code), reversal.error().message,
                            reversal.error().code);
               return;
             }
             setJson(res, 200, reversal.value().toJson());
           });

  // POST /api/entries/:id/refresh
  svr.Post(R"(/api/entries/([A-Za-z0-9_]+)/refresh)",
           [&service](const httplib::Request &req, httplib::Response &res) {
             auto entry = service.refreshStatus(req.matches[1].str());
             if (!entry) {
               setJsonError(res, httpStatusFor(entry.error().code), entry.error().message,
                            entry.error().code);
               return;
             }
             setJson(res, 200, entry.value().toJson());
           });

  // POST /api/tenants/:id/reconcile - optional body {from, to} as ISO-8601
  svr.Post(R"(/api/tenants/(\d+)/reconcile)",
           [this, &reconciler](const httplib::Request &req, httplib::Response &res) {
             uint64_t tenantId = 0;
             if (!parseTenantId(req.matches[1].str(), tenantId)) {
               setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
               return;
             }
             int64_t to = utl::getCurrentTime();
             int64_t from = to - config_.reconciliation.lookbackSec;
             if (!req.body.empty()) {
               auto body = utl::parseJsonObject(req.body);
               if (!body) {
                 setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
                 return;
               }
               std::string fromStr;
               std::string toStr;
               if (!readString(body.value(), "from", fromStr) ||
                   !readString(body.value(), "to", toStr) ||
                   (!fromStr.empty() && !utl::parseIso8601(fromStr, from)) ||
                   (!toStr.empty() && !utl::parseIso8601(toStr, to))) {
                 setJsonError(res, 400, "from and to must be ISO-8601 timestamps",
                              err::E_INVALID_INPUT);
                 return;
               }
             }
             auto report = reconciler.reconcile(tenantId, from, to);
             if (!report) {
               setJsonError(res, httpStatusFor(report.error().code), report.error().message,
                            report.error().code);
               return;
             }
             setJson(res, 200, report.value().toJson());
           });

  // GET /api/tenants/:id/reconciliations
  svr.Get(R"(/api/tenants/(\d+)/reconciliations)",
          [&reconciler](const httplib::Request &req, httplib::Response &res) {
            uint64_t tenantId = 0;
            if (!parseTenantId(req.matches[1].str(), tenantId)) {
              setJsonError(res, 400, "Invalid tenant id", err::E_INVALID_INPUT);
              return;
            }
            json reports = json::array();
            for (const auto &report : reconciler.listReports(tenantId)) {
              reports.push_back(report.toJson());
            }
            setJson(res, 200, reports);
          });

  // GET /api/reconciliations/open
  svr.Get("/api/reconciliations/open",
          [&reconciler](const httplib::Request &, httplib::Response &res) {
            json reports = json::array();
            for (const auto &report : reconciler.listOpenReports()) {
              reports.push_back(report.toJson());
            }
            setJson(res, 200, reports);
          });

  // POST /api/reconciliations/:id/resolve
  svr.Post(R"(/api/reconciliations/([A-Za-z0-9_]+)/resolve)",
           [&reconciler](const httplib::Request &req, httplib::Response &res) {
             auto body = utl::parseJsonObject(req.body);
             if (!body) {
               setJsonError(res, 400, body.error().message, err::E_INVALID_INPUT);
               return;
             }
             std::string resolvedBy;
             std::string notes;
             if (!readString(body.value(), "resolvedBy", resolvedBy) ||
                 !readString(body.value(), "notes", notes)) {
               setJsonError(res, 400, "resolvedBy and notes must be strings",
                            err::E_INVALID_INPUT);
               return;
             }
             auto report = reconciler.resolveReport(req.matches[1].str(), resolvedBy, notes);
             if (!report) {
               setJsonError(res, httpStatusFor(report.error().code), report.error().message,
                            report.error().code);
               return;
             }
             setJson(res, 200, report.value().toJson());
           });

  // GET /api/transactions/:correlationId
  svr.Get(R"(/api/transactions/([A-Za-z0-9_:.\-]+))",
          [this](const httplib::Request &req, httplib::Response &res) {
            auto row = txLog_.find(req.matches[1].str());
            if (!row) {
              setJsonError(res, 404, row.error().message, row.error().code);
              return;
            }
            setJson(res, 200, row.value().toJson());
          });

  // GET /api/orphans
  svr.Get("/api/orphans", [this](const httplib::Request &, httplib::Response &res) {
    json rows = json::array();
    for (const auto &row : txLog_.listOrphans()) {
      rows.push_back(row.toJson());
    }
    setJson(res, 200, rows);
  });
}

} // namespace pl
