#include "CelcoinGateway.h"
#include "ErrorCodes.h"
#include "Utilities.h"

#include <cmath>

namespace pl {

namespace {

std::string firstString(const nlohmann::json &j, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
    if (it != j.end() && it->is_number_integer()) {
      return std::to_string(it->get<int64_t>());
    }
  }
  return "";
}

bool firstAmount(const nlohmann::json &j, std::initializer_list<const char *> keys,
                 Amount &amount) {
  for (const char *key : keys) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
      return money::fromJson(*it, amount);
    }
  }
  return false;
}

int64_t firstTime(const nlohmann::json &j, std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto it = j.find(key);
    if (it == j.end()) {
      continue;
    }
    int64_t value = 0;
    if (it->is_string() && utl::parseIso8601(it->get<std::string>(), value)) {
      return value;
    }
    if (it->is_number_integer()) {
      return it->get<int64_t>();
    }
  }
  return 0;
}

bool isDebitType(const std::string &type) {
  return type == "withdrawal" || type == "ted" || type == "transfer_out" ||
         type == "pix_out" || type == "debit";
}

} // namespace

CelcoinGateway::CelcoinGateway(std::shared_ptr<IHttpClient> spHttp, const Config &config)
    : CelcoinGateway(std::move(spHttp), config, [] { return utl::getCurrentTime(); }) {}

CelcoinGateway::CelcoinGateway(std::shared_ptr<IHttpClient> spHttp, const Config &config,
                               Clock clock)
    : Module("gateway.celcoin"), spHttp_(std::move(spHttp)), config_(config),
      clock_(std::move(clock)) {}

IGateway::Status CelcoinGateway::mapStatus(const std::string &providerStatus) {
  std::string status = utl::toLower(providerStatus);
  if (status == "completed" || status == "approved" || status == "paid" ||
      status == "confirmed") {
    return Status::COMPLETED;
  }
  if (status == "failed" || status == "cancelled" || status == "canceled" ||
      status == "expired" || status == "rejected" || status == "refused") {
    return Status::FAILED;
  }
  return Status::PENDING;
}

double CelcoinGateway::toProviderAmount(Amount amount) {
  return static_cast<double>(amount) / static_cast<double>(money::UNIT);
}

std::string CelcoinGateway::describeFailure(const IHttpClient::Response &response) {
  std::string detail;
  try {
    auto body = nlohmann::json::parse(response.body);
    if (body.is_object()) {
      detail = firstString(body, { "message", "error_description", "error", "description" });
    }
  } catch (const nlohmann::json::parse_error &) {
    detail = response.body.substr(0, 200);
  }
  std::string message = "Gateway returned HTTP " + std::to_string(response.status);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}

bool CelcoinGateway::hasValidToken() const {
  std::lock_guard<std::mutex> lock(tokenMutex_);
  return !accessToken_.empty() &&
         clock_() < tokenExpiresAt_ - config_.tokenSafetyMarginSec;
}

CelcoinGateway::Roe<void> CelcoinGateway::authenticate() {
  std::lock_guard<std::mutex> lock(tokenMutex_);
  return authenticateLocked();
}

CelcoinGateway::Roe<void> CelcoinGateway::authenticateLocked() {
  accessToken_.clear();
  tokenExpiresAt_ = 0;

  nlohmann::json body = { { "client_id", config_.clientId },
                          { "grant_type", "client_credentials" },
                          { "client_secret", config_.clientSecret } };
  auto result = spHttp_->post("/token", { { "Accept", "application/json" } }, body.dump());
  if (!result) {
    log().error << "Authentication request failed: " << result.error().message;
    return Error(result.error().code, "Authentication request failed: " + result.error().message);
  }

  const auto &response = *result;
  if (response.status < 200 || response.status >= 300) {
    log().error << "Authentication rejected: " << describeFailure(response);
    int32_t code = response.status >= 500 ? err::E_GATEWAY_NETWORK : err::E_AUTHENTICATION;
    return Error(code, "Failed to authenticate with Celcoin API: " + describeFailure(response));
  }

  nlohmann::json token;
  try {
    token = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(err::E_GATEWAY_PROTOCOL, std::string("Invalid token response: ") + e.what());
  }
  if (!token.is_object() || !token.contains("access_token") ||
      !token["access_token"].is_string() || !token.contains("expires_in") ||
      !token["expires_in"].is_number()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Token response lacks access_token or expires_in");
  }

  accessToken_ = token["access_token"].get<std::string>();
  tokenExpiresAt_ = clock_() + static_cast<int64_t>(token["expires_in"].get<double>());
  log().info << "Authenticated with Celcoin, token valid until "
             << utl::formatIso8601(tokenExpiresAt_);
  return {};
}

CelcoinGateway::Roe<std::string> CelcoinGateway::ensureToken() {
  std::lock_guard<std::mutex> lock(tokenMutex_);
  if (accessToken_.empty() || clock_() >= tokenExpiresAt_ - config_.tokenSafetyMarginSec) {
    auto result = authenticateLocked();
    if (!result) {
      return result.error();
    }
  }
  return accessToken_;
}

void CelcoinGateway::invalidateToken(const std::string &token) {
  std::lock_guard<std::mutex> lock(tokenMutex_);
  // Another caller may already have refreshed it
  if (accessToken_ == token) {
    accessToken_.clear();
    tokenExpiresAt_ = 0;
  }
}

CelcoinGateway::Roe<IHttpClient::Response>
CelcoinGateway::send(const std::string &method, const std::string &path,
                     const std::string &body, const std::string &token) {
  IHttpClient::Headers headers = { { "Authorization", "Bearer " + token },
                                   { "Accept", "application/json" } };
  auto result = method == "GET" ? spHttp_->get(path, headers) : spHttp_->post(path, headers, body);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return *result;
}

CelcoinGateway::Roe<CelcoinGateway::CallResult>
CelcoinGateway::call(const std::string &method, const std::string &path,
                     const nlohmann::json &body) {
  auto token = ensureToken();
  if (!token) {
    return token.error();
  }

  std::string payload = body.is_null() ? std::string() : body.dump();
  auto result = send(method, path, payload, *token);
  if (!result) {
    return result.error();
  }

  if (result->status == 401) {
    log().warning << method << " " << path << " got 401, re-authenticating";
    invalidateToken(*token);
    auto retryToken = ensureToken();
    if (!retryToken) {
      return retryToken.error();
    }
    result = send(method, path, payload, *retryToken);
    if (!result) {
      return result.error();
    }
    if (result->status == 401) {
      invalidateToken(*retryToken);
      return Error(err::E_AUTHENTICATION,
                   method + " " + path + " rejected after re-authentication");
    }
  }

  const auto &response = *result;
  if (response.status >= 500) {
    return Error(err::E_GATEWAY_TIMEOUT, method + " " + path + ": " + describeFailure(response));
  }
  if (response.status < 200 || response.status >= 300) {
    return Error(err::E_GATEWAY_REJECTED, method + " " + path + ": " + describeFailure(response));
  }

  CallResult callResult;
  callResult.httpStatus = response.status;
  if (response.body.empty()) {
    callResult.body = nlohmann::json::object();
    return callResult;
  }
  try {
    callResult.body = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(err::E_GATEWAY_PROTOCOL,
                 method + " " + path + " returned invalid JSON: " + e.what());
  }
  if (!callResult.body.is_object()) {
    return Error(err::E_GATEWAY_PROTOCOL, method + " " + path + " returned a non-object body");
  }
  return callResult;
}

CelcoinGateway::Roe<IGateway::PaymentResult>
CelcoinGateway::createPayment(const PaymentRequest &request) {
  if (request.amount <= 0) {
    return Error(err::E_INVALID_INPUT, "Payment amount must be positive");
  }

  nlohmann::json payer = { { "name", request.payer.name },
                           { "email", request.payer.email },
                           { "cpf", request.payer.document } };
  nlohmann::json body = { { "amount", toProviderAmount(request.amount) },
                          { "correlationID", request.correlationId },
                          { "payer", payer } };
  if (!request.description.empty()) {
    body["description"] = request.description;
  }

  std::string path;
  switch (request.method) {
  case PaymentMethod::PIX:
    path = "/pix/payment";
    break;
  case PaymentMethod::BOLETO:
    path = "/boleto/payment";
    body["expiresDate"] = utl::formatDate(clock_() + config_.boletoDueDays * 86400);
    break;
  default:
    return Error(err::E_INVALID_INPUT, std::string("Payment method not offered by Celcoin: ") +
                                           toString(request.method));
  }

  auto result = call("POST", path, body);
  if (!result) {
    log().warning << "createPayment " << request.correlationId
                  << " failed: " << result.error().message;
    return result.error();
  }

  const auto &response = result->body;
  PaymentResult payment;
  payment.externalId = firstString(response, { "transactionId", "id" });
  if (payment.externalId.empty()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Payment response lacks transactionId");
  }
  payment.status = mapStatus(firstString(response, { "status" }));
  if (request.method == PaymentMethod::PIX) {
    payment.qrOrBarcode = firstString(response, { "pixCopiaECola", "emvqrcps" });
  } else {
    payment.qrOrBarcode = firstString(response, { "digitableLine", "barCode" });
  }
  payment.expiresAt = firstTime(response, { "expirationDate", "expiresDate" });
  payment.httpStatus = result->httpStatus;
  payment.raw = response;

  log().info << "Created " << toString(request.method) << " payment " << payment.externalId
             << " for " << request.correlationId << " status=" << toString(payment.status);
  return payment;
}

CelcoinGateway::Roe<IGateway::WithdrawalResult>
CelcoinGateway::createWithdrawal(const WithdrawalRequest &request) {
  if (request.amount <= 0) {
    return Error(err::E_INVALID_INPUT, "Withdrawal amount must be positive");
  }

  const auto &bank = request.bankAccount;
  nlohmann::json body = {
    { "amount", toProviderAmount(request.amount) },
    { "correlationID", request.correlationId },
    { "accountId", request.accountId },
    { "bankAccount",
      { { "bank", bank.bank },
        { "agency", bank.agency },
        { "account", bank.account },
        { "accountType", bank.accountType.empty() ? "checking" : bank.accountType },
        { "accountHolder", { { "name", bank.holderName }, { "document", bank.holderDocument } } } } }
  };
  if (!request.description.empty()) {
    body["description"] = request.description;
  }

  auto result = call("POST", "/account/withdrawal", body);
  if (!result) {
    log().warning << "createWithdrawal " << request.correlationId
                  << " failed: " << result.error().message;
    return result.error();
  }

  const auto &response = result->body;
  WithdrawalResult withdrawal;
  withdrawal.externalId = firstString(response, { "transactionId", "id" });
  if (withdrawal.externalId.empty()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Withdrawal response lacks transactionId");
  }
  withdrawal.status = mapStatus(firstString(response, { "status" }));
  if (!firstAmount(response, { "fee", "tax" }, withdrawal.fee)) {
    withdrawal.fee = 0;
  }
  withdrawal.httpStatus = result->httpStatus;
  withdrawal.raw = response;

  log().info << "Created withdrawal " << withdrawal.externalId << " for "
             << request.correlationId << " status=" << toString(withdrawal.status);
  return withdrawal;
}

CelcoinGateway::Roe<IGateway::Status> CelcoinGateway::getStatus(const std::string &externalId) {
  auto result = call("GET", "/transactions/" + externalId, nlohmann::json());
  if (!result) {
    return result.error();
  }
  std::string providerStatus = firstString(result->body, { "status" });
  if (providerStatus.empty()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Status response lacks status for " + externalId);
  }
  return mapStatus(providerStatus);
}

CelcoinGateway::Roe<Amount> CelcoinGateway::getBalance(const std::string &accountId) {
  auto result = call("GET", "/account/" + accountId + "/balance", nlohmann::json());
  if (!result) {
    return result.error();
  }
  Amount balance = 0;
  if (!firstAmount(result->body, { "available", "balance" }, balance)) {
    return Error(err::E_GATEWAY_PROTOCOL, "Balance response lacks a usable amount");
  }
  return balance;
}

CelcoinGateway::Roe<std::vector<IGateway::StatementItem>>
CelcoinGateway::listTransactions(const std::string &accountId, int64_t from, int64_t to) {
  std::string path = "/account/" + accountId + "/statement?startDate=" + utl::formatDate(from) +
                     "&endDate=" + utl::formatDate(to);
  auto result = call("GET", path, nlohmann::json());
  if (!result) {
    return result.error();
  }

  auto it = result->body.find("transactions");
  if (it == result->body.end() || !it->is_array()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Statement response lacks transactions");
  }

  std::vector<StatementItem> items;
  for (const auto &row : *it) {
    if (!row.is_object()) {
      continue;
    }
    StatementItem item;
    item.externalId = firstString(row, { "id", "transactionId" });
    item.correlationId = firstString(row, { "correlationId", "correlationID" });
    if (item.externalId.empty() || !firstAmount(row, { "amount" }, item.amount)) {
      log().warning << "Skipping malformed statement row: " << row.dump();
      continue;
    }
    if (item.amount > 0 && isDebitType(utl::toLower(firstString(row, { "type" })))) {
      item.amount = -item.amount;
    }
    item.status = mapStatus(firstString(row, { "status" }));
    item.createdAt = firstTime(row, { "createdAt", "updatedAt" });
    if (item.createdAt != 0 && (item.createdAt < from || item.createdAt > to)) {
      continue;
    }
    items.push_back(item);
  }
  return items;
}

bool CelcoinGateway::verifyWebhookSignature(const std::string &payload,
                                            const std::string &signature) const {
  if (config_.webhookSecret.empty() || signature.empty()) {
    return false;
  }
  std::string provided = utl::toLower(signature);
  const std::string prefix = "sha256=";
  if (provided.compare(0, prefix.size(), prefix) == 0) {
    provided = provided.substr(prefix.size());
  }
  std::string expected = utl::hmacSha256Hex(config_.webhookSecret, payload);
  return utl::constantTimeEquals(provided, expected);
}

CelcoinGateway::Roe<IGateway::WebhookEvent>
CelcoinGateway::parseWebhook(const std::string &payload) const {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(err::E_INVALID_INPUT, std::string("Webhook payload is not JSON: ") + e.what());
  }
  if (!j.is_object()) {
    return Error(err::E_INVALID_INPUT, "Webhook payload is not a JSON object");
  }

  const nlohmann::json &data = j.contains("data") && j["data"].is_object() ? j["data"] : j;

  WebhookEvent event;
  event.gatewayTransactionId = firstString(data, { "transactionId", "id" });
  if (event.gatewayTransactionId.empty()) {
    return Error(err::E_GATEWAY_PROTOCOL, "Webhook lacks transactionId");
  }
  event.correlationId = firstString(data, { "correlationId", "correlationID" });
  event.providerStatus = firstString(data, { "status" });
  event.status = mapStatus(event.providerStatus);
  if (!firstAmount(data, { "amount" }, event.amount)) {
    event.amount = 0;
  }
  event.occurredAt = firstTime(data, { "timestamp", "updatedAt", "createdAt" });
  if (event.occurredAt == 0) {
    event.occurredAt = firstTime(j, { "timestamp", "createdAt" });
  }
  event.raw = j;
  return event;
}

} // namespace pl
