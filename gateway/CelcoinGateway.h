#pragma once

#include "IGateway.hpp"
#include "IHttpClient.hpp"
#include "Module.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace pl {

/**
 * Celcoin settlement provider.
 *
 * OAuth2 client-credentials token from POST /token, cached until
 * expiresAt - safety margin. A 401 on any call drops the token,
 * re-authenticates once and repeats the call once.
 */
class CelcoinGateway : public IGateway, public Module {
public:
  struct Config {
    std::string clientId;
    std::string clientSecret;
    std::string webhookSecret;
    int64_t tokenSafetyMarginSec{ 60 };
    int64_t boletoDueDays{ 3 };
  };

  /** Returns unix seconds; replaceable in tests */
  using Clock = std::function<int64_t()>;

  CelcoinGateway(std::shared_ptr<IHttpClient> spHttp, const Config &config);
  CelcoinGateway(std::shared_ptr<IHttpClient> spHttp, const Config &config, Clock clock);
  ~CelcoinGateway() override = default;

  Roe<void> authenticate() override;
  Roe<PaymentResult> createPayment(const PaymentRequest &request) override;
  Roe<WithdrawalResult> createWithdrawal(const WithdrawalRequest &request) override;
  Roe<Status> getStatus(const std::string &externalId) override;
  Roe<Amount> getBalance(const std::string &accountId) override;
  Roe<std::vector<StatementItem>> listTransactions(const std::string &accountId, int64_t from,
                                                   int64_t to) override;
  bool verifyWebhookSignature(const std::string &payload,
                              const std::string &signature) const override;
  Roe<WebhookEvent> parseWebhook(const std::string &payload) const override;

  /** Provider status vocabulary -> Status */
  static Status mapStatus(const std::string &providerStatus);

  bool hasValidToken() const;

private:
  struct CallResult {
    int httpStatus{ 0 };
    nlohmann::json body;
  };

  Roe<CallResult> call(const std::string &method, const std::string &path,
                       const nlohmann::json &body);
  Roe<IHttpClient::Response> send(const std::string &method, const std::string &path,
                                  const std::string &body, const std::string &token);
  Roe<std::string> ensureToken();
  // Caller holds tokenMutex_
  Roe<void> authenticateLocked();
  void invalidateToken(const std::string &token);

  static double toProviderAmount(Amount amount);
  static std::string describeFailure(const IHttpClient::Response &response);

  std::shared_ptr<IHttpClient> spHttp_;
  Config config_;
  Clock clock_;

  mutable std::mutex tokenMutex_;
  std::string accessToken_;
  int64_t tokenExpiresAt_{ 0 };
};

} // namespace pl
