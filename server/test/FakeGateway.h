#ifndef PAYLEDGER_TEST_FAKE_GATEWAY_H
#define PAYLEDGER_TEST_FAKE_GATEWAY_H

#include "../../interface/IGateway.hpp"
#include "ErrorCodes.h"

#include <nlohmann/json.hpp>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace pl {
namespace test {

/**
 * In-process gateway with scripted answers.
 *
 * Payments and withdrawals get sequential ids unless a result is queued.
 * Webhooks are plain JSON objects {id, status, correlationId, amount} and
 * a signature is valid when it equals "valid".
 */
class FakeGateway : public IGateway {
public:
  Roe<void> authenticate() override { return {}; }

  Roe<PaymentResult> createPayment(const PaymentRequest &request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    payments.push_back(request);
    if (!paymentResults_.empty()) {
      auto result = paymentResults_.front();
      paymentResults_.pop_front();
      return result;
    }
    PaymentResult result;
    result.externalId = "pay-" + std::to_string(payments.size());
    result.status = paymentStatus;
    result.qrOrBarcode = "000201qr";
    result.httpStatus = 201;
    return result;
  }

  Roe<WithdrawalResult> createWithdrawal(const WithdrawalRequest &request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    withdrawals.push_back(request);
    if (!withdrawalResults_.empty()) {
      auto result = withdrawalResults_.front();
      withdrawalResults_.pop_front();
      return result;
    }
    WithdrawalResult result;
    result.externalId = "wd-" + std::to_string(withdrawals.size());
    result.status = withdrawalStatus;
    result.fee = withdrawalFee;
    result.httpStatus = 201;
    return result;
  }

  Roe<Status> getStatus(const std::string &externalId) override {
    std::lock_guard<std::mutex> lock(mutex_);
    statusQueries.push_back(externalId);
    if (!statusResults_.empty()) {
      auto result = statusResults_.front();
      statusResults_.pop_front();
      return result;
    }
    return Status::PENDING;
  }

  Roe<Amount> getBalance(const std::string &accountId) override {
    std::lock_guard<std::mutex> lock(mutex_);
    balanceQueries.push_back(accountId);
    if (!balanceResults_.empty()) {
      auto result = balanceResults_.front();
      balanceResults_.pop_front();
      return result;
    }
    return balance;
  }

  Roe<std::vector<StatementItem>> listTransactions(const std::string &accountId, int64_t from,
                                                   int64_t to) override {
    std::lock_guard<std::mutex> lock(mutex_);
    statementQueries.push_back(accountId);
    if (statementError != 0) {
      return Error(statementError, "statement unavailable");
    }
    return statement;
  }

  bool verifyWebhookSignature(const std::string &payload,
                              const std::string &signature) const override {
    return signature == "valid";
  }

  Roe<WebhookEvent> parseWebhook(const std::string &payload) const override {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("id")) {
      return Error(err::E_GATEWAY_PROTOCOL, "Malformed webhook");
    }
    WebhookEvent event;
    event.gatewayTransactionId = j["id"].get<std::string>();
    event.correlationId = j.value("correlationId", "");
    event.providerStatus = j.value("status", "pending");
    if (event.providerStatus == "completed") {
      event.status = Status::COMPLETED;
    } else if (event.providerStatus == "failed") {
      event.status = Status::FAILED;
    }
    event.amount = j.value("amount", static_cast<Amount>(0));
    event.raw = j;
    return event;
  }

  void queuePayment(const Roe<PaymentResult> &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    paymentResults_.push_back(result);
  }

  void queueWithdrawal(const Roe<WithdrawalResult> &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    withdrawalResults_.push_back(result);
  }

  void queueStatus(const Roe<Status> &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusResults_.push_back(result);
  }

  void queueBalance(const Roe<Amount> &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    balanceResults_.push_back(result);
  }

  static Error failure(int32_t code) { return Error(code, err::errorName(code)); }

  Status paymentStatus{ Status::PENDING };
  Status withdrawalStatus{ Status::PENDING };
  Amount withdrawalFee{ 0 };
  Amount balance{ 0 };
  std::vector<StatementItem> statement;
  int32_t statementError{ 0 };

  std::vector<PaymentRequest> payments;
  std::vector<WithdrawalRequest> withdrawals;
  std::vector<std::string> statusQueries;
  std::vector<std::string> balanceQueries;
  std::vector<std::string> statementQueries;

private:
  std::mutex mutex_;
  std::deque<Roe<PaymentResult>> paymentResults_;
  std::deque<Roe<WithdrawalResult>> withdrawalResults_;
  std::deque<Roe<Status>> statusResults_;
  std::deque<Roe<Amount>> balanceResults_;
};

} // namespace test
} // namespace pl

#endif // PAYLEDGER_TEST_FAKE_GATEWAY_H
