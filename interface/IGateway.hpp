#pragma once

#include "Money.h"
#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pl {

/**
 * Interface for an external settlement provider.
 * Implementations own the provider's protocol: token lifecycle, request
 * shapes and status vocabulary. Callers only see the types below.
 *
 * Errors carry the codes from ErrorCodes.h (E_AUTHENTICATION,
 * E_GATEWAY_TIMEOUT, E_GATEWAY_NETWORK, E_GATEWAY_REJECTED,
 * E_GATEWAY_PROTOCOL).
 */
class IGateway {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  enum class Status { PENDING, COMPLETED, FAILED };

  enum class PaymentMethod { PIX, BOLETO, CREDIT_CARD };

  static const char *toString(Status status) {
    switch (status) {
    case Status::COMPLETED:
      return "completed";
    case Status::FAILED:
      return "failed";
    default:
      return "pending";
    }
  }

  static const char *toString(PaymentMethod method) {
    switch (method) {
    case PaymentMethod::BOLETO:
      return "boleto";
    case PaymentMethod::CREDIT_CARD:
      return "credit_card";
    default:
      return "pix";
    }
  }

  static bool parsePaymentMethod(const std::string &str, PaymentMethod &method) {
    if (str == "pix") {
      method = PaymentMethod::PIX;
    } else if (str == "boleto") {
      method = PaymentMethod::BOLETO;
    } else if (str == "credit_card") {
      method = PaymentMethod::CREDIT_CARD;
    } else {
      return false;
    }
    return true;
  }

  struct Party {
    std::string name;
    std::string email;
    std::string document;
  };

  struct BankAccount {
    std::string bank;
    std::string agency;
    std::string account;
    std::string accountType; // checking | savings
    std::string holderName;
    std::string holderDocument;
  };

  struct PaymentRequest {
    std::string accountId;
    std::string correlationId;
    Amount amount{ 0 };
    PaymentMethod method{ PaymentMethod::PIX };
    Party payer;
    std::string description;
  };

  struct PaymentResult {
    std::string externalId;
    Status status{ Status::PENDING };
    std::string qrOrBarcode;
    int64_t expiresAt{ 0 };
    int httpStatus{ 0 };
    nlohmann::json raw = nlohmann::json::object();
  };

  struct WithdrawalRequest {
    std::string accountId;
    std::string correlationId;
    Amount amount{ 0 }; // positive magnitude
    BankAccount bankAccount;
    std::string description;
  };

  struct WithdrawalResult {
    std::string externalId;
    Status status{ Status::PENDING };
    Amount fee{ 0 };
    int httpStatus{ 0 };
    nlohmann::json raw = nlohmann::json::object();
  };

  /** One line of the provider's account statement */
  struct StatementItem {
    std::string externalId;
    std::string correlationId;
    Amount amount{ 0 }; // credits positive, debits negative
    Status status{ Status::PENDING };
    int64_t createdAt{ 0 };
  };

  /** Provider-neutral content of a webhook callback */
  struct WebhookEvent {
    std::string gatewayTransactionId;
    std::string correlationId; // echoed back by the provider, may be empty
    Status status{ Status::PENDING };
    std::string providerStatus;
    Amount amount{ 0 };
    int64_t occurredAt{ 0 };
    nlohmann::json raw = nlohmann::json::object();
  };

  virtual ~IGateway() = default;

  virtual Roe<void> authenticate() = 0;
  virtual Roe<PaymentResult> createPayment(const PaymentRequest &request) = 0;
  virtual Roe<WithdrawalResult> createWithdrawal(const WithdrawalRequest &request) = 0;
  virtual Roe<Status> getStatus(const std::string &externalId) = 0;
  virtual Roe<Amount> getBalance(const std::string &accountId) = 0;
  virtual Roe<std::vector<StatementItem>> listTransactions(const std::string &accountId,
                                                           int64_t from, int64_t to) = 0;
  virtual bool verifyWebhookSignature(const std::string &payload,
                                      const std::string &signature) const = 0;
  virtual Roe<WebhookEvent> parseWebhook(const std::string &payload) const = 0;
};

} // namespace pl
