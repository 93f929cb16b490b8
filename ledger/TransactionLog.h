#ifndef PAYLEDGER_TRANSACTION_LOG_H
#define PAYLEDGER_TRANSACTION_LOG_H

#include "JournalFile.h"
#include "Module.h"
#include "Money.h"
#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pl {

/**
 * TransactionLog - forensic trail of gateway calls and inbound webhooks.
 *
 * Rows are keyed by a locally generated correlation id and, once known, by
 * the gateway's transaction id. Rows are never deleted. Updates are merges:
 * fields absent from an Update keep their value, a recorded error message is
 * never dropped, and applying the same update twice leaves the row as it was
 * after the first application.
 */
class TransactionLog : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  enum class OperationType { PAYMENT, WITHDRAWAL, WEBHOOK, BALANCE_CHECK };

  static const char *toString(OperationType type);
  static bool parseOperationType(const std::string &str, OperationType &type);

  struct Record {
    std::string id;
    uint64_t tenantId{ 0 }; // 0 for webhooks that matched no tenant
    std::string correlationId;
    std::string gatewayTransactionId;
    OperationType operationType{ OperationType::PAYMENT };
    std::string referenceId;
    Amount amount{ 0 };
    nlohmann::json requestPayload = nlohmann::json::object();
    nlohmann::json responsePayload = nlohmann::json::object();
    int32_t httpStatus{ 0 };
    std::string gatewayStatus;
    Amount fee{ 0 };
    Amount netAmount{ 0 };
    bool isSuccessful{ false };
    std::string errorMessage;
    bool webhookReceived{ false };
    int64_t webhookTimestamp{ 0 };
    std::string webhookPayloadHash;
    int64_t createdAt{ 0 };
    int64_t updatedAt{ 0 };

    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json &j);
  };

  /** Partial update; unset fields are left alone */
  struct Update {
    std::optional<std::string> gatewayTransactionId;
    std::optional<nlohmann::json> responsePayload; // merged key by key
    std::optional<int32_t> httpStatus;
    std::optional<std::string> gatewayStatus;
    std::optional<Amount> fee;
    std::optional<Amount> netAmount;
    std::optional<bool> isSuccessful;
    std::optional<std::string> errorMessage; // appended, never replaces
    std::optional<bool> webhookReceived;
    std::optional<int64_t> webhookTimestamp;
    std::optional<std::string> webhookPayloadHash;
  };

  struct InitConfig {
    std::string workDir; // empty keeps the log in memory only
  };

  TransactionLog();
  ~TransactionLog() override = default;

  Roe<void> init(const InitConfig &config);

  /**
   * Write a new row. id and timestamps are assigned here.
   * Fails with E_DUPLICATE_REFERENCE if the correlation id is taken.
   * @return Id of the row
   */
  Roe<std::string> record(const Record &row);

  Roe<Record> update(const std::string &correlationId, const Update &partial);
  Roe<Record> updateByGatewayId(const std::string &gatewayTransactionId, const Update &partial);

  Roe<Record> find(const std::string &correlationId) const;
  Roe<Record> findByGatewayId(const std::string &gatewayTransactionId) const;

  /** Most recent row for a business reference */
  Roe<Record> findLatestByReference(uint64_t tenantId, OperationType type,
                                    const std::string &referenceId) const;

  /** Rows of a tenant created in [from, to], oldest first */
  std::vector<Record> listByTenant(uint64_t tenantId, int64_t from, int64_t to) const;

  /** Webhook rows that could not be matched to an operation */
  std::vector<Record> listOrphans() const;

private:
  static std::string referenceKey(uint64_t tenantId, OperationType type,
                                  const std::string &referenceId);

  // Caller holds mutex_
  Roe<Record> applyUpdate(const std::string &correlationId, const Update &partial);
  Roe<void> journal(const Record &row);
  void index(const Record &row);
  Roe<void> replayJournal();

  std::unique_ptr<JournalFile> upJournal_;

  mutable std::mutex mutex_;
  std::vector<std::string> order_; // correlation ids in creation order
  std::map<std::string, Record> rows_;
  std::map<std::string, std::string> gatewayIndex_;
  std::map<std::string, std::vector<std::string>> referenceIndex_;
};

} // namespace pl

#endif // PAYLEDGER_TRANSACTION_LOG_H
