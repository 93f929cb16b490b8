#ifndef PAYLEDGER_LEDGER_SERVICE_H
#define PAYLEDGER_LEDGER_SERVICE_H

#include "Retry.h"
#include "TenantDirectory.h"
#include "TenantRateLimiter.h"
#include "IGateway.hpp"
#include "LedgerStore.h"
#include "TransactionLog.h"
#include "KeyedMutex.h"
#include "Module.h"
#include "Money.h"
#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pl {

/**
 * LedgerService - orchestrates money movement between the ledger, the
 * transaction log and the settlement gateway.
 *
 * Every gateway call is preceded by a log row and its outcome is written
 * back to that row. Ledger entries are created pending and reach a terminal
 * state through the synchronous response, a webhook, or a status refresh,
 * whichever comes first; the others become no-ops. Work on one correlation
 * id is serialized, and no lock is held while talking to the gateway.
 */
class LedgerService : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  using Entry = LedgerStore::Entry;
  using Clock = std::function<int64_t()>;

  struct Limits {
    Amount maxTransactionAmount{ 100000 * money::UNIT };
    Amount dailyCashOutLimit{ 50000 * money::UNIT };
    Amount minCashOutAmount{ 1 };
    int64_t maxPendingAgeSec{ 24 * 3600 };
  };

  struct RateLimits {
    uint32_t cashInPerWindow{ 20 };
    uint32_t cashOutPerWindow{ 5 };
    int64_t windowSec{ 15 * 60 };
  };

  struct Config {
    Limits limits;
    RateLimits rateLimits;
    RetryPolicy retry;
  };

  /** Outcome of a money-moving request, as returned to the caller */
  struct OperationResult {
    bool success{ false };
    std::string transactionId; // correlation id of the operation
    std::string externalTransactionId;
    std::string entryId;
    Amount amount{ 0 };
    Amount fee{ 0 };
    std::string status; // pending | completed | failed
    std::string message;
    int32_t errorCode{ 0 };
    bool duplicate{ false };
    std::string qrOrBarcode;
    int64_t expiresAt{ 0 };

    nlohmann::json toJson() const;
  };

  struct CashInRequest {
    uint64_t tenantId{ 0 };
    Amount amount{ 0 };
    std::string referenceId;
    IGateway::PaymentMethod method{ IGateway::PaymentMethod::PIX };
    IGateway::Party payer;
    std::string description;
    nlohmann::json metadata = nlohmann::json::object();
  };

  struct CashOutRequest {
    uint64_t tenantId{ 0 };
    Amount amount{ 0 }; // positive magnitude
    std::string referenceId;
    IGateway::BankAccount bankAccount;
    std::string description;
    nlohmann::json metadata = nlohmann::json::object();
  };

  struct AdjustmentRequest {
    uint64_t tenantId{ 0 };
    Amount amount{ 0 }; // signed
    std::string referenceId;
    std::string reason;
  };

  struct WebhookOutcome {
    // confirmed | failed | pending | duplicate | orphan | conflict | ignored
    std::string action;
    std::string correlationId;
    std::string gatewayTransactionId;
    std::string entryId;

    nlohmann::json toJson() const;
  };

  struct Balance {
    uint64_t tenantId{ 0 };
    Amount confirmed{ 0 };
    Amount available{ 0 };

    nlohmann::json toJson() const;
  };

  struct SweepReport {
    uint64_t tenantId{ 0 };
    size_t checked{ 0 };
    size_t confirmed{ 0 };
    size_t failed{ 0 };
    size_t errors{ 0 };
    std::vector<std::string> staleEntryIds;

    nlohmann::json toJson() const;
  };

  LedgerService(LedgerStore &store, TransactionLog &txLog, IGateway &gateway,
                TenantDirectory &tenants, const Config &config);
  ~LedgerService() override = default;

  /** Test hooks */
  void setClock(Clock clock) { clock_ = std::move(clock); }
  void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

  const Config &getConfig() const { return config_; }

  OperationResult processCashIn(const CashInRequest &request);
  OperationResult processCashOut(const CashOutRequest &request);

  /** Operator credit or debit, confirmed on write */
  OperationResult postAdjustment(const AdjustmentRequest &request);

  /**
   * Verify, parse and apply a gateway callback.
   * E_INVALID_WEBHOOK_SIGNATURE and malformed payloads are errors; an
   * unmatched but authentic webhook is recorded as an orphan.
   */
  Roe<WebhookOutcome> handleWebhook(const std::string &payload, const std::string &signature);

  /** Operator reversal; returns the reversal entry */
  Roe<Entry> reverseEntry(const std::string &entryId, const std::string &reason);

  /** Ask the gateway for the status of a pending entry and apply it */
  Roe<Entry> refreshStatus(const std::string &entryId);

  /** Refresh all pending entries of a tenant and report the stale ones */
  SweepReport sweepPending(uint64_t tenantId);

  Roe<Balance> getBalance(uint64_t tenantId) const;

  /** Drop expired rate limit windows; returns how many were dropped */
  size_t pruneRateLimits();

private:
  struct Outcome {
    std::string action;
    std::string entryId;
  };

  /** Marks a (tenant, operation, reference) as being processed */
  class InFlightGuard {
  public:
    InFlightGuard(LedgerService &owner, const std::string &key);
    ~InFlightGuard();

    InFlightGuard(const InFlightGuard &) = delete;
    InFlightGuard &operator=(const InFlightGuard &) = delete;

    bool isAcquired() const { return acquired_; }

  private:
    LedgerService &owner_;
    std::string key_;
    bool acquired_;
  };

  static std::string inFlightKey(uint64_t tenantId, const char *operation,
                                 const std::string &referenceId);
  static const char *resultStatus(LedgerStore::EntryStatus status);
  static bool isDefiniteFailure(int32_t code);
  static nlohmann::json maskBankAccount(const IGateway::BankAccount &account);

  OperationResult makeFailure(int32_t code, const std::string &message) const;
  OperationResult fromEntry(const Entry &entry, const std::string &message) const;
  OperationResult duplicateOf(const Entry &entry) const;
  OperationResult inFlightResult(uint64_t tenantId, TransactionLog::OperationType type,
                                 const std::string &referenceId) const;

  Roe<void> checkAmount(Amount amount) const;

  /**
   * A prior attempt settles the request when it obtained a payment, or when
   * its outcome is still unknown and issuing a second payment could charge twice.
   * @return true when result is filled from the prior attempt
   */
  bool recoverCashIn(const CashInRequest &request, OperationResult &result);

  // The helpers below expect the caller to hold the correlation id's lock
  Roe<Entry> findEntryFor(const TransactionLog::Record &row,
                          const std::string &gatewayTransactionId) const;
  Roe<Entry> materializeCashIn(const TransactionLog::Record &row,
                               const std::string &gatewayTransactionId);
  Roe<Entry> confirmEntry(const Entry &entry, const std::string &gatewayTransactionId);
  /** Offsets a pending entry with a reversal so it stops reserving funds */
  Roe<Entry> reversePending(const std::string &entryId, const std::string &reason);
  Outcome applyGatewayStatus(const TransactionLog::Record &row, IGateway::Status status,
                             const std::string &gatewayTransactionId);
  void adoptOrphan(const std::string &correlationId, const std::string &gatewayTransactionId);

  Roe<WebhookOutcome> recordOrphan(const IGateway::WebhookEvent &event,
                                   const std::string &payloadHash);

  int64_t now() const { return clock_(); }

  LedgerStore &store_;
  TransactionLog &txLog_;
  IGateway &gateway_;
  TenantDirectory &tenants_;
  Config config_;
  Clock clock_;
  Sleeper sleeper_;

  TenantRateLimiter cashInLimiter_;
  TenantRateLimiter cashOutLimiter_;

  KeyedMutex correlationLocks_;

  std::mutex inFlightMutex_;
  std::set<std::string> inFlight_;
};

} // namespace pl

#endif // PAYLEDGER_LEDGER_SERVICE_H
