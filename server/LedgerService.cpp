#include "LedgerService.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "Utilities.h"

namespace pl {

namespace {

logging::Logger &audit() { return logging::getAuditLogger(); }

const std::string ORPHAN_PREFIX = "orphan:";

bool parseStatus(const std::string &str, IGateway::Status &status) {
  if (str == "completed") {
    status = IGateway::Status::COMPLETED;
  } else if (str == "failed") {
    status = IGateway::Status::FAILED;
  } else if (str == "pending") {
    status = IGateway::Status::PENDING;
  } else {
    return false;
  }
  return true;
}

bool isTerminal(const std::string &gatewayStatus) {
  return gatewayStatus == "completed" || gatewayStatus == "failed";
}

std::string describe(int32_t code, const std::string &message) {
  return err::errorName(code) + ": " + message;
}

// A pending report never overwrites a terminal one; deliveries can be reordered.
void setGatewayStatus(TransactionLog::Update &update, const std::string &current,
                      IGateway::Status status) {
  if (status != IGateway::Status::PENDING || !isTerminal(current)) {
    update.gatewayStatus = IGateway::toString(status);
  }
}

} // namespace

nlohmann::json LedgerService::OperationResult::toJson() const {
  nlohmann::json j;
  j["success"] = success;
  j["transactionId"] = transactionId;
  j["externalTransactionId"] =
      externalTransactionId.empty() ? nlohmann::json(nullptr) : nlohmann::json(externalTransactionId);
  j["entryId"] = entryId.empty() ? nlohmann::json(nullptr) : nlohmann::json(entryId);
  j["amount"] = money::format(amount);
  if (fee != 0) {
    j["fee"] = money::format(fee);
  }
  j["status"] = status;
  j["message"] = message;
  if (errorCode != 0) {
    j["errorCode"] = err::errorName(errorCode);
  }
  if (duplicate) {
    j["duplicate"] = true;
  }
  if (!qrOrBarcode.empty()) {
    j["qrOrBarcode"] = qrOrBarcode;
  }
  if (expiresAt != 0) {
    j["expiresAt"] = utl::formatIso8601(expiresAt);
  }
  return j;
}

nlohmann::json LedgerService::WebhookOutcome::toJson() const {
  nlohmann::json j;
  j["action"] = action;
  j["correlationId"] = correlationId;
  j["gatewayTransactionId"] = gatewayTransactionId;
  j["entryId"] = entryId.empty() ? nlohmann::json(nullptr) : nlohmann::json(entryId);
  return j;
}

nlohmann::json LedgerService::Balance::toJson() const {
  nlohmann::json j;
  j["tenantId"] = tenantId;
  j["balance"] = money::format(confirmed);
  j["available"] = money::format(available);
  return j;
}

nlohmann::json LedgerService::SweepReport::toJson() const {
  nlohmann::json j;
  j["tenantId"] = tenantId;
  j["checked"] = checked;
  j["confirmed"] = confirmed;
  j["failed"] = failed;
  j["errors"] = errors;
  j["stale"] = staleEntryIds;
  return j;
}

LedgerService::InFlightGuard::InFlightGuard(LedgerService &owner, const std::string &key)
    : owner_(owner), key_(key) {
  std::lock_guard<std::mutex> lock(owner_.inFlightMutex_);
  acquired_ = owner_.inFlight_.insert(key_).second;
}

LedgerService::InFlightGuard::~InFlightGuard() {
  if (acquired_) {
    std::lock_guard<std::mutex> lock(owner_.inFlightMutex_);
    owner_.inFlight_.erase(key_);
  }
}

LedgerService::LedgerService(LedgerStore &store, TransactionLog &txLog, IGateway &gateway,
                             TenantDirectory &tenants, const Config &config)
    : Module("server.ledger"), store_(store), txLog_(txLog), gateway_(gateway),
      tenants_(tenants), config_(config), clock_([] { return utl::getCurrentTime(); }),
      sleeper_(sleepFor),
      cashInLimiter_({ config.rateLimits.cashInPerWindow, config.rateLimits.windowSec },
                     [this] { return clock_(); }),
      cashOutLimiter_({ config.rateLimits.cashOutPerWindow, config.rateLimits.windowSec },
                      [this] { return clock_(); }) {}

std::string LedgerService::inFlightKey(uint64_t tenantId, const char *operation,
                                       const std::string &referenceId) {
  return std::to_string(tenantId) + ":" + operation + ":" + referenceId;
}

const char *LedgerService::resultStatus(LedgerStore::EntryStatus status) {
  switch (status) {
  case LedgerStore::EntryStatus::CONFIRMED:
    return "completed";
  case LedgerStore::EntryStatus::PENDING:
    return "pending";
  default:
    return "failed";
  }
}

bool LedgerService::isDefiniteFailure(int32_t code) {
  // The request either never left or was answered with a refusal.
  return code == err::E_GATEWAY_REJECTED || code == err::E_GATEWAY_NETWORK ||
         code == err::E_AUTHENTICATION || code == err::E_INVALID_INPUT;
}

nlohmann::json LedgerService::maskBankAccount(const IGateway::BankAccount &account) {
  std::string masked = account.account;
  if (masked.size() > 4) {
    masked = std::string(masked.size() - 4, '*') + masked.substr(masked.size() - 4);
  }
  nlohmann::json j;
  j["bank"] = account.bank;
  j["agency"] = account.agency;
  j["account"] = masked;
  j["accountType"] = account.accountType;
  j["holderName"] = account.holderName;
  return j;
}

LedgerService::OperationResult LedgerService::makeFailure(int32_t code,
                                                          const std::string &message) const {
  OperationResult result;
  result.success = false;
  result.status = "failed";
  result.errorCode = code;
  result.message = message;
  return result;
}

LedgerService::OperationResult LedgerService::fromEntry(const Entry &entry,
                                                        const std::string &message) const {
  OperationResult result;
  result.success = entry.isActive();
  result.transactionId = entry.correlationId;
  result.externalTransactionId = entry.externalTransactionId;
  result.entryId = entry.id;
  result.amount = entry.type == LedgerStore::EntryType::CASH_OUT ? -entry.amount : entry.amount;
  result.status = resultStatus(entry.status);
  result.message = entry.isActive() || entry.failureReason.empty() ? message : entry.failureReason;
  return result;
}

LedgerService::OperationResult LedgerService::duplicateOf(const Entry &entry) const {
  auto result = fromEntry(entry, "Duplicate request; returning the original result");
  result.duplicate = true;
  log().info << "Duplicate " << LedgerStore::toString(entry.type) << " request for reference "
             << entry.referenceId << " (tenant " << entry.tenantId << "), original entry "
             << entry.id;
  return result;
}

LedgerService::OperationResult
LedgerService::inFlightResult(uint64_t tenantId, TransactionLog::OperationType type,
                              const std::string &referenceId) const {
  OperationResult result;
  result.success = false;
  result.status = "pending";
  result.duplicate = true;
  result.errorCode = err::E_DUPLICATE_REFERENCE;
  result.message = "A request with this reference is already being processed";
  auto row = txLog_.findLatestByReference(tenantId, type, referenceId);
  if (row) {
    result.transactionId = row->correlationId;
    result.amount = row->amount;
  }
  return result;
}

LedgerService::Roe<void> LedgerService::checkAmount(Amount amount) const {
  Amount magnitude = amount < 0 ? -amount : amount;
  if (magnitude == 0) {
    return Error(err::E_INVALID_INPUT, "Amount must not be zero");
  }
  if (magnitude > config_.limits.maxTransactionAmount) {
    return Error(err::E_LIMIT_EXCEEDED, "Amount exceeds the maximum of " +
                                            money::format(config_.limits.maxTransactionAmount) +
                                            " per transaction");
  }
  return {};
}

// ---------------------------------------------------------------------------
// Cash-in
// ---------------------------------------------------------------------------

LedgerService::OperationResult LedgerService::processCashIn(const CashInRequest &request) {
  if (request.tenantId == 0) {
    return makeFailure(err::E_INVALID_INPUT, "Tenant id is required");
  }
  if (request.referenceId.empty()) {
    return makeFailure(err::E_INVALID_INPUT, "Reference id is required");
  }
  if (request.amount <= 0) {
    return makeFailure(err::E_INVALID_INPUT, "Cash-in amount must be positive");
  }
  auto amountCheck = checkAmount(request.amount);
  if (!amountCheck) {
    return makeFailure(amountCheck.error().code, amountCheck.error().message);
  }

  auto accountResult = tenants_.resolve(request.tenantId);
  if (!accountResult) {
    return makeFailure(accountResult.error().code, accountResult.error().message);
  }
  const std::string accountId = accountResult.value();

  auto existing =
      store_.findActiveByReference(request.tenantId, request.referenceId, LedgerStore::EntryType::CASH_IN);
  if (existing) {
    return duplicateOf(*existing);
  }

  InFlightGuard guard(*this, inFlightKey(request.tenantId, "cash_in", request.referenceId));
  if (!guard.isAcquired()) {
    return inFlightResult(request.tenantId, TransactionLog::OperationType::PAYMENT,
                          request.referenceId);
  }
  existing =
      store_.findActiveByReference(request.tenantId, request.referenceId, LedgerStore::EntryType::CASH_IN);
  if (existing) {
    return duplicateOf(*existing);
  }

  OperationResult recovered;
  if (recoverCashIn(request, recovered)) {
    return recovered;
  }

  if (!cashInLimiter_.tryAcquire(request.tenantId)) {
    log().warning << "Cash-in rate limit reached for tenant " << request.tenantId;
    return makeFailure(err::E_RATE_LIMITED, "Too many cash-in requests, try again later");
  }

  TransactionLog::Record row;
  row.tenantId = request.tenantId;
  row.correlationId = "ci_" + utl::randomHex(12);
  row.operationType = TransactionLog::OperationType::PAYMENT;
  row.referenceId = request.referenceId;
  row.amount = request.amount;
  row.requestPayload["amount"] = money::format(request.amount);
  row.requestPayload["paymentMethod"] = IGateway::toString(request.method);
  row.requestPayload["payer"] = { { "name", request.payer.name }, { "email", request.payer.email } };
  row.requestPayload["description"] = request.description;
  row.requestPayload["metadata"] = request.metadata;

  auto recorded = txLog_.record(row);
  if (!recorded) {
    log().error << "Failed to log cash-in " << row.correlationId << ": "
                << recorded.error().message;
    return makeFailure(err::E_STORAGE, "Failed to record transaction: " + recorded.error().message);
  }
  const std::string &correlationId = row.correlationId;

  IGateway::PaymentRequest payment;
  payment.accountId = accountId;
  payment.correlationId = correlationId;
  payment.amount = request.amount;
  payment.method = request.method;
  payment.payer = request.payer;
  payment.description = request.description;

  auto created = gateway_.createPayment(payment);

  auto lock = correlationLocks_.lock(correlationId);
  if (!created) {
    int32_t code = created.error().code;
    TransactionLog::Update update;
    update.isSuccessful = false;
    update.errorMessage = describe(code, created.error().message);
    auto logged = txLog_.update(correlationId, update);
    if (!logged) {
      log().error << "Failed to log gateway error for " << correlationId << ": "
                  << logged.error().message;
    }

    OperationResult result;
    result.transactionId = correlationId;
    result.amount = request.amount;
    result.errorCode = code;
    if (isDefiniteFailure(code)) {
      TransactionLog::Update failed;
      failed.gatewayStatus = IGateway::toString(IGateway::Status::FAILED);
      auto marked = txLog_.update(correlationId, failed);
      if (!marked) {
        log().error << "Failed to mark cash-in " << correlationId << " as failed: "
                    << marked.error().message;
      }
      result.status = "failed";
      result.message = created.error().message;
      log().warning << "Cash-in " << correlationId << " failed: " << created.error().message;
    } else {
      result.status = "pending";
      result.message = "Gateway did not answer in time; the payment outcome is unknown";
      log().warning << "Cash-in " << correlationId << " outcome unknown: "
                    << created.error().message;
    }
    return result;
  }

  const auto &paid = created.value();
  auto current = txLog_.find(correlationId);
  TransactionLog::Update update;
  update.gatewayTransactionId = paid.externalId;
  update.responsePayload = paid.raw;
  update.httpStatus = paid.httpStatus;
  setGatewayStatus(update, current ? current->gatewayStatus : std::string(), paid.status);
  update.isSuccessful = paid.status != IGateway::Status::FAILED;
  auto logged = txLog_.update(correlationId, update);
  if (!logged) {
    log().error << "Failed to log payment " << paid.externalId << " for " << correlationId
                << ": " << logged.error().message;
    OperationResult result = makeFailure(err::E_STORAGE, logged.error().message);
    result.status = "pending";
    result.transactionId = correlationId;
    result.externalTransactionId = paid.externalId;
    result.amount = request.amount;
    return result;
  }

  auto outcome = applyGatewayStatus(logged.value(), paid.status, paid.externalId);
  adoptOrphan(correlationId, paid.externalId);

  auto entry = store_.findByExternalId(paid.externalId);
  if (!entry && outcome.action == "failed") {
    OperationResult result = makeFailure(err::E_GATEWAY_REJECTED, "Payment was refused by the gateway");
    result.transactionId = correlationId;
    result.externalTransactionId = paid.externalId;
    result.amount = request.amount;
    return result;
  }
  if (!entry) {
    OperationResult result = makeFailure(
        err::E_STORAGE,
        "Payment created but its ledger entry could not be written; resubmit to rebuild it");
    result.status = "pending";
    result.transactionId = correlationId;
    result.externalTransactionId = paid.externalId;
    result.amount = request.amount;
    return result;
  }

  OperationResult result = fromEntry(*entry, "Payment created");
  if (!entry->isActive()) {
    result.errorCode = err::E_GATEWAY_REJECTED;
  }
  result.qrOrBarcode = paid.qrOrBarcode;
  result.expiresAt = paid.expiresAt;
  log().info << "Cash-in " << correlationId << " tenant=" << request.tenantId
             << " amount=" << money::format(request.amount) << " -> " << result.status;
  return result;
}

bool LedgerService::recoverCashIn(const CashInRequest &request, OperationResult &result) {
  auto prior = txLog_.findLatestByReference(request.tenantId, TransactionLog::OperationType::PAYMENT,
                                            request.referenceId);
  if (!prior || prior->gatewayStatus == "failed") {
    return false;
  }
  if (prior->gatewayTransactionId.empty()) {
    // The gateway may have created the payment; only its webhook can tell
    result.success = false;
    result.status = "pending";
    result.duplicate = true;
    result.errorCode = err::E_GATEWAY_TIMEOUT;
    result.transactionId = prior->correlationId;
    result.amount = prior->amount;
    result.message = "A previous attempt with this reference has an unknown outcome; "
                     "it settles when the gateway reports it";
    log().warning << "Cash-in reference " << request.referenceId << " (tenant "
                  << request.tenantId << ") resubmitted while " << prior->correlationId
                  << " is unresolved; no new payment issued";
    return true;
  }

  auto lock = correlationLocks_.lock(prior->correlationId);
  auto row = txLog_.find(prior->correlationId);
  if (!row) {
    return false;
  }
  const std::string gatewayId = row->gatewayTransactionId;

  auto existing = store_.findByExternalId(gatewayId);
  if (existing) {
    if (!existing->isActive()) {
      return false;
    }
    result = duplicateOf(*existing);
    return true;
  }

  IGateway::Status status = IGateway::Status::PENDING;
  parseStatus(row->gatewayStatus, status);
  applyGatewayStatus(row.value(), status, gatewayId);

  auto rebuilt = store_.findByExternalId(gatewayId);
  if (!rebuilt) {
    result = makeFailure(err::E_STORAGE, "Could not rebuild the ledger entry of payment " + gatewayId);
    result.status = "pending";
    result.transactionId = row->correlationId;
    result.externalTransactionId = gatewayId;
    result.amount = row->amount;
    return true;
  }

  log().warning << "Rebuilt cash-in entry " << rebuilt->id << " for reference "
                << request.referenceId << " from transaction log row " << row->correlationId;
  result = fromEntry(*rebuilt, "Recovered from a previous attempt");
  result.duplicate = true;
  return true;
}

// ---------------------------------------------------------------------------
// Cash-out
// ---------------------------------------------------------------------------

LedgerService::OperationResult LedgerService::processCashOut(const CashOutRequest &request) {
  if (request.tenantId == 0) {
    return makeFailure(err::E_INVALID_INPUT, "Tenant id is required");
  }
  if (request.referenceId.empty()) {
    return makeFailure(err::E_INVALID_INPUT, "Reference id is required");
  }
  if (request.amount <= 0) {
    return makeFailure(err::E_INVALID_INPUT, "Cash-out amount must be positive");
  }
  if (request.amount < config_.limits.minCashOutAmount) {
    return makeFailure(err::E_LIMIT_EXCEEDED, "Minimum cash-out amount is " +
                                                  money::format(config_.limits.minCashOutAmount));
  }
  auto amountCheck = checkAmount(request.amount);
  if (!amountCheck) {
    return makeFailure(amountCheck.error().code, amountCheck.error().message);
  }
  const auto &bank = request.bankAccount;
  if (bank.bank.empty() || bank.agency.empty() || bank.account.empty()) {
    return makeFailure(err::E_INVALID_INPUT, "Bank, agency and account are required");
  }

  auto accountResult = tenants_.resolve(request.tenantId);
  if (!accountResult) {
    return makeFailure(accountResult.error().code, accountResult.error().message);
  }
  const std::string accountId = accountResult.value();

  auto existing = store_.findActiveByReference(request.tenantId, request.referenceId,
                                               LedgerStore::EntryType::CASH_OUT);
  if (existing) {
    return duplicateOf(*existing);
  }

  InFlightGuard guard(*this, inFlightKey(request.tenantId, "cash_out", request.referenceId));
  if (!guard.isAcquired()) {
    return inFlightResult(request.tenantId, TransactionLog::OperationType::WITHDRAWAL,
                          request.referenceId);
  }
  existing = store_.findActiveByReference(request.tenantId, request.referenceId,
                                          LedgerStore::EntryType::CASH_OUT);
  if (existing) {
    return duplicateOf(*existing);
  }

  if (!cashOutLimiter_.tryAcquire(request.tenantId)) {
    log().warning << "Cash-out rate limit reached for tenant " << request.tenantId;
    return makeFailure(err::E_RATE_LIMITED, "Too many cash-out requests, try again later");
  }

  const std::string correlationId = "co_" + utl::randomHex(12);
  int64_t createdAt = now();

  Entry debit;
  debit.tenantId = request.tenantId;
  debit.type = LedgerStore::EntryType::CASH_OUT;
  debit.amount = -request.amount;
  debit.referenceId = request.referenceId;
  debit.correlationId = correlationId;
  debit.status = LedgerStore::EntryStatus::PENDING;
  debit.createdAt = createdAt;
  debit.metadata = request.metadata.is_object() ? request.metadata : nlohmann::json::object();
  debit.metadata["bankAccount"] = maskBankAccount(bank);
  if (!request.description.empty()) {
    debit.metadata["description"] = request.description;
  }

  LedgerStore::DebitPolicy policy;
  policy.dailyLimit = config_.limits.dailyCashOutLimit;
  policy.dayStart = utl::startOfUtcDay(createdAt);

  auto appended = store_.appendDebitIfCovered(debit, policy);
  if (!appended) {
    cashOutLimiter_.release(request.tenantId);
    int32_t code = appended.error().code;
    if (code == err::E_DUPLICATE_REFERENCE) {
      existing = store_.findActiveByReference(request.tenantId, request.referenceId,
                                              LedgerStore::EntryType::CASH_OUT);
      if (existing) {
        return duplicateOf(*existing);
      }
    }
    log().info << "Cash-out refused for tenant " << request.tenantId << ": "
               << appended.error().message;
    OperationResult result = makeFailure(code, appended.error().message);
    result.amount = request.amount;
    return result;
  }
  const std::string entryId = appended.value();

  TransactionLog::Record row;
  row.tenantId = request.tenantId;
  row.correlationId = correlationId;
  row.operationType = TransactionLog::OperationType::WITHDRAWAL;
  row.referenceId = request.referenceId;
  row.amount = request.amount;
  row.requestPayload["amount"] = money::format(request.amount);
  row.requestPayload["bankAccount"] = maskBankAccount(bank);
  row.requestPayload["description"] = request.description;

  auto recorded = txLog_.record(row);
  if (!recorded) {
    log().error << "Failed to log cash-out " << correlationId << ": " << recorded.error().message;
    auto released = reversePending(entryId, "Transaction log unavailable");
    if (!released) {
      log().error << "Failed to release entry " << entryId << ": " << released.error().message;
    }
    return makeFailure(err::E_STORAGE, "Failed to record transaction: " + recorded.error().message);
  }

  IGateway::WithdrawalRequest withdrawal;
  withdrawal.accountId = accountId;
  withdrawal.correlationId = correlationId;
  withdrawal.amount = request.amount;
  withdrawal.bankAccount = bank;
  withdrawal.description = request.description;

  auto sent = gateway_.createWithdrawal(withdrawal);

  auto lock = correlationLocks_.lock(correlationId);
  if (!sent) {
    int32_t code = sent.error().code;
    TransactionLog::Update update;
    update.isSuccessful = false;
    update.errorMessage = describe(code, sent.error().message);
    auto logged = txLog_.update(correlationId, update);
    if (!logged) {
      log().error << "Failed to log gateway error for " << correlationId << ": "
                  << logged.error().message;
    }

    OperationResult result;
    result.transactionId = correlationId;
    result.entryId = entryId;
    result.amount = request.amount;
    result.errorCode = code;
    if (isDefiniteFailure(code)) {
      auto released = reversePending(entryId, describe(code, sent.error().message));
      if (!released) {
        log().error << "Failed to release entry " << entryId << ": " << released.error().message;
      }
      result.status = "failed";
      result.message = sent.error().message;
      log().warning << "Cash-out " << correlationId << " failed: " << sent.error().message;
    } else {
      result.status = "pending";
      result.message =
          "Gateway did not confirm the withdrawal; the outcome is unknown and the funds stay reserved";
      audit().warning << "Outcome of withdrawal " << correlationId << " is unknown ("
                      << sent.error().message << "); entry " << entryId
                      << " stays pending until refreshed";
    }
    return result;
  }

  const auto &withdrawn = sent.value();
  auto current = txLog_.find(correlationId);
  TransactionLog::Update update;
  update.gatewayTransactionId = withdrawn.externalId;
  update.responsePayload = withdrawn.raw;
  update.httpStatus = withdrawn.httpStatus;
  setGatewayStatus(update, current ? current->gatewayStatus : std::string(), withdrawn.status);
  update.fee = withdrawn.fee;
  update.netAmount = request.amount - withdrawn.fee;
  update.isSuccessful = withdrawn.status != IGateway::Status::FAILED;
  auto logged = txLog_.update(correlationId, update);
  if (!logged) {
    log().error << "Failed to log withdrawal " << withdrawn.externalId << " for "
                << correlationId << ": " << logged.error().message;
  } else {
    applyGatewayStatus(logged.value(), withdrawn.status, withdrawn.externalId);
    adoptOrphan(correlationId, withdrawn.externalId);
  }

  auto entry = store_.getEntry(entryId);
  if (!entry) {
    return makeFailure(entry.error().code, entry.error().message);
  }
  OperationResult result = fromEntry(*entry, "Withdrawal accepted");
  result.fee = withdrawn.fee;
  if (!entry->isActive()) {
    result.errorCode = err::E_GATEWAY_REJECTED;
    result.message = "Withdrawal was refused by the gateway";
  }
  log().info << "Cash-out " << correlationId << " tenant=" << request.tenantId
             << " amount=" << money::format(request.amount) << " -> " << result.status;
  return result;
}

// ---------------------------------------------------------------------------
// Adjustments and operator actions
// ---------------------------------------------------------------------------

LedgerService::OperationResult LedgerService::postAdjustment(const AdjustmentRequest &request) {
  if (request.tenantId == 0) {
    return makeFailure(err::E_INVALID_INPUT, "Tenant id is required");
  }
  if (request.referenceId.empty()) {
    return makeFailure(err::E_INVALID_INPUT, "Reference id is required");
  }
  if (request.reason.empty()) {
    return makeFailure(err::E_INVALID_INPUT, "Adjustments require a reason");
  }
  auto amountCheck = checkAmount(request.amount);
  if (!amountCheck) {
    return makeFailure(amountCheck.error().code, amountCheck.error().message);
  }
  auto accountResult = tenants_.resolve(request.tenantId);
  if (!accountResult) {
    return makeFailure(accountResult.error().code, accountResult.error().message);
  }

  auto existing = store_.findActiveByReference(request.tenantId, request.referenceId,
                                               LedgerStore::EntryType::ADJUSTMENT);
  if (existing) {
    return duplicateOf(*existing);
  }

  Entry adjustment;
  adjustment.tenantId = request.tenantId;
  adjustment.type = LedgerStore::EntryType::ADJUSTMENT;
  adjustment.amount = request.amount;
  adjustment.referenceId = request.referenceId;
  adjustment.correlationId = "adj_" + utl::randomHex(12);
  adjustment.status = LedgerStore::EntryStatus::CONFIRMED;
  adjustment.createdAt = now();
  adjustment.metadata["reason"] = request.reason;

  auto appended = request.amount < 0
                      ? store_.appendDebitIfCovered(adjustment, LedgerStore::DebitPolicy())
                      : store_.append(adjustment);
  if (!appended) {
    if (appended.error().code == err::E_DUPLICATE_REFERENCE) {
      existing = store_.findActiveByReference(request.tenantId, request.referenceId,
                                              LedgerStore::EntryType::ADJUSTMENT);
      if (existing) {
        return duplicateOf(*existing);
      }
    }
    return makeFailure(appended.error().code, appended.error().message);
  }

  audit().warning << "Manual adjustment " << appended.value() << " tenant=" << request.tenantId
                  << " amount=" << money::format(request.amount)
                  << " reference=" << request.referenceId << " reason=" << request.reason;

  auto entry = store_.getEntry(appended.value());
  if (!entry) {
    return makeFailure(entry.error().code, entry.error().message);
  }
  return fromEntry(*entry, "Adjustment posted");
}

LedgerService::Roe<LedgerService::Entry> LedgerService::reverseEntry(const std::string &entryId,
                                                                     const std::string &reason) {
  if (reason.empty()) {
    return Error(err::E_INVALID_INPUT, "Reversals require a reason");
  }
  auto entry = store_.getEntry(entryId);
  if (!entry) {
    return Error(entry.error().code, entry.error().message);
  }

  auto lock = correlationLocks_.lock(entry->correlationId.empty() ? entry->id
                                                                  : entry->correlationId);
  auto reversal = store_.reverse(entryId, reason);
  if (!reversal) {
    return Error(reversal.error().code, reversal.error().message);
  }
  audit().warning << "Reversed entry " << entryId << " (" << LedgerStore::toString(entry->type)
                  << " " << money::format(entry->amount) << ", tenant " << entry->tenantId
                  << ") with " << reversal->id << ": " << reason;
  return reversal.value();
}

LedgerService::Roe<LedgerService::Entry> LedgerService::refreshStatus(const std::string &entryId) {
  auto entry = store_.getEntry(entryId);
  if (!entry) {
    return Error(entry.error().code, entry.error().message);
  }
  if (entry->status != LedgerStore::EntryStatus::PENDING) {
    return entry.value();
  }

  std::string gatewayId = entry->externalTransactionId;
  auto row = txLog_.find(entry->correlationId);
  if (gatewayId.empty() && row) {
    gatewayId = row->gatewayTransactionId;
  }
  if (gatewayId.empty()) {
    return Error(err::E_NOT_FOUND, "Entry " + entryId + " has no gateway transaction id to query");
  }
  if (!row) {
    return Error(err::E_NOT_FOUND, "No transaction log row for entry " + entryId);
  }

  auto status = retryTransient(config_.retry, sleeper_,
                               [&]() { return gateway_.getStatus(gatewayId); });
  if (!status) {
    log().warning << "Status refresh of " << gatewayId << " failed: " << status.error().message;
    return Error(status.error().code, status.error().message);
  }

  auto lock = correlationLocks_.lock(entry->correlationId);
  auto current = txLog_.find(entry->correlationId);
  if (!current) {
    return Error(current.error().code, current.error().message);
  }

  TransactionLog::Update update;
  update.gatewayTransactionId = gatewayId;
  setGatewayStatus(update, current->gatewayStatus, status.value());
  if (status.value() == IGateway::Status::COMPLETED) {
    update.isSuccessful = true;
  }
  auto updated = txLog_.update(entry->correlationId, update);
  if (!updated) {
    return Error(updated.error().code, updated.error().message);
  }
  auto outcome = applyGatewayStatus(updated.value(), status.value(), gatewayId);
  log().info << "Refreshed entry " << entryId << " from gateway status "
             << IGateway::toString(status.value()) << ": " << outcome.action;

  auto refreshed = store_.getEntry(entryId);
  if (!refreshed) {
    return Error(refreshed.error().code, refreshed.error().message);
  }
  return refreshed.value();
}

LedgerService::SweepReport LedgerService::sweepPending(uint64_t tenantId) {
  SweepReport report;
  report.tenantId = tenantId;
  int64_t sweepTime = now();

  for (const auto &entry : store_.listPending(tenantId)) {
    ++report.checked;
    bool stillPending = true;
    auto refreshed = refreshStatus(entry.id);
    if (refreshed) {
      if (refreshed->status == LedgerStore::EntryStatus::CONFIRMED) {
        ++report.confirmed;
        stillPending = false;
      } else if (refreshed->status != LedgerStore::EntryStatus::PENDING) {
        ++report.failed;
        stillPending = false;
      }
    } else if (refreshed.error().code != err::E_NOT_FOUND) {
      ++report.errors;
    }

    if (stillPending && sweepTime - entry.createdAt > config_.limits.maxPendingAgeSec) {
      report.staleEntryIds.push_back(entry.id);
      audit().warning << "Entry " << entry.id << " of tenant " << tenantId << " pending for "
                      << (sweepTime - entry.createdAt) << "s, escalated to reconciliation";
    }
  }

  if (report.checked > 0) {
    log().info << "Swept tenant " << tenantId << ": " << report.checked << " pending, "
               << report.confirmed << " confirmed, " << report.failed << " failed, "
               << report.staleEntryIds.size() << " stale";
  }
  return report;
}

LedgerService::Roe<LedgerService::Balance> LedgerService::getBalance(uint64_t tenantId) const {
  auto account = tenants_.get(tenantId);
  if (!account) {
    return Error(account.error().code, account.error().message);
  }
  Balance balance;
  balance.tenantId = tenantId;
  balance.confirmed = store_.getBalance(tenantId);
  balance.available = store_.getAvailableBalance(tenantId);
  return balance;
}

size_t LedgerService::pruneRateLimits() {
  return cashInLimiter_.prune() + cashOutLimiter_.prune();
}

// ---------------------------------------------------------------------------
// Webhooks and status application
// ---------------------------------------------------------------------------

LedgerService::Roe<LedgerService::WebhookOutcome>
LedgerService::handleWebhook(const std::string &payload, const std::string &signature) {
  if (!gateway_.verifyWebhookSignature(payload, signature)) {
    audit().warning << "Rejected webhook with invalid signature (" << payload.size()
                    << " bytes, sha256 " << utl::sha256(payload) << ")";
    return Error(err::E_INVALID_WEBHOOK_SIGNATURE, "Invalid webhook signature");
  }

  auto parsed = gateway_.parseWebhook(payload);
  if (!parsed) {
    audit().warning << "Rejected malformed webhook: " << parsed.error().message;
    return Error(parsed.error().code, parsed.error().message);
  }
  const auto &event = parsed.value();
  const std::string payloadHash = utl::sha256(payload);

  std::string correlationId;
  auto byGateway = txLog_.findByGatewayId(event.gatewayTransactionId);
  if (byGateway && byGateway->operationType != TransactionLog::OperationType::WEBHOOK) {
    correlationId = byGateway->correlationId;
  } else if (!event.correlationId.empty()) {
    auto byCorrelation = txLog_.find(event.correlationId);
    if (byCorrelation && byCorrelation->operationType != TransactionLog::OperationType::WEBHOOK) {
      correlationId = event.correlationId;
    }
  }
  if (correlationId.empty()) {
    return recordOrphan(event, payloadHash);
  }

  auto lock = correlationLocks_.lock(correlationId);
  auto row = txLog_.find(correlationId);
  if (!row) {
    return Error(row.error().code, row.error().message);
  }

  WebhookOutcome outcome;
  outcome.correlationId = correlationId;
  outcome.gatewayTransactionId = event.gatewayTransactionId;

  if (row->webhookPayloadHash == payloadHash) {
    outcome.action = "duplicate";
    log().info << "Duplicate webhook for " << event.gatewayTransactionId << " ignored";
    return outcome;
  }
  if (!row->gatewayTransactionId.empty() &&
      row->gatewayTransactionId != event.gatewayTransactionId) {
    audit().warning << "Webhook for " << event.gatewayTransactionId << " names correlation id "
                    << correlationId << " which belongs to " << row->gatewayTransactionId;
    outcome.action = "conflict";
    return outcome;
  }

  TransactionLog::Update update;
  update.gatewayTransactionId = event.gatewayTransactionId;
  setGatewayStatus(update, row->gatewayStatus, event.status);
  update.webhookReceived = true;
  update.webhookTimestamp = event.occurredAt != 0 ? event.occurredAt : now();
  update.webhookPayloadHash = payloadHash;
  update.responsePayload = nlohmann::json{ { "webhook", event.raw } };
  if (event.status == IGateway::Status::COMPLETED) {
    update.isSuccessful = true;
  } else if (event.status == IGateway::Status::FAILED) {
    update.isSuccessful = false;
    update.errorMessage = "Gateway reported " + event.providerStatus;
  }

  auto updated = txLog_.update(correlationId, update);
  if (!updated) {
    return Error(updated.error().code, updated.error().message);
  }

  auto applied = applyGatewayStatus(updated.value(), event.status, event.gatewayTransactionId);
  outcome.action = applied.action;
  outcome.entryId = applied.entryId;
  log().info << "Webhook " << event.gatewayTransactionId << " (" << event.providerStatus
             << ") for " << correlationId << ": " << outcome.action;
  return outcome;
}

LedgerService::Roe<LedgerService::WebhookOutcome>
LedgerService::recordOrphan(const IGateway::WebhookEvent &event, const std::string &payloadHash) {
  const std::string correlationId = ORPHAN_PREFIX + event.gatewayTransactionId;
  auto lock = correlationLocks_.lock(correlationId);

  WebhookOutcome outcome;
  outcome.correlationId = correlationId;
  outcome.gatewayTransactionId = event.gatewayTransactionId;

  int64_t receivedAt = event.occurredAt != 0 ? event.occurredAt : now();
  auto existing = txLog_.find(correlationId);
  if (existing) {
    if (existing->webhookPayloadHash == payloadHash) {
      outcome.action = "duplicate";
      return outcome;
    }
    TransactionLog::Update update;
    setGatewayStatus(update, existing->gatewayStatus, event.status);
    update.webhookTimestamp = receivedAt;
    update.webhookPayloadHash = payloadHash;
    update.responsePayload = nlohmann::json{ { "webhook", event.raw } };
    auto updated = txLog_.update(correlationId, update);
    if (!updated) {
      return Error(updated.error().code, updated.error().message);
    }
  } else {
    TransactionLog::Record row;
    row.tenantId = 0;
    row.correlationId = correlationId;
    row.operationType = TransactionLog::OperationType::WEBHOOK;
    row.referenceId = event.correlationId;
    row.amount = event.amount;
    row.gatewayStatus = IGateway::toString(event.status);
    row.isSuccessful = event.status == IGateway::Status::COMPLETED;
    row.webhookReceived = true;
    row.webhookTimestamp = receivedAt;
    row.webhookPayloadHash = payloadHash;
    row.responsePayload["webhook"] = event.raw;
    row.responsePayload["gatewayTransactionId"] = event.gatewayTransactionId;
    auto recorded = txLog_.record(row);
    if (!recorded) {
      return Error(recorded.error().code, recorded.error().message);
    }
  }

  audit().warning << "Orphan webhook for gateway transaction " << event.gatewayTransactionId
                  << " (status " << event.providerStatus << ", amount "
                  << money::format(event.amount) << ")";
  outcome.action = "orphan";
  return outcome;
}

void LedgerService::adoptOrphan(const std::string &correlationId,
                                const std::string &gatewayTransactionId) {
  auto orphan = txLog_.find(ORPHAN_PREFIX + gatewayTransactionId);
  if (!orphan || orphan->responsePayload.contains("adoptedBy")) {
    return;
  }
  IGateway::Status status = IGateway::Status::PENDING;
  if (!parseStatus(orphan->gatewayStatus, status)) {
    return;
  }

  auto row = txLog_.find(correlationId);
  if (!row) {
    return;
  }
  TransactionLog::Update update;
  setGatewayStatus(update, row->gatewayStatus, status);
  update.webhookReceived = true;
  update.webhookTimestamp = orphan->webhookTimestamp;
  update.webhookPayloadHash = orphan->webhookPayloadHash;
  if (status == IGateway::Status::COMPLETED) {
    update.isSuccessful = true;
  }
  auto updated = txLog_.update(correlationId, update);
  if (!updated) {
    log().error << "Failed to adopt early webhook for " << gatewayTransactionId << ": "
                << updated.error().message;
    return;
  }

  TransactionLog::Update mark;
  mark.responsePayload = nlohmann::json{ { "adoptedBy", correlationId } };
  auto marked = txLog_.update(orphan->correlationId, mark);
  if (!marked) {
    log().error << "Failed to mark orphan " << orphan->correlationId << ": "
                << marked.error().message;
  }

  auto outcome = applyGatewayStatus(updated.value(), status, gatewayTransactionId);
  log().info << "Applied early webhook for " << gatewayTransactionId << " to " << correlationId
             << ": " << outcome.action;
}

LedgerService::Roe<LedgerService::Entry>
LedgerService::findEntryFor(const TransactionLog::Record &row,
                            const std::string &gatewayTransactionId) const {
  if (!gatewayTransactionId.empty()) {
    auto byExternal = store_.findByExternalId(gatewayTransactionId);
    if (byExternal) {
      return byExternal.value();
    }
  }
  auto type = row.operationType == TransactionLog::OperationType::WITHDRAWAL
                  ? LedgerStore::EntryType::CASH_OUT
                  : LedgerStore::EntryType::CASH_IN;
  auto byReference = store_.findActiveByReference(row.tenantId, row.referenceId, type);
  if (byReference && byReference->correlationId == row.correlationId) {
    return byReference.value();
  }
  return Error(err::E_NOT_FOUND, "No ledger entry for " + row.correlationId);
}

LedgerService::Roe<LedgerService::Entry>
LedgerService::materializeCashIn(const TransactionLog::Record &row,
                                 const std::string &gatewayTransactionId) {
  Entry credit;
  credit.tenantId = row.tenantId;
  credit.type = LedgerStore::EntryType::CASH_IN;
  credit.amount = row.amount;
  credit.referenceId = row.referenceId;
  credit.externalTransactionId = gatewayTransactionId;
  credit.correlationId = row.correlationId;
  credit.status = LedgerStore::EntryStatus::PENDING;
  credit.createdAt = now();
  if (row.requestPayload.contains("metadata") && row.requestPayload["metadata"].is_object()) {
    credit.metadata = row.requestPayload["metadata"];
  }
  if (row.requestPayload.contains("paymentMethod")) {
    credit.metadata["paymentMethod"] = row.requestPayload["paymentMethod"];
  }

  auto appended = store_.append(credit);
  if (!appended) {
    return Error(appended.error().code, appended.error().message);
  }
  auto entry = store_.getEntry(appended.value());
  if (!entry) {
    return Error(entry.error().code, entry.error().message);
  }
  return entry.value();
}

// The withdrawal fee is taken out of the withdrawn amount, so the cash-out
// debit already covers it.
LedgerService::Roe<LedgerService::Entry>
LedgerService::confirmEntry(const Entry &entry, const std::string &gatewayTransactionId) {
  auto confirmed = store_.markConfirmed(entry.id, gatewayTransactionId);
  if (!confirmed) {
    return Error(confirmed.error().code, confirmed.error().message);
  }
  log().info << "Confirmed " << LedgerStore::toString(entry.type) << " entry " << entry.id
             << " (" << gatewayTransactionId << ")";
  return confirmed.value();
}

LedgerService::Roe<LedgerService::Entry>
LedgerService::reversePending(const std::string &entryId, const std::string &reason) {
  auto reversal = store_.reverse(entryId, reason);
  if (!reversal) {
    return Error(reversal.error().code, reversal.error().message);
  }
  audit().warning << "Reversed pending entry " << entryId << " with " << reversal->id << ": "
                  << reason;
  return reversal.value();
}

LedgerService::Outcome LedgerService::applyGatewayStatus(const TransactionLog::Record &row,
                                                         IGateway::Status status,
                                                         const std::string &gatewayTransactionId) {
  IGateway::Status recorded = IGateway::Status::PENDING;
  if (status == IGateway::Status::PENDING && isTerminal(row.gatewayStatus) &&
      parseStatus(row.gatewayStatus, recorded)) {
    status = recorded;
  }

  Outcome outcome;
  auto found = findEntryFor(row, gatewayTransactionId);
  if (!found) {
    if (status == IGateway::Status::FAILED) {
      outcome.action = "failed";
      return outcome;
    }
    if (row.operationType != TransactionLog::OperationType::PAYMENT) {
      if (status == IGateway::Status::COMPLETED) {
        audit().critical << "Gateway reports " << gatewayTransactionId << " completed but "
                         << row.correlationId << " has no ledger entry";
      }
      outcome.action = "ignored";
      return outcome;
    }
    found = materializeCashIn(row, gatewayTransactionId);
    if (!found) {
      audit().critical << "Gateway transaction " << gatewayTransactionId << " ("
                       << IGateway::toString(status) << ", " << money::format(row.amount)
                       << ") of " << row.correlationId << " has no ledger entry: "
                       << found.error().message;
      outcome.action = "ignored";
      return outcome;
    }
  }

  const Entry entry = found.value();
  outcome.entryId = entry.id;

  switch (status) {
  case IGateway::Status::COMPLETED:
    if (entry.status == LedgerStore::EntryStatus::PENDING) {
      auto confirmed = confirmEntry(entry, gatewayTransactionId);
      if (!confirmed) {
        log().error << "Cannot confirm entry " << entry.id << ": " << confirmed.error().message;
        outcome.action = "ignored";
      } else {
        outcome.action = "confirmed";
      }
    } else if (entry.status == LedgerStore::EntryStatus::CONFIRMED) {
      outcome.action = "confirmed";
    } else {
      audit().critical << "Gateway reports " << gatewayTransactionId << " completed but entry "
                       << entry.id << " is " << LedgerStore::toString(entry.status);
      outcome.action = "conflict";
    }
    break;

  case IGateway::Status::FAILED:
    if (entry.status == LedgerStore::EntryStatus::PENDING) {
      auto failed = reversePending(entry.id, "Gateway reported failure (" +
                                                 row.gatewayStatus + ")");
      if (!failed) {
        log().error << "Cannot fail entry " << entry.id << ": " << failed.error().message;
        outcome.action = "ignored";
      } else {
        log().warning << "Entry " << entry.id << " failed at the gateway (" << gatewayTransactionId
                      << ")";
        outcome.action = "failed";
      }
    } else if (entry.status == LedgerStore::EntryStatus::CONFIRMED) {
      audit().critical << "Gateway reports " << gatewayTransactionId << " failed but entry "
                       << entry.id << " is confirmed";
      outcome.action = "conflict";
    } else {
      outcome.action = "failed";
    }
    break;

  default:
    if (entry.status == LedgerStore::EntryStatus::PENDING &&
        entry.externalTransactionId.empty() && !gatewayTransactionId.empty()) {
      auto assigned = store_.assignExternalId(entry.id, gatewayTransactionId);
      if (!assigned) {
        log().error << "Cannot assign " << gatewayTransactionId << " to entry " << entry.id
                    << ": " << assigned.error().message;
      }
    }
    outcome.action = "pending";
    break;
  }
  return outcome;
}

} // namespace pl
