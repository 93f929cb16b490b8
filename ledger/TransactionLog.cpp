#include "TransactionLog.h"
#include "ErrorCodes.h"
#include "Utilities.h"

#include <filesystem>

namespace pl {

const char *TransactionLog::toString(OperationType type) {
  switch (type) {
  case OperationType::PAYMENT:
    return "payment";
  case OperationType::WITHDRAWAL:
    return "withdrawal";
  case OperationType::WEBHOOK:
    return "webhook";
  case OperationType::BALANCE_CHECK:
    return "balance_check";
  default:
    return "unknown";
  }
}

bool TransactionLog::parseOperationType(const std::string &str, OperationType &type) {
  static const OperationType all[] = { OperationType::PAYMENT, OperationType::WITHDRAWAL,
                                       OperationType::WEBHOOK, OperationType::BALANCE_CHECK };
  for (auto candidate : all) {
    if (str == toString(candidate)) {
      type = candidate;
      return true;
    }
  }
  return false;
}

nlohmann::json TransactionLog::Record::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["tenantId"] = tenantId;
  j["correlationId"] = correlationId;
  j["gatewayTransactionId"] =
      gatewayTransactionId.empty() ? nlohmann::json() : nlohmann::json(gatewayTransactionId);
  j["operationType"] = toString(operationType);
  j["referenceId"] = referenceId;
  j["amount"] = money::format(amount);
  j["requestPayload"] = requestPayload;
  j["responsePayload"] = responsePayload;
  j["httpStatus"] = httpStatus;
  j["gatewayStatus"] = gatewayStatus;
  j["fee"] = money::format(fee);
  j["netAmount"] = money::format(netAmount);
  j["isSuccessful"] = isSuccessful;
  j["errorMessage"] = errorMessage.empty() ? nlohmann::json() : nlohmann::json(errorMessage);
  j["webhookReceived"] = webhookReceived;
  j["webhookTimestamp"] =
      webhookTimestamp == 0 ? nlohmann::json() : nlohmann::json(webhookTimestamp);
  j["webhookPayloadHash"] =
      webhookPayloadHash.empty() ? nlohmann::json() : nlohmann::json(webhookPayloadHash);
  j["createdAt"] = createdAt;
  j["updatedAt"] = updatedAt;
  return j;
}

bool TransactionLog::Record::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return false;
  }
  try {
    auto optString = [&j](const char *key) {
      auto it = j.find(key);
      return it == j.end() || it->is_null() ? std::string() : it->get<std::string>();
    };

    id = j.at("id").get<std::string>();
    tenantId = j.at("tenantId").get<uint64_t>();
    correlationId = j.at("correlationId").get<std::string>();
    if (!parseOperationType(j.at("operationType").get<std::string>(), operationType) ||
        !money::fromJson(j.at("amount"), amount) || !money::fromJson(j.at("fee"), fee) ||
        !money::fromJson(j.at("netAmount"), netAmount)) {
      return false;
    }
    gatewayTransactionId = optString("gatewayTransactionId");
    referenceId = optString("referenceId");
    requestPayload = j.value("requestPayload", nlohmann::json::object());
    responsePayload = j.value("responsePayload", nlohmann::json::object());
    httpStatus = j.value("httpStatus", int32_t(0));
    gatewayStatus = optString("gatewayStatus");
    isSuccessful = j.value("isSuccessful", false);
    errorMessage = optString("errorMessage");
    webhookReceived = j.value("webhookReceived", false);
    auto it = j.find("webhookTimestamp");
    webhookTimestamp = it == j.end() || it->is_null() ? 0 : it->get<int64_t>();
    webhookPayloadHash = optString("webhookPayloadHash");
    createdAt = j.value("createdAt", int64_t(0));
    updatedAt = j.value("updatedAt", int64_t(0));
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return !correlationId.empty();
}

TransactionLog::TransactionLog() : Module("ledger.txlog") {}

TransactionLog::Roe<void> TransactionLog::init(const InitConfig &config) {
  if (config.workDir.empty()) {
    log().info << "Transaction log running in memory only";
    return {};
  }

  auto path = (std::filesystem::path(config.workDir) / "txlog.journal").string();
  upJournal_ = std::make_unique<JournalFile>("ledger.txlog.journal");
  auto openResult = upJournal_->open(path);
  if (!openResult) {
    upJournal_.reset();
    return Error(err::E_STORAGE, "Failed to open transaction log journal: " +
                                     openResult.error().message);
  }

  auto replayResult = replayJournal();
  if (!replayResult) {
    upJournal_.reset();
    return replayResult.error();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  log().info << "Transaction log loaded " << rows_.size() << " rows from " << path;
  return {};
}

TransactionLog::Roe<void> TransactionLog::replayJournal() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = upJournal_->replay([this](const std::string &data) -> JournalFile::Roe<void> {
    Record row;
    try {
      if (!row.fromJson(nlohmann::json::parse(data))) {
        return JournalFile::Error(err::E_STORAGE, "Invalid transaction log row");
      }
    } catch (const nlohmann::json::parse_error &e) {
      return JournalFile::Error(err::E_STORAGE, std::string("Invalid JSON: ") + e.what());
    }
    index(row);
    return {};
  });
  if (!result) {
    return Error(err::E_STORAGE,
                 "Failed to replay transaction log journal: " + result.error().message);
  }
  return {};
}

std::string TransactionLog::referenceKey(uint64_t tenantId, OperationType type,
                                         const std::string &referenceId) {
  return std::to_string(tenantId) + ":" + toString(type) + ":" + referenceId;
}

TransactionLog::Roe<void> TransactionLog::journal(const Record &row) {
  if (!upJournal_) {
    return {};
  }
  auto result = upJournal_->append(row.toJson().dump());
  if (!result) {
    log().error << "Journal write failed: " << result.error().message;
    return Error(err::E_STORAGE, "Failed to persist transaction log row: " +
                                     result.error().message);
  }
  return {};
}

void TransactionLog::index(const Record &row) {
  auto it = rows_.find(row.correlationId);
  if (it == rows_.end()) {
    order_.push_back(row.correlationId);
    if (!row.referenceId.empty()) {
      referenceIndex_[referenceKey(row.tenantId, row.operationType, row.referenceId)]
          .push_back(row.correlationId);
    }
  }
  rows_[row.correlationId] = row;
  if (!row.gatewayTransactionId.empty()) {
    gatewayIndex_[row.gatewayTransactionId] = row.correlationId;
  }
}

TransactionLog::Roe<std::string> TransactionLog::record(const Record &row) {
  if (row.correlationId.empty()) {
    return Error(err::E_INVALID_INPUT, "Transaction log row requires a correlation id");
  }

  Record stored = row;
  stored.id = "tl_" + utl::randomHex(12);
  stored.createdAt = utl::getCurrentTime();
  stored.updatedAt = stored.createdAt;

  std::lock_guard<std::mutex> lock(mutex_);
  if (rows_.count(stored.correlationId) > 0) {
    return Error(err::E_DUPLICATE_REFERENCE,
                 "Correlation id already recorded: " + stored.correlationId);
  }
  if (!stored.gatewayTransactionId.empty() &&
      gatewayIndex_.count(stored.gatewayTransactionId) > 0) {
    return Error(err::E_DUPLICATE_REFERENCE,
                 "Gateway transaction id already recorded: " + stored.gatewayTransactionId);
  }

  auto result = journal(stored);
  if (!result) {
    return result.error();
  }
  index(stored);

  log().debug << "Recorded " << toString(stored.operationType) << " row "
              << stored.correlationId << " tenant=" << stored.tenantId;
  return stored.id;
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::applyUpdate(const std::string &correlationId, const Update &partial) {
  auto it = rows_.find(correlationId);
  if (it == rows_.end()) {
    return Error(err::E_NOT_FOUND, "No transaction log row for " + correlationId);
  }
  const Record &current = it->second;

  if (partial.webhookPayloadHash && !partial.webhookPayloadHash->empty() &&
      *partial.webhookPayloadHash == current.webhookPayloadHash) {
    log().debug << "Webhook payload already applied to " << correlationId;
    return current;
  }

  Record merged = current;

  if (partial.gatewayTransactionId && !partial.gatewayTransactionId->empty()) {
    const std::string &gatewayId = *partial.gatewayTransactionId;
    if (!merged.gatewayTransactionId.empty() && merged.gatewayTransactionId != gatewayId) {
      return Error(err::E_INVALID_STATE_TRANSITION,
                   "Row " + correlationId + " is bound to gateway id " +
                       merged.gatewayTransactionId);
    }
    auto gwIt = gatewayIndex_.find(gatewayId);
    if (gwIt != gatewayIndex_.end() && gwIt->second != correlationId) {
      return Error(err::E_DUPLICATE_REFERENCE,
                   "Gateway transaction id " + gatewayId + " belongs to " + gwIt->second);
    }
    merged.gatewayTransactionId = gatewayId;
  }
  if (partial.responsePayload) {
    if (!merged.responsePayload.is_object()) {
      merged.responsePayload = nlohmann::json{ { "previous", merged.responsePayload } };
    }
    if (partial.responsePayload->is_object()) {
      merged.responsePayload.update(*partial.responsePayload);
    } else {
      merged.responsePayload["value"] = *partial.responsePayload;
    }
  }
  if (partial.httpStatus) {
    merged.httpStatus = *partial.httpStatus;
  }
  if (partial.gatewayStatus) {
    merged.gatewayStatus = *partial.gatewayStatus;
  }
  if (partial.fee) {
    merged.fee = *partial.fee;
  }
  if (partial.netAmount) {
    merged.netAmount = *partial.netAmount;
  }
  if (partial.isSuccessful) {
    merged.isSuccessful = *partial.isSuccessful;
  }
  if (partial.errorMessage && !partial.errorMessage->empty()) {
    if (merged.errorMessage.empty()) {
      merged.errorMessage = *partial.errorMessage;
    } else if (merged.errorMessage.find(*partial.errorMessage) == std::string::npos) {
      merged.errorMessage += "; " + *partial.errorMessage;
    }
  }
  if (partial.webhookReceived) {
    merged.webhookReceived = merged.webhookReceived || *partial.webhookReceived;
  }
  if (partial.webhookTimestamp) {
    merged.webhookTimestamp = *partial.webhookTimestamp;
  }
  if (partial.webhookPayloadHash) {
    merged.webhookPayloadHash = *partial.webhookPayloadHash;
  }

  if (merged.toJson() == current.toJson()) {
    return current;
  }
  merged.updatedAt = utl::getCurrentTime();

  auto result = journal(merged);
  if (!result) {
    return result.error();
  }
  index(merged);
  return merged;
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::update(const std::string &correlationId, const Update &partial) {
  std::lock_guard<std::mutex> lock(mutex_);
  return applyUpdate(correlationId, partial);
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::updateByGatewayId(const std::string &gatewayTransactionId,
                                  const Update &partial) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gatewayIndex_.find(gatewayTransactionId);
  if (it == gatewayIndex_.end()) {
    return Error(err::E_NOT_FOUND, "No transaction log row for gateway id " +
                                       gatewayTransactionId);
  }
  std::string correlationId = it->second;
  return applyUpdate(correlationId, partial);
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::find(const std::string &correlationId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rows_.find(correlationId);
  if (it == rows_.end()) {
    return Error(err::E_NOT_FOUND, "No transaction log row for " + correlationId);
  }
  return it->second;
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::findByGatewayId(const std::string &gatewayTransactionId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gatewayIndex_.find(gatewayTransactionId);
  if (it == gatewayIndex_.end()) {
    return Error(err::E_NOT_FOUND, "No transaction log row for gateway id " +
                                       gatewayTransactionId);
  }
  return rows_.at(it->second);
}

TransactionLog::Roe<TransactionLog::Record>
TransactionLog::findLatestByReference(uint64_t tenantId, OperationType type,
                                      const std::string &referenceId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = referenceIndex_.find(referenceKey(tenantId, type, referenceId));
  if (it == referenceIndex_.end() || it->second.empty()) {
    return Error(err::E_NOT_FOUND, "No " + std::string(toString(type)) +
                                       " row for reference " + referenceId);
  }
  return rows_.at(it->second.back());
}

std::vector<TransactionLog::Record> TransactionLog::listByTenant(uint64_t tenantId,
                                                                 int64_t from,
                                                                 int64_t to) const {
  std::vector<Record> result;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &correlationId : order_) {
    const Record &row = rows_.at(correlationId);
    if (row.tenantId == tenantId && row.createdAt >= from && row.createdAt <= to) {
      result.push_back(row);
    }
  }
  return result;
}

std::vector<TransactionLog::Record> TransactionLog::listOrphans() const {
  std::vector<Record> result;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &correlationId : order_) {
    const Record &row = rows_.at(correlationId);
    if (row.operationType == OperationType::WEBHOOK) {
      result.push_back(row);
    }
  }
  return result;
}

} // namespace pl
