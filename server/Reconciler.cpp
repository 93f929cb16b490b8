#include "Reconciler.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "Utilities.h"

#include <filesystem>
#include <set>

namespace pl {

namespace {

logging::Logger &audit() { return logging::getAuditLogger(); }

Amount magnitude(Amount amount) { return amount < 0 ? -amount : amount; }

bool parseReportStatus(const std::string &str, Reconciler::ReportStatus &status) {
  if (str == "reconciled") {
    status = Reconciler::ReportStatus::RECONCILED;
  } else if (str == "discrepancy_found") {
    status = Reconciler::ReportStatus::DISCREPANCY_FOUND;
  } else if (str == "resolved") {
    status = Reconciler::ReportStatus::RESOLVED;
  } else {
    return false;
  }
  return true;
}

} // namespace

const char *Reconciler::toString(ReportStatus status) {
  switch (status) {
  case ReportStatus::DISCREPANCY_FOUND:
    return "discrepancy_found";
  case ReportStatus::RESOLVED:
    return "resolved";
  default:
    return "reconciled";
  }
}

nlohmann::json Reconciler::Discrepancy::toJson() const {
  nlohmann::json j;
  j["type"] = type;
  j["entryId"] = entryId.empty() ? nlohmann::json(nullptr) : nlohmann::json(entryId);
  j["externalId"] = externalId.empty() ? nlohmann::json(nullptr) : nlohmann::json(externalId);
  j["internalAmount"] = money::format(internalAmount);
  j["externalAmount"] = money::format(externalAmount);
  j["detail"] = detail;
  return j;
}

nlohmann::json Reconciler::Discrepancy::toRecord() const {
  return { { "type", type },
           { "entryId", entryId },
           { "externalId", externalId },
           { "internalAmount", internalAmount },
           { "externalAmount", externalAmount },
           { "detail", detail } };
}

bool Reconciler::Discrepancy::fromRecord(const nlohmann::json &j) {
  try {
    type = j.at("type").get<std::string>();
    entryId = j.value("entryId", "");
    externalId = j.value("externalId", "");
    internalAmount = j.value("internalAmount", Amount(0));
    externalAmount = j.value("externalAmount", Amount(0));
    detail = j.value("detail", "");
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return !type.empty();
}

nlohmann::json Reconciler::Report::toRecord() const {
  nlohmann::json j;
  j["id"] = id;
  j["tenantId"] = tenantId;
  j["from"] = from;
  j["to"] = to;
  j["internal"] = internal;
  j["external"] = external;
  j["difference"] = difference;
  j["transactionCount"] = transactionCount;
  j["discrepancies"] = nlohmann::json::array();
  for (const auto &discrepancy : discrepancies) {
    j["discrepancies"].push_back(discrepancy.toRecord());
  }
  j["status"] = Reconciler::toString(status);
  j["notes"] = notes;
  j["resolvedBy"] = resolvedBy;
  j["createdAt"] = createdAt;
  j["resolvedAt"] = resolvedAt;
  return j;
}

bool Reconciler::Report::fromRecord(const nlohmann::json &j) {
  try {
    id = j.at("id").get<std::string>();
    tenantId = j.at("tenantId").get<uint64_t>();
    from = j.at("from").get<int64_t>();
    to = j.at("to").get<int64_t>();
    internal = j.at("internal").get<Amount>();
    external = j.at("external").get<Amount>();
    difference = j.at("difference").get<Amount>();
    transactionCount = j.value("transactionCount", uint64_t(0));
    discrepancies.clear();
    for (const auto &jDiscrepancy : j.at("discrepancies")) {
      Discrepancy discrepancy;
      if (!discrepancy.fromRecord(jDiscrepancy)) {
        return false;
      }
      discrepancies.push_back(discrepancy);
    }
    if (!parseReportStatus(j.at("status").get<std::string>(), status)) {
      return false;
    }
    notes = j.value("notes", "");
    resolvedBy = j.value("resolvedBy", "");
    createdAt = j.value("createdAt", int64_t(0));
    resolvedAt = j.value("resolvedAt", int64_t(0));
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return !id.empty();
}

nlohmann::json Reconciler::Report::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["tenantId"] = tenantId;
  j["from"] = utl::formatIso8601(from);
  j["to"] = utl::formatIso8601(to);
  j["internal"] = money::format(internal);
  j["external"] = money::format(external);
  j["difference"] = money::format(difference);
  j["transactionCount"] = transactionCount;
  j["discrepancies"] = nlohmann::json::array();
  for (const auto &discrepancy : discrepancies) {
    j["discrepancies"].push_back(discrepancy.toJson());
  }
  j["status"] = Reconciler::toString(status);
  j["notes"] = notes;
  j["resolvedBy"] = resolvedBy.empty() ? nlohmann::json(nullptr) : nlohmann::json(resolvedBy);
  j["createdAt"] = utl::formatIso8601(createdAt);
  j["resolvedAt"] = resolvedAt == 0 ? nlohmann::json(nullptr)
                                    : nlohmann::json(utl::formatIso8601(resolvedAt));
  return j;
}

nlohmann::json Reconciler::SyncResult::toJson() const {
  nlohmann::json j;
  j["tenantId"] = tenantId;
  j["internal"] = money::format(internal);
  j["external"] = money::format(external);
  j["isReconciled"] = isReconciled;
  j["reportId"] = reportId.empty() ? nlohmann::json(nullptr) : nlohmann::json(reportId);
  return j;
}

Reconciler::Reconciler(LedgerStore &store, LedgerService &service, IGateway &gateway,
                       TenantDirectory &tenants, const Config &config)
    : Service("server.reconciler"), store_(store), service_(service), gateway_(gateway),
      tenants_(tenants), config_(config), clock_([] { return utl::getCurrentTime(); }),
      sleeper_(sleepFor) {}

Reconciler::~Reconciler() { stop(); }

Reconciler::Roe<void> Reconciler::init(const InitConfig &config) {
  if (config.workDir.empty()) {
    log().info << "Reconciliation reports kept in memory only";
    return {};
  }

  auto path = (std::filesystem::path(config.workDir) / "reconciliation.journal").string();
  upJournal_ = std::make_unique<JournalFile>("server.reconciler.journal");
  auto openResult = upJournal_->open(path);
  if (!openResult) {
    upJournal_.reset();
    return Error(err::E_STORAGE, "Failed to open reconciliation journal: " +
                                     openResult.error().message);
  }

  std::lock_guard<std::mutex> lock(reportsMutex_);
  auto replayResult =
      upJournal_->replay([this](const std::string &data) -> JournalFile::Roe<void> {
        Report report;
        try {
          if (!report.fromRecord(nlohmann::json::parse(data))) {
            return JournalFile::Error(err::E_STORAGE, "Invalid reconciliation report");
          }
        } catch (const nlohmann::json::parse_error &e) {
          return JournalFile::Error(err::E_STORAGE, std::string("Invalid JSON: ") + e.what());
        }
        index(report);
        return {};
      });
  if (!replayResult) {
    upJournal_.reset();
    reports_.clear();
    reportOrder_.clear();
    return Error(err::E_STORAGE,
                 "Failed to replay reconciliation journal: " + replayResult.error().message);
  }
  evictSettled();
  log().info << "Loaded " << reports_.size() << " reconciliation reports from " << path;
  return {};
}

Reconciler::Roe<Amount> Reconciler::fetchExternalBalance(const std::string &accountId) {
  auto result = retryTransient(config_.retry, sleeper_,
                               [&]() { return gateway_.getBalance(accountId); });
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

Reconciler::Roe<Reconciler::SyncResult> Reconciler::syncBalance(uint64_t tenantId) {
  auto account = tenants_.resolve(tenantId);
  if (!account) {
    return Error(account.error().code, account.error().message);
  }

  SyncResult result;
  result.tenantId = tenantId;
  result.internal = store_.foldBalance(tenantId);

  auto external = fetchExternalBalance(account.value());
  if (!external) {
    log().warning << "Balance sync of tenant " << tenantId << " failed: "
                  << external.error().message;
    return external.error();
  }
  result.external = external.value();
  result.isReconciled = magnitude(result.internal - result.external) < config_.toleranceMinor;

  if (result.isReconciled) {
    log().debug << "Tenant " << tenantId << " reconciled at " << money::format(result.internal);
    return result;
  }

  audit().warning << err::errorName(err::E_RECONCILIATION_MISMATCH) << ": tenant " << tenantId
                  << " ledger " << money::format(result.internal) << " gateway "
                  << money::format(result.external);

  int64_t to = now();
  auto report = reconcile(tenantId, to - config_.lookbackSec, to);
  if (report) {
    result.reportId = report->id;
  } else {
    log().error << "Deep reconciliation of tenant " << tenantId << " failed: "
                << report.error().message;
  }
  return result;
}

Reconciler::Roe<Reconciler::Report> Reconciler::reconcile(uint64_t tenantId, int64_t from,
                                                          int64_t to) {
  if (from > to) {
    return Error(err::E_INVALID_INPUT, "Reconciliation window ends before it starts");
  }
  auto account = tenants_.resolve(tenantId);
  if (!account) {
    return Error(account.error().code, account.error().message);
  }

  Report report;
  report.id = "rec_" + utl::randomHex(8);
  report.tenantId = tenantId;
  report.from = from;
  report.to = to;
  report.createdAt = now();
  report.internal = store_.foldBalance(tenantId);

  auto external = fetchExternalBalance(account.value());
  if (!external) {
    return external.error();
  }
  report.external = external.value();
  report.difference = report.internal - report.external;

  auto statement = retryTransient(config_.retry, sleeper_, [&]() {
    return gateway_.listTransactions(account.value(), from, to);
  });
  if (!statement) {
    return Error(statement.error().code, statement.error().message);
  }

  if (magnitude(report.difference) >= config_.toleranceMinor) {
    Discrepancy discrepancy;
    discrepancy.type = "balance_mismatch";
    discrepancy.internalAmount = report.internal;
    discrepancy.externalAmount = report.external;
    discrepancy.detail = "Ledger and gateway balances differ by " + money::format(report.difference);
    report.discrepancies.push_back(discrepancy);
  }

  std::map<std::string, const IGateway::StatementItem *> items;
  for (const auto &item : statement.value()) {
    items[item.externalId] = &item;
  }

  auto confirmed = store_.listConfirmed(tenantId, from, to);
  report.transactionCount = confirmed.size();

  std::set<std::string> matched;
  for (const auto &entry : confirmed) {
    // Adjustments and fees never touch the gateway
    if (entry.externalTransactionId.empty()) {
      continue;
    }
    matched.insert(entry.externalTransactionId);

    auto it = items.find(entry.externalTransactionId);
    if (it == items.end() || it->second->status == IGateway::Status::FAILED) {
      Discrepancy discrepancy;
      discrepancy.type = "missing_at_gateway";
      discrepancy.entryId = entry.id;
      discrepancy.externalId = entry.externalTransactionId;
      discrepancy.internalAmount = entry.amount;
      discrepancy.detail = it == items.end() ? "Confirmed entry absent from the gateway statement"
                                             : "Gateway reports the transaction as failed";
      report.discrepancies.push_back(discrepancy);
    } else if (it->second->amount != entry.amount) {
      Discrepancy discrepancy;
      discrepancy.type = "amount_mismatch";
      discrepancy.entryId = entry.id;
      discrepancy.externalId = entry.externalTransactionId;
      discrepancy.internalAmount = entry.amount;
      discrepancy.externalAmount = it->second->amount;
      discrepancy.detail = "Amounts differ";
      report.discrepancies.push_back(discrepancy);
    }
  }

  for (const auto &item : statement.value()) {
    if (item.status != IGateway::Status::COMPLETED || matched.count(item.externalId) > 0) {
      continue;
    }
    Discrepancy discrepancy;
    discrepancy.type = "missing_in_ledger";
    discrepancy.externalId = item.externalId;
    discrepancy.externalAmount = item.amount;
    discrepancy.detail = "Completed gateway transaction without a confirmed ledger entry";

    auto entry = store_.findByExternalId(item.externalId);
    if (entry) {
      if (entry->status == LedgerStore::EntryStatus::CONFIRMED) {
        // Confirmed, but created outside the window
        continue;
      }
      discrepancy.entryId = entry->id;
      discrepancy.internalAmount = entry->amount;
      discrepancy.detail = std::string("Ledger entry is ") + LedgerStore::toString(entry->status);
    }
    report.discrepancies.push_back(discrepancy);
  }

  for (const auto &entry : store_.listPending(tenantId)) {
    if (report.createdAt - entry.createdAt <= config_.maxPendingAgeSec) {
      continue;
    }
    Discrepancy discrepancy;
    discrepancy.type = "stale_pending";
    discrepancy.entryId = entry.id;
    discrepancy.externalId = entry.externalTransactionId;
    discrepancy.internalAmount = entry.amount;
    discrepancy.detail = "Pending for " + std::to_string(report.createdAt - entry.createdAt) + "s";
    report.discrepancies.push_back(discrepancy);
  }

  report.status =
      report.discrepancies.empty() ? ReportStatus::RECONCILED : ReportStatus::DISCREPANCY_FOUND;
  auto stored = storeReport(report);
  if (!stored) {
    audit().error << "Report " << report.id << " of tenant " << tenantId << " with "
                  << report.discrepancies.size() << " discrepancies could not be stored: "
                  << stored.error().message;
    return stored.error();
  }

  if (report.status == ReportStatus::DISCREPANCY_FOUND) {
    audit().warning << err::errorName(err::E_RECONCILIATION_MISMATCH) << ": report " << report.id
                    << " tenant " << tenantId << " has " << report.discrepancies.size()
                    << " discrepancies (difference " << money::format(report.difference) << ")";
  } else {
    log().info << "Report " << report.id << ": tenant " << tenantId << " reconciled, "
               << report.transactionCount << " transactions";
  }
  return report;
}

void Reconciler::runOnce() {
  for (uint64_t tenantId : tenants_.listActiveTenants()) {
    if (isStopSet()) {
      break;
    }
    service_.sweepPending(tenantId);
    auto result = syncBalance(tenantId);
    if (!result) {
      log().error << "Reconciliation of tenant " << tenantId << " failed: "
                  << result.error().message;
    }
  }
}

void Reconciler::runLoop() {
  log().info << "Reconciling every " << config_.intervalSec << "s";
  while (!isStopSet()) {
    runOnce();
    if (!waitFor(std::chrono::seconds(config_.intervalSec))) {
      break;
    }
  }
}

Reconciler::Roe<void> Reconciler::journal(const Report &report) {
  if (!upJournal_) {
    return {};
  }
  auto result = upJournal_->append(report.toRecord().dump());
  if (!result) {
    log().error << "Journal write failed: " << result.error().message;
    return Error(err::E_STORAGE, "Failed to persist report " + report.id + ": " +
                                     result.error().message);
  }
  return {};
}

void Reconciler::index(const Report &report) {
  auto it = reports_.find(report.id);
  if (it == reports_.end()) {
    reportOrder_.push_back(report.id);
    reports_.emplace(report.id, report);
  } else {
    it->second = report;
  }
}

void Reconciler::evictSettled() {
  if (config_.maxReports == 0) {
    return;
  }
  size_t settled = 0;
  for (const auto &id : reportOrder_) {
    if (reports_.at(id).status != ReportStatus::DISCREPANCY_FOUND) {
      ++settled;
    }
  }
  if (settled <= config_.maxReports) {
    return;
  }

  size_t excess = settled - config_.maxReports;
  std::vector<std::string> kept;
  kept.reserve(reportOrder_.size() - excess);
  for (const auto &id : reportOrder_) {
    auto it = reports_.find(id);
    if (excess > 0 && it->second.status != ReportStatus::DISCREPANCY_FOUND) {
      reports_.erase(it);
      --excess;
      continue;
    }
    kept.push_back(id);
  }
  reportOrder_.swap(kept);
}

Reconciler::Roe<void> Reconciler::storeReport(const Report &report) {
  std::lock_guard<std::mutex> lock(reportsMutex_);
  auto journaled = journal(report);
  if (!journaled) {
    return journaled;
  }
  index(report);
  evictSettled();
  return {};
}

Reconciler::Roe<Reconciler::Report> Reconciler::getReport(const std::string &reportId) const {
  std::lock_guard<std::mutex> lock(reportsMutex_);
  auto it = reports_.find(reportId);
  if (it == reports_.end()) {
    return Error(err::E_NOT_FOUND, "Report not found: " + reportId);
  }
  return it->second;
}

std::vector<Reconciler::Report> Reconciler::listReports(uint64_t tenantId) const {
  std::lock_guard<std::mutex> lock(reportsMutex_);
  std::vector<Report> result;
  for (auto it = reportOrder_.rbegin(); it != reportOrder_.rend(); ++it) {
    const auto &report = reports_.at(*it);
    if (report.tenantId == tenantId) {
      result.push_back(report);
    }
  }
  return result;
}

std::vector<Reconciler::Report> Reconciler::listOpenReports() const {
  std::lock_guard<std::mutex> lock(reportsMutex_);
  std::vector<Report> result;
  for (auto it = reportOrder_.rbegin(); it != reportOrder_.rend(); ++it) {
    const auto &report = reports_.at(*it);
    if (report.status == ReportStatus::DISCREPANCY_FOUND) {
      result.push_back(report);
    }
  }
  return result;
}

Reconciler::Roe<Reconciler::Report> Reconciler::resolveReport(const std::string &reportId,
                                                              const std::string &resolvedBy,
                                                              const std::string &notes) {
  if (resolvedBy.empty()) {
    return Error(err::E_INVALID_INPUT, "resolvedBy is required");
  }

  std::lock_guard<std::mutex> lock(reportsMutex_);
  auto it = reports_.find(reportId);
  if (it == reports_.end()) {
    return Error(err::E_NOT_FOUND, "Report not found: " + reportId);
  }
  if (it->second.status != ReportStatus::DISCREPANCY_FOUND) {
    return Error(err::E_INVALID_STATE_TRANSITION,
                 std::string("Report ") + reportId + " is " + toString(it->second.status));
  }
  Report report = it->second;
  report.status = ReportStatus::RESOLVED;
  report.resolvedBy = resolvedBy;
  report.notes = notes;
  report.resolvedAt = now();

  auto journaled = journal(report);
  if (!journaled) {
    return journaled.error();
  }
  it->second = report;
  evictSettled();

  audit().warning << "Report " << reportId << " of tenant " << report.tenantId
                  << " resolved by " << resolvedBy << ": " << notes;
  return report;
}

} // namespace pl
