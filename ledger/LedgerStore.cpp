#include "LedgerStore.h"
#include "ErrorCodes.h"
#include "Utilities.h"

#include <algorithm>
#include <filesystem>

namespace pl {

namespace {

Amount confirmedContribution(const LedgerStore::Entry &entry) {
  return entry.status == LedgerStore::EntryStatus::CONFIRMED ? entry.amount : 0;
}

} // namespace

// ========== Enum names ==========

const char *LedgerStore::toString(EntryType type) {
  switch (type) {
  case EntryType::CASH_IN:
    return "cash_in";
  case EntryType::CASH_OUT:
    return "cash_out";
  case EntryType::FEE:
    return "fee";
  case EntryType::COMMISSION:
    return "commission";
  case EntryType::ADJUSTMENT:
    return "adjustment";
  case EntryType::REVERSAL:
    return "reversal";
  default:
    return "unknown";
  }
}

const char *LedgerStore::toString(EntryStatus status) {
  switch (status) {
  case EntryStatus::PENDING:
    return "pending";
  case EntryStatus::CONFIRMED:
    return "confirmed";
  case EntryStatus::FAILED:
    return "failed";
  case EntryStatus::REVERSED:
    return "reversed";
  default:
    return "unknown";
  }
}

bool LedgerStore::parseEntryType(const std::string &str, EntryType &type) {
  static const EntryType all[] = { EntryType::CASH_IN,    EntryType::CASH_OUT,
                                   EntryType::FEE,        EntryType::COMMISSION,
                                   EntryType::ADJUSTMENT, EntryType::REVERSAL };
  for (auto candidate : all) {
    if (str == toString(candidate)) {
      type = candidate;
      return true;
    }
  }
  return false;
}

bool LedgerStore::parseEntryStatus(const std::string &str, EntryStatus &status) {
  static const EntryStatus all[] = { EntryStatus::PENDING, EntryStatus::CONFIRMED,
                                     EntryStatus::FAILED, EntryStatus::REVERSED };
  for (auto candidate : all) {
    if (str == toString(candidate)) {
      status = candidate;
      return true;
    }
  }
  return false;
}

// ========== Entry ==========

nlohmann::json LedgerStore::Entry::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["tenantId"] = tenantId;
  j["type"] = toString(type);
  j["amount"] = money::format(amount);
  j["referenceId"] = referenceId;
  j["externalTransactionId"] =
      externalTransactionId.empty() ? nlohmann::json() : nlohmann::json(externalTransactionId);
  j["correlationId"] = correlationId;
  j["status"] = toString(status);
  j["createdAt"] = createdAt;
  j["confirmedAt"] = confirmedAt == 0 ? nlohmann::json() : nlohmann::json(confirmedAt);
  j["reversedAt"] = reversedAt == 0 ? nlohmann::json() : nlohmann::json(reversedAt);
  j["failureReason"] = failureReason.empty() ? nlohmann::json() : nlohmann::json(failureReason);
  j["reversalOf"] = reversalOf.empty() ? nlohmann::json() : nlohmann::json(reversalOf);
  j["reversedBy"] = reversedBy.empty() ? nlohmann::json() : nlohmann::json(reversedBy);
  j["metadata"] = metadata;
  return j;
}

bool LedgerStore::Entry::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return false;
  }
  try {
    id = j.at("id").get<std::string>();
    tenantId = j.at("tenantId").get<uint64_t>();
    if (!parseEntryType(j.at("type").get<std::string>(), type) ||
        !parseEntryStatus(j.at("status").get<std::string>(), status) ||
        !money::fromJson(j.at("amount"), amount)) {
      return false;
    }
    referenceId = j.value("referenceId", "");
    correlationId = j.value("correlationId", "");
    createdAt = j.value("createdAt", int64_t(0));

    auto optString = [&j](const char *key) {
      auto it = j.find(key);
      return it == j.end() || it->is_null() ? std::string() : it->get<std::string>();
    };
    auto optTime = [&j](const char *key) {
      auto it = j.find(key);
      return it == j.end() || it->is_null() ? int64_t(0) : it->get<int64_t>();
    };
    externalTransactionId = optString("externalTransactionId");
    failureReason = optString("failureReason");
    reversalOf = optString("reversalOf");
    reversedBy = optString("reversedBy");
    confirmedAt = optTime("confirmedAt");
    reversedAt = optTime("reversedAt");
    metadata = j.value("metadata", nlohmann::json::object());
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return !id.empty();
}

nlohmann::json LedgerStore::Page::toJson() const {
  nlohmann::json j;
  nlohmann::json items = nlohmann::json::array();
  for (const auto &entry : entries) {
    items.push_back(entry.toJson());
  }
  j["entries"] = items;
  j["total"] = total;
  j["offset"] = offset;
  j["limit"] = limit;
  return j;
}

// ========== LedgerStore ==========

LedgerStore::LedgerStore() : Module("ledger.store") {}

LedgerStore::Roe<void> LedgerStore::init(const InitConfig &config) {
  if (config.workDir.empty()) {
    log().info << "Ledger store running in memory only";
    return {};
  }

  auto path = (std::filesystem::path(config.workDir) / "ledger.journal").string();
  upJournal_ = std::make_unique<JournalFile>("ledger.store.journal");
  auto openResult = upJournal_->open(path);
  if (!openResult) {
    upJournal_.reset();
    return Error(err::E_STORAGE, "Failed to open ledger journal: " + openResult.error().message);
  }

  auto replayResult = replayJournal();
  if (!replayResult) {
    upJournal_.reset();
    return replayResult.error();
  }

  size_t entryCount = 0;
  {
    std::lock_guard<std::mutex> lock(indexMutex_);
    entryCount = entryTenant_.size();
  }
  log().info << "Ledger store loaded " << entryCount << " entries for "
             << listTenants().size() << " tenants from " << path;
  return {};
}

LedgerStore::Roe<void> LedgerStore::replayJournal() {
  std::vector<Entry> ordered;
  std::map<std::string, size_t> positions;

  auto result = upJournal_->replay([&](const std::string &record) -> JournalFile::Roe<void> {
    nlohmann::json j;
    try {
      j = nlohmann::json::parse(record);
    } catch (const nlohmann::json::parse_error &e) {
      return JournalFile::Error(err::E_STORAGE, std::string("Invalid JSON: ") + e.what());
    }
    if (!j.contains("entries") || !j["entries"].is_array()) {
      return JournalFile::Error(err::E_STORAGE, "Missing entries array");
    }
    for (const auto &item : j["entries"]) {
      Entry entry;
      if (!entry.fromJson(item)) {
        return JournalFile::Error(err::E_STORAGE, "Invalid entry snapshot");
      }
      auto it = positions.find(entry.id);
      if (it == positions.end()) {
        positions[entry.id] = ordered.size();
        ordered.push_back(entry);
      } else {
        ordered[it->second] = entry;
      }
    }
    return {};
  });
  if (!result) {
    return Error(err::E_STORAGE, "Failed to replay ledger journal: " + result.error().message);
  }

  for (const auto &entry : ordered) {
    auto spBook = getOrCreateBook(entry.tenantId);
    std::lock_guard<std::mutex> bookLock(spBook->mutex);
    applySnapshot(*spBook, entry);
    spBook->cacheSuspect = true;
    std::lock_guard<std::mutex> indexLock(indexMutex_);
    indexSnapshot(entry);
  }
  return {};
}

std::string LedgerStore::referenceKey(EntryType type, const std::string &referenceId) {
  return std::string(toString(type)) + ":" + referenceId;
}

std::string LedgerStore::newEntryId() { return "le_" + utl::randomHex(12); }

Amount LedgerStore::fold(const TenantBook &book) {
  Amount sum = 0;
  for (const auto &entry : book.entries) {
    sum += confirmedContribution(entry);
  }
  return sum;
}

std::shared_ptr<LedgerStore::TenantBook> LedgerStore::findBook(uint64_t tenantId) const {
  std::lock_guard<std::mutex> lock(booksMutex_);
  auto it = books_.find(tenantId);
  return it == books_.end() ? nullptr : it->second;
}

std::shared_ptr<LedgerStore::TenantBook> LedgerStore::getOrCreateBook(uint64_t tenantId) {
  std::lock_guard<std::mutex> lock(booksMutex_);
  auto &spBook = books_[tenantId];
  if (!spBook) {
    spBook = std::make_shared<TenantBook>();
  }
  return spBook;
}

LedgerStore::Roe<std::shared_ptr<LedgerStore::TenantBook>>
LedgerStore::findBookForEntry(const std::string &entryId) const {
  uint64_t tenantId = 0;
  {
    std::lock_guard<std::mutex> lock(indexMutex_);
    auto it = entryTenant_.find(entryId);
    if (it == entryTenant_.end()) {
      return Error(err::E_NOT_FOUND, "Entry not found: " + entryId);
    }
    tenantId = it->second;
  }
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return Error(err::E_NOT_FOUND, "Entry not found: " + entryId);
  }
  return spBook;
}

LedgerStore::Roe<LedgerStore::Entry> LedgerStore::prepareNew(const Entry &entry) const {
  if (entry.tenantId == 0) {
    return Error(err::E_INVALID_INPUT, "Entry requires a tenant");
  }
  if (entry.amount == 0) {
    return Error(err::E_INVALID_INPUT, "Entry amount must not be zero");
  }
  if (entry.type == EntryType::REVERSAL) {
    return Error(err::E_INVALID_INPUT, "Reversal entries are only created by reverse()");
  }
  if (entry.referenceId.empty()) {
    return Error(err::E_INVALID_INPUT, "Entry requires a reference id");
  }
  if (entry.status != EntryStatus::PENDING && entry.status != EntryStatus::CONFIRMED) {
    return Error(err::E_INVALID_INPUT, std::string("Entries cannot be appended as ") +
                                           toString(entry.status));
  }

  Entry prepared = entry;
  int64_t now = utl::getCurrentTime();
  if (prepared.id.empty()) {
    prepared.id = newEntryId();
  }
  if (prepared.createdAt == 0) {
    prepared.createdAt = now;
  }
  if (prepared.status == EntryStatus::CONFIRMED && prepared.confirmedAt == 0) {
    prepared.confirmedAt = now;
  }
  prepared.reversalOf.clear();
  prepared.reversedBy.clear();
  prepared.reversedAt = 0;
  if (!prepared.metadata.is_object()) {
    prepared.metadata = nlohmann::json::object();
  }
  return prepared;
}

LedgerStore::Roe<std::string> LedgerStore::append(const Entry &entry) {
  auto prepared = prepareNew(entry);
  if (!prepared) {
    return prepared.error();
  }

  auto spBook = getOrCreateBook(prepared->tenantId);
  std::lock_guard<std::mutex> lock(spBook->mutex);

  auto refResult = checkReference(*spBook, *prepared);
  if (!refResult) {
    return refResult.error();
  }

  auto commitResult = commit(*spBook, { *prepared });
  if (!commitResult) {
    return commitResult.error();
  }

  log().debug << "Appended " << toString(prepared->type) << " entry " << prepared->id
              << " tenant=" << prepared->tenantId << " amount=" << money::format(prepared->amount)
              << " status=" << toString(prepared->status);
  return prepared->id;
}

LedgerStore::Roe<std::string> LedgerStore::appendDebitIfCovered(const Entry &entry,
                                                                const DebitPolicy &policy) {
  if (entry.amount >= 0) {
    return Error(err::E_INVALID_INPUT, "Conditional append requires a debit");
  }
  auto prepared = prepareNew(entry);
  if (!prepared) {
    return prepared.error();
  }

  auto spBook = getOrCreateBook(prepared->tenantId);
  std::lock_guard<std::mutex> lock(spBook->mutex);

  auto refResult = checkReference(*spBook, *prepared);
  if (!refResult) {
    return refResult.error();
  }

  Amount available = balanceLocked(*spBook) + pendingDebitsLocked(*spBook);
  if (available + prepared->amount < 0) {
    log().info << "Rejected debit of " << money::format(-prepared->amount) << " for tenant "
               << prepared->tenantId << ": available " << money::format(available);
    return Error(err::E_INSUFFICIENT_BALANCE,
                 "Insufficient balance: available " + money::format(available) +
                     ", requested " + money::format(-prepared->amount));
  }

  if (policy.dailyLimit > 0 && prepared->type == EntryType::CASH_OUT) {
    Amount used = 0;
    for (const auto &existing : spBook->entries) {
      if (existing.type == EntryType::CASH_OUT && existing.isActive() &&
          existing.createdAt >= policy.dayStart) {
        used -= existing.amount;
      }
    }
    if (used - prepared->amount > policy.dailyLimit) {
      return Error(err::E_LIMIT_EXCEEDED,
                   "Daily cash-out limit exceeded: used " + money::format(used) + " of " +
                       money::format(policy.dailyLimit));
    }
  }

  auto commitResult = commit(*spBook, { *prepared });
  if (!commitResult) {
    return commitResult.error();
  }

  log().debug << "Appended covered debit " << prepared->id << " tenant=" << prepared->tenantId
              << " amount=" << money::format(prepared->amount)
              << " available-before=" << money::format(available);
  return prepared->id;
}

Amount LedgerStore::balanceLocked(const TenantBook &book) const {
  if (book.cacheSuspect) {
    book.cachedBalance = fold(book);
    book.cacheSuspect = false;
  }
  return book.cachedBalance;
}

Amount LedgerStore::pendingDebitsLocked(const TenantBook &book) const {
  Amount sum = 0;
  for (const auto &entry : book.entries) {
    if (entry.status == EntryStatus::PENDING && entry.amount < 0) {
      sum += entry.amount;
    }
  }
  return sum;
}

Amount LedgerStore::getBalance(uint64_t tenantId) const {
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  return balanceLocked(*spBook);
}

Amount LedgerStore::foldBalance(uint64_t tenantId) const {
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  Amount folded = fold(*spBook);
  if (!spBook->cacheSuspect && folded != spBook->cachedBalance) {
    log().warning << "Cached balance for tenant " << tenantId << " was "
                  << money::format(spBook->cachedBalance) << ", fold gives "
                  << money::format(folded);
  }
  spBook->cachedBalance = folded;
  spBook->cacheSuspect = false;
  return folded;
}

Amount LedgerStore::getAvailableBalance(uint64_t tenantId) const {
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  return balanceLocked(*spBook) + pendingDebitsLocked(*spBook);
}

LedgerStore::Page LedgerStore::listEntries(uint64_t tenantId, uint64_t offset,
                                           uint64_t limit) const {
  Page page;
  page.offset = offset;
  page.limit = limit;
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return page;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  page.total = spBook->entries.size();
  for (uint64_t i = offset; i < page.total && page.entries.size() < limit; ++i) {
    page.entries.push_back(spBook->entries[page.total - 1 - i]);
  }
  return page;
}

LedgerStore::Roe<void> LedgerStore::checkReference(const TenantBook &book,
                                                   const Entry &entry) const {
  auto it = book.activeReferences.find(referenceKey(entry.type, entry.referenceId));
  if (it != book.activeReferences.end()) {
    const Entry &existing = book.entries[it->second];
    return Error(err::E_DUPLICATE_REFERENCE,
                 "Active " + std::string(toString(entry.type)) + " entry " + existing.id +
                     " already exists for reference " + entry.referenceId);
  }
  return {};
}

LedgerStore::Roe<size_t> LedgerStore::indexOf(const TenantBook &book,
                                              const std::string &entryId) const {
  auto it = book.idIndex.find(entryId);
  if (it == book.idIndex.end()) {
    return Error(err::E_NOT_FOUND, "Entry not found: " + entryId);
  }
  return it->second;
}

LedgerStore::Roe<void> LedgerStore::commit(TenantBook &book, const std::vector<Entry> &snapshots) {
  // The index lock is held across the journal write so that two tenants
  // cannot claim the same external id between check and apply.
  std::lock_guard<std::mutex> indexLock(indexMutex_);

  for (const auto &snapshot : snapshots) {
    if (snapshot.externalTransactionId.empty() || snapshot.status == EntryStatus::REVERSED) {
      continue;
    }
    auto it = externalIdIndex_.find(snapshot.externalTransactionId);
    if (it != externalIdIndex_.end() && it->second != snapshot.id) {
      return Error(err::E_DUPLICATE_REFERENCE, "External transaction id " +
                                                   snapshot.externalTransactionId +
                                                   " already belongs to entry " + it->second);
    }
  }

  if (upJournal_) {
    nlohmann::json record;
    record["entries"] = nlohmann::json::array();
    for (const auto &snapshot : snapshots) {
      record["entries"].push_back(snapshot.toJson());
    }
    auto result = upJournal_->append(record.dump());
    if (!result) {
      log().error << "Journal write failed: " << result.error().message;
      return Error(err::E_STORAGE, "Failed to persist ledger entry: " + result.error().message);
    }
  }

  for (const auto &snapshot : snapshots) {
    applySnapshot(book, snapshot);
    indexSnapshot(snapshot);
  }
  return {};
}

void LedgerStore::applySnapshot(TenantBook &book, const Entry &snapshot) {
  size_t index = 0;
  Amount previousContribution = 0;
  auto it = book.idIndex.find(snapshot.id);
  if (it == book.idIndex.end()) {
    index = book.entries.size();
    book.entries.push_back(snapshot);
    book.idIndex[snapshot.id] = index;
  } else {
    index = it->second;
    previousContribution = confirmedContribution(book.entries[index]);
    book.entries[index] = snapshot;
  }

  if (snapshot.type != EntryType::REVERSAL) {
    auto key = referenceKey(snapshot.type, snapshot.referenceId);
    if (snapshot.isActive()) {
      book.activeReferences[key] = index;
    } else {
      auto refIt = book.activeReferences.find(key);
      if (refIt != book.activeReferences.end() && refIt->second == index) {
        book.activeReferences.erase(refIt);
      }
    }
  }

  if (!book.cacheSuspect) {
    book.cachedBalance += confirmedContribution(snapshot) - previousContribution;
  }
}

void LedgerStore::indexSnapshot(const Entry &snapshot) {
  entryTenant_[snapshot.id] = snapshot.tenantId;
  if (snapshot.externalTransactionId.empty()) {
    return;
  }
  if (snapshot.status == EntryStatus::REVERSED) {
    auto it = externalIdIndex_.find(snapshot.externalTransactionId);
    if (it != externalIdIndex_.end() && it->second == snapshot.id) {
      externalIdIndex_.erase(it);
    }
  } else {
    externalIdIndex_[snapshot.externalTransactionId] = snapshot.id;
  }
}

LedgerStore::Roe<LedgerStore::Entry>
LedgerStore::markConfirmed(const std::string &entryId, const std::string &externalTransactionId) {
  auto bookResult = findBookForEntry(entryId);
  if (!bookResult) {
    return bookResult.error();
  }
  auto &book = **bookResult;
  std::lock_guard<std::mutex> lock(book.mutex);

  auto index = indexOf(book, entryId);
  if (!index) {
    return index.error();
  }
  Entry entry = book.entries[*index];
  if (entry.status != EntryStatus::PENDING) {
    return Error(err::E_INVALID_STATE_TRANSITION,
                 "Cannot confirm entry " + entryId + " in status " + toString(entry.status));
  }
  if (!externalTransactionId.empty()) {
    if (!entry.externalTransactionId.empty() &&
        entry.externalTransactionId != externalTransactionId) {
      return Error(err::E_INVALID_STATE_TRANSITION,
                   "Entry " + entryId + " is bound to external id " +
                       entry.externalTransactionId);
    }
    entry.externalTransactionId = externalTransactionId;
  }
  entry.status = EntryStatus::CONFIRMED;
  entry.confirmedAt = utl::getCurrentTime();

  auto result = commit(book, { entry });
  if (!result) {
    return result.error();
  }
  log().info << "Confirmed entry " << entryId << " tenant=" << entry.tenantId
             << " amount=" << money::format(entry.amount)
             << " external=" << entry.externalTransactionId;
  return entry;
}

LedgerStore::Roe<LedgerStore::Entry> LedgerStore::markFailed(const std::string &entryId,
                                                             const std::string &reason) {
  auto bookResult = findBookForEntry(entryId);
  if (!bookResult) {
    return bookResult.error();
  }
  auto &book = **bookResult;
  std::lock_guard<std::mutex> lock(book.mutex);

  auto index = indexOf(book, entryId);
  if (!index) {
    return index.error();
  }
  Entry entry = book.entries[*index];
  if (entry.status != EntryStatus::PENDING) {
    return Error(err::E_INVALID_STATE_TRANSITION,
                 "Cannot fail entry " + entryId + " in status " + toString(entry.status));
  }
  entry.status = EntryStatus::FAILED;
  entry.failureReason = reason;

  auto result = commit(book, { entry });
  if (!result) {
    return result.error();
  }
  log().info << "Failed entry " << entryId << ": " << reason;
  return entry;
}

LedgerStore::Roe<LedgerStore::Entry> LedgerStore::reverse(const std::string &entryId,
                                                          const std::string &reason) {
  auto bookResult = findBookForEntry(entryId);
  if (!bookResult) {
    return bookResult.error();
  }
  auto &book = **bookResult;
  std::lock_guard<std::mutex> lock(book.mutex);

  auto index = indexOf(book, entryId);
  if (!index) {
    return index.error();
  }
  Entry original = book.entries[*index];
  if (original.type == EntryType::REVERSAL) {
    return Error(err::E_INVALID_STATE_TRANSITION, "Cannot reverse reversal entry " + entryId);
  }
  if (!original.isActive()) {
    return Error(err::E_INVALID_STATE_TRANSITION,
                 "Cannot reverse entry " + entryId + " in status " + toString(original.status));
  }

  int64_t now = utl::getCurrentTime();

  Entry reversal;
  reversal.id = newEntryId();
  reversal.tenantId = original.tenantId;
  reversal.type = EntryType::REVERSAL;
  reversal.amount = -original.amount;
  reversal.referenceId = original.referenceId;
  reversal.correlationId = original.correlationId;
  reversal.status = EntryStatus::REVERSED;
  reversal.createdAt = now;
  reversal.reversedAt = now;
  reversal.reversalOf = original.id;
  reversal.failureReason = reason;
  reversal.metadata = nlohmann::json{ { "reason", reason },
                                      { "originalStatus", toString(original.status) } };

  original.status = EntryStatus::REVERSED;
  original.reversedAt = now;
  original.reversedBy = reversal.id;
  if (original.failureReason.empty()) {
    original.failureReason = reason;
  }

  auto result = commit(book, { original, reversal });
  if (!result) {
    return result.error();
  }
  log().info << "Reversed entry " << entryId << " with " << reversal.id << ": " << reason;
  return reversal;
}

LedgerStore::Roe<LedgerStore::Entry>
LedgerStore::assignExternalId(const std::string &entryId, const std::string &externalTransactionId) {
  if (externalTransactionId.empty()) {
    return Error(err::E_INVALID_INPUT, "External transaction id must not be empty");
  }
  auto bookResult = findBookForEntry(entryId);
  if (!bookResult) {
    return bookResult.error();
  }
  auto &book = **bookResult;
  std::lock_guard<std::mutex> lock(book.mutex);

  auto index = indexOf(book, entryId);
  if (!index) {
    return index.error();
  }
  Entry entry = book.entries[*index];
  if (entry.externalTransactionId == externalTransactionId) {
    return entry;
  }
  if (entry.status != EntryStatus::PENDING || !entry.externalTransactionId.empty()) {
    return Error(err::E_INVALID_STATE_TRANSITION,
                 "Cannot assign external id to entry " + entryId + " in status " +
                     toString(entry.status));
  }
  entry.externalTransactionId = externalTransactionId;

  auto result = commit(book, { entry });
  if (!result) {
    return result.error();
  }
  return entry;
}

LedgerStore::Roe<LedgerStore::Entry> LedgerStore::getEntry(const std::string &entryId) const {
  auto bookResult = findBookForEntry(entryId);
  if (!bookResult) {
    return bookResult.error();
  }
  auto &book = **bookResult;
  std::lock_guard<std::mutex> lock(book.mutex);
  auto index = indexOf(book, entryId);
  if (!index) {
    return index.error();
  }
  return book.entries[*index];
}

LedgerStore::Roe<LedgerStore::Entry>
LedgerStore::findActiveByReference(uint64_t tenantId, const std::string &referenceId,
                                   EntryType type) const {
  auto spBook = findBook(tenantId);
  if (spBook) {
    std::lock_guard<std::mutex> lock(spBook->mutex);
    auto it = spBook->activeReferences.find(referenceKey(type, referenceId));
    if (it != spBook->activeReferences.end()) {
      return spBook->entries[it->second];
    }
  }
  return Error(err::E_NOT_FOUND, "No active " + std::string(toString(type)) +
                                     " entry for reference " + referenceId);
}

LedgerStore::Roe<LedgerStore::Entry>
LedgerStore::findByExternalId(const std::string &externalTransactionId) const {
  std::string entryId;
  {
    std::lock_guard<std::mutex> lock(indexMutex_);
    auto it = externalIdIndex_.find(externalTransactionId);
    if (it == externalIdIndex_.end()) {
      return Error(err::E_NOT_FOUND, "No entry for external id " + externalTransactionId);
    }
    entryId = it->second;
  }
  return getEntry(entryId);
}

std::vector<LedgerStore::Entry> LedgerStore::listPending(uint64_t tenantId) const {
  std::vector<Entry> result;
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return result;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  for (const auto &entry : spBook->entries) {
    if (entry.status == EntryStatus::PENDING) {
      result.push_back(entry);
    }
  }
  return result;
}

std::vector<LedgerStore::Entry> LedgerStore::listConfirmed(uint64_t tenantId, int64_t from,
                                                           int64_t to) const {
  std::vector<Entry> result;
  auto spBook = findBook(tenantId);
  if (!spBook) {
    return result;
  }
  std::lock_guard<std::mutex> lock(spBook->mutex);
  for (const auto &entry : spBook->entries) {
    if (entry.status == EntryStatus::CONFIRMED && entry.createdAt >= from &&
        entry.createdAt <= to) {
      result.push_back(entry);
    }
  }
  return result;
}

std::vector<uint64_t> LedgerStore::listTenants() const {
  std::vector<uint64_t> tenants;
  std::lock_guard<std::mutex> lock(booksMutex_);
  for (const auto &[tenantId, spBook] : books_) {
    tenants.push_back(tenantId);
  }
  return tenants;
}

} // namespace pl
