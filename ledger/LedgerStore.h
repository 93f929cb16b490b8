#ifndef PAYLEDGER_LEDGER_STORE_H
#define PAYLEDGER_LEDGER_STORE_H

#include "JournalFile.h"
#include "Module.h"
#include "Money.h"
#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pl {

/**
 * LedgerStore - per-tenant, append-only store of signed monetary entries.
 *
 * Balance is the fold of confirmed entries. Amount, type, reference and
 * tenant of an entry never change after append; only the status lifecycle
 * (pending -> confirmed/failed/reversed, confirmed -> reversed) moves.
 * Corrections are new reversal entries.
 *
 * Each tenant has its own book with its own mutex; no lock spans tenants.
 * When a work directory is configured every write is journaled before the
 * in-memory state changes.
 */
class LedgerStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  enum class EntryType { CASH_IN, CASH_OUT, FEE, COMMISSION, ADJUSTMENT, REVERSAL };

  enum class EntryStatus { PENDING, CONFIRMED, FAILED, REVERSED };

  static const char *toString(EntryType type);
  static const char *toString(EntryStatus status);
  static bool parseEntryType(const std::string &str, EntryType &type);
  static bool parseEntryStatus(const std::string &str, EntryStatus &status);

  struct Entry {
    std::string id;
    uint64_t tenantId{ 0 };
    EntryType type{ EntryType::ADJUSTMENT };
    Amount amount{ 0 }; // credits positive, debits negative
    std::string referenceId;
    std::string externalTransactionId;
    std::string correlationId;
    EntryStatus status{ EntryStatus::PENDING };
    int64_t createdAt{ 0 };
    int64_t confirmedAt{ 0 }; // 0 while unset
    int64_t reversedAt{ 0 };
    std::string failureReason;
    std::string reversalOf;
    std::string reversedBy;
    nlohmann::json metadata = nlohmann::json::object();

    /** Pending or confirmed; blocks another entry with the same reference */
    bool isActive() const {
      return status == EntryStatus::PENDING || status == EntryStatus::CONFIRMED;
    }

    bool isDebit() const { return amount < 0; }

    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json &j);
  };

  struct Page {
    std::vector<Entry> entries;
    uint64_t total{ 0 };
    uint64_t offset{ 0 };
    uint64_t limit{ 0 };

    nlohmann::json toJson() const;
  };

  /**
   * Extra admission rules for a conditional debit.
   * dailyLimit (magnitude, 0 = none) caps active cash-out debits created at
   * or after dayStart, including the new one.
   */
  struct DebitPolicy {
    Amount dailyLimit{ 0 };
    int64_t dayStart{ 0 };
  };

  struct InitConfig {
    std::string workDir; // empty keeps the store in memory only
  };

  LedgerStore();
  ~LedgerStore() override = default;

  Roe<void> init(const InitConfig &config);

  /**
   * Append an entry. id and createdAt are assigned when empty.
   * Fails with E_DUPLICATE_REFERENCE when an active entry with the same
   * (tenantId, referenceId, type) exists.
   * @return Id of the new entry
   */
  Roe<std::string> append(const Entry &entry);

  /**
   * Append a debit only if, under the tenant's lock, the available balance
   * covers it (and the daily cash-out limit, if any, is respected).
   * Fails with E_INSUFFICIENT_BALANCE or E_LIMIT_EXCEEDED otherwise.
   */
  Roe<std::string> appendDebitIfCovered(const Entry &entry, const DebitPolicy &policy);

  /** Confirmed balance; served from cache unless the cache is suspect */
  Amount getBalance(uint64_t tenantId) const;

  /** Confirmed balance recomputed from the entries; refreshes the cache */
  Amount foldBalance(uint64_t tenantId) const;

  /** Confirmed balance plus pending debits (funds reserved by cash-outs) */
  Amount getAvailableBalance(uint64_t tenantId) const;

  /** Entries newest first */
  Page listEntries(uint64_t tenantId, uint64_t offset, uint64_t limit) const;

  /**
   * pending -> confirmed. An empty externalTransactionId keeps the one
   * already assigned. E_INVALID_STATE_TRANSITION unless pending.
   */
  Roe<Entry> markConfirmed(const std::string &entryId,
                           const std::string &externalTransactionId);

  /** pending -> failed */
  Roe<Entry> markFailed(const std::string &entryId, const std::string &reason);

  /**
   * Reverse a pending or confirmed entry. The original moves to reversed
   * and a new reversal entry (negated amount, born reversed) is appended.
   * @return The new reversal entry
   */
  Roe<Entry> reverse(const std::string &entryId, const std::string &reason);

  /** Record the gateway's id on a pending entry that has none yet */
  Roe<Entry> assignExternalId(const std::string &entryId,
                              const std::string &externalTransactionId);

  Roe<Entry> getEntry(const std::string &entryId) const;
  Roe<Entry> findActiveByReference(uint64_t tenantId, const std::string &referenceId,
                                   EntryType type) const;
  /** Lookup among entries that are not reversed */
  Roe<Entry> findByExternalId(const std::string &externalTransactionId) const;

  std::vector<Entry> listPending(uint64_t tenantId) const;
  /** Confirmed entries created in [from, to] */
  std::vector<Entry> listConfirmed(uint64_t tenantId, int64_t from, int64_t to) const;
  std::vector<uint64_t> listTenants() const;

private:
  struct TenantBook {
    mutable std::mutex mutex;
    std::vector<Entry> entries; // append order
    std::map<std::string, size_t> idIndex;
    std::map<std::string, size_t> activeReferences; // type:referenceId -> index
    mutable Amount cachedBalance{ 0 };
    mutable bool cacheSuspect{ true };
  };

  static std::string referenceKey(EntryType type, const std::string &referenceId);
  static std::string newEntryId();
  static Amount fold(const TenantBook &book);

  std::shared_ptr<TenantBook> findBook(uint64_t tenantId) const;
  std::shared_ptr<TenantBook> getOrCreateBook(uint64_t tenantId);
  Roe<std::shared_ptr<TenantBook>> findBookForEntry(const std::string &entryId) const;

  Roe<Entry> prepareNew(const Entry &entry) const;

  // The helpers below expect the caller to hold book.mutex
  Amount balanceLocked(const TenantBook &book) const;
  Amount pendingDebitsLocked(const TenantBook &book) const;
  Roe<void> checkReference(const TenantBook &book, const Entry &entry) const;
  Roe<size_t> indexOf(const TenantBook &book, const std::string &entryId) const;
  /** Journal the snapshots, then apply them to the book and the indexes */
  Roe<void> commit(TenantBook &book, const std::vector<Entry> &snapshots);
  void applySnapshot(TenantBook &book, const Entry &snapshot);
  // Caller holds indexMutex_
  void indexSnapshot(const Entry &snapshot);

  Roe<void> replayJournal();

  std::unique_ptr<JournalFile> upJournal_;

  mutable std::mutex booksMutex_;
  std::map<uint64_t, std::shared_ptr<TenantBook>> books_;

  mutable std::mutex indexMutex_;
  std::map<std::string, uint64_t> entryTenant_;          // entry id -> tenant
  std::map<std::string, std::string> externalIdIndex_;   // non-reversed only
};

} // namespace pl

#endif // PAYLEDGER_LEDGER_STORE_H
