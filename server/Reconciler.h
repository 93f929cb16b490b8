#ifndef PAYLEDGER_RECONCILER_H
#define PAYLEDGER_RECONCILER_H

#include "LedgerService.h"
#include "Retry.h"
#include "TenantDirectory.h"
#include "IGateway.hpp"
#include "JournalFile.h"
#include "LedgerStore.h"
#include "Service.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pl {

/**
 * Reconciler - compares the ledger against the gateway's view of each
 * tenant account.
 *
 * A balance sync folds the ledger and asks the gateway for its balance; a
 * mismatch beyond the tolerance triggers a per-transaction pass over the
 * lookback window. Passes only produce reports. The ledger is never
 * corrected here; an operator resolves reports by hand.
 *
 * Run as a service, it periodically sweeps pending entries and syncs every
 * active tenant.
 *
 * Reports are journaled to reconciliation.journal when a work directory is
 * given. Only the newest maxReports settled reports are kept in memory;
 * reports awaiting resolution are never dropped.
 */
class Reconciler : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  using Clock = std::function<int64_t()>;

  struct Config {
    int64_t intervalSec{ 3600 };
    int64_t lookbackSec{ 24 * 3600 };
    Amount toleranceMinor{ 1 };
    int64_t maxPendingAgeSec{ 24 * 3600 };
    size_t maxReports{ 1000 };
    RetryPolicy retry;
  };

  struct InitConfig {
    std::string workDir; // empty keeps reports in memory only
  };

  enum class ReportStatus { RECONCILED, DISCREPANCY_FOUND, RESOLVED };

  static const char *toString(ReportStatus status);

  struct Discrepancy {
    // balance_mismatch | missing_at_gateway | missing_in_ledger |
    // amount_mismatch | stale_pending
    std::string type;
    std::string entryId;
    std::string externalId;
    Amount internalAmount{ 0 };
    Amount externalAmount{ 0 };
    std::string detail;

    nlohmann::json toJson() const;
    nlohmann::json toRecord() const;
    bool fromRecord(const nlohmann::json &j);
  };

  struct Report {
    std::string id;
    uint64_t tenantId{ 0 };
    int64_t from{ 0 };
    int64_t to{ 0 };
    Amount internal{ 0 };
    Amount external{ 0 };
    Amount difference{ 0 }; // internal - external
    uint64_t transactionCount{ 0 };
    std::vector<Discrepancy> discrepancies;
    ReportStatus status{ ReportStatus::RECONCILED };
    std::string notes;
    std::string resolvedBy;
    int64_t createdAt{ 0 };
    int64_t resolvedAt{ 0 };

    nlohmann::json toJson() const;
    /** Journal form: raw timestamps and minor units */
    nlohmann::json toRecord() const;
    bool fromRecord(const nlohmann::json &j);
  };

  struct SyncResult {
    uint64_t tenantId{ 0 };
    Amount internal{ 0 };
    Amount external{ 0 };
    bool isReconciled{ false };
    std::string reportId; // set when a deeper pass ran

    nlohmann::json toJson() const;
  };

  Reconciler(LedgerStore &store, LedgerService &service, IGateway &gateway,
             TenantDirectory &tenants, const Config &config);
  ~Reconciler() override;

  /** Open the report journal and load the reports it holds */
  Roe<void> init(const InitConfig &config);

  void setClock(Clock clock) { clock_ = std::move(clock); }
  void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

  Roe<SyncResult> syncBalance(uint64_t tenantId);

  /** Per-transaction pass over confirmed entries created in [from, to] */
  Roe<Report> reconcile(uint64_t tenantId, int64_t from, int64_t to);

  /** Sweep and sync every active tenant once */
  void runOnce();

  Roe<Report> getReport(const std::string &reportId) const;
  /** Reports of a tenant, newest first */
  std::vector<Report> listReports(uint64_t tenantId) const;
  /** Reports with unresolved discrepancies, all tenants */
  std::vector<Report> listOpenReports() const;

  /** Manual resolution; the only way a report becomes resolved */
  Roe<Report> resolveReport(const std::string &reportId, const std::string &resolvedBy,
                            const std::string &notes);

protected:
  void runLoop() override;

private:
  Roe<Amount> fetchExternalBalance(const std::string &accountId);
  Roe<void> storeReport(const Report &report);
  Roe<void> journal(const Report &report);
  // Caller holds reportsMutex_
  void index(const Report &report);
  void evictSettled();

  int64_t now() const { return clock_(); }

  LedgerStore &store_;
  LedgerService &service_;
  IGateway &gateway_;
  TenantDirectory &tenants_;
  Config config_;
  Clock clock_;
  Sleeper sleeper_;

  mutable std::mutex reportsMutex_;
  std::vector<std::string> reportOrder_;
  std::map<std::string, Report> reports_;
  std::unique_ptr<JournalFile> upJournal_;
};

} // namespace pl

#endif // PAYLEDGER_RECONCILER_H
