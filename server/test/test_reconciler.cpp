#include "../Reconciler.h"
#include "FakeGateway.h"
#include "ErrorCodes.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>

using namespace pl;
using pl::test::FakeGateway;

class ReconcilerTest : public ::testing::Test {
protected:
  using Status = IGateway::Status;

  void SetUp() override {
    ASSERT_TRUE(store_.init({}).isOk());
    ASSERT_TRUE(txLog_.init({}).isOk());

    TenantDirectory::GatewayAccount active;
    active.tenantId = 1;
    active.externalAccountId = "acct-1";
    active.status = TenantDirectory::AccountStatus::ACTIVE;
    ASSERT_TRUE(tenants_.add(active).isOk());

    TenantDirectory::GatewayAccount suspended;
    suspended.tenantId = 2;
    suspended.externalAccountId = "acct-2";
    suspended.status = TenantDirectory::AccountStatus::SUSPENDED;
    ASSERT_TRUE(tenants_.add(suspended).isOk());

    upService_ = std::make_unique<LedgerService>(store_, txLog_, gateway_, tenants_,
                                                 LedgerService::Config());
    upService_->setClock([this] { return now_; });
    upService_->setSleeper([](std::chrono::milliseconds) {});
    build(Reconciler::Config());
  }

  void TearDown() override {
    if (upReconciler_) {
      upReconciler_->stop();
    }
  }

  void build(const Reconciler::Config &config) {
    upReconciler_ =
        std::make_unique<Reconciler>(store_, *upService_, gateway_, tenants_, config);
    upReconciler_->setClock([this] { return now_; });
    upReconciler_->setSleeper(
        [this](std::chrono::milliseconds duration) { sleeps_.push_back(duration.count()); });
  }

  std::string cashIn(const std::string &referenceId, Amount amount, Status status) {
    gateway_.paymentStatus = status;
    LedgerService::CashInRequest request;
    request.tenantId = 1;
    request.amount = amount;
    request.referenceId = referenceId;
    auto result = upService_->processCashIn(request);
    EXPECT_TRUE(result.success) << result.message;
    return result.externalTransactionId;
  }

  static IGateway::StatementItem item(const std::string &externalId, Amount amount,
                                      Status status) {
    IGateway::StatementItem item;
    item.externalId = externalId;
    item.amount = amount;
    item.status = status;
    return item;
  }

  static size_t countType(const Reconciler::Report &report, const std::string &type) {
    return static_cast<size_t>(std::count_if(
        report.discrepancies.begin(), report.discrepancies.end(),
        [&type](const Reconciler::Discrepancy &d) { return d.type == type; }));
  }

  Reconciler &reconciler() { return *upReconciler_; }

  LedgerStore store_;
  TransactionLog txLog_;
  TenantDirectory tenants_;
  FakeGateway gateway_;
  std::unique_ptr<LedgerService> upService_;
  std::unique_ptr<Reconciler> upReconciler_;
  int64_t now_{ 1700000000 };
  std::vector<int64_t> sleeps_;
};

TEST_F(ReconcilerTest, SyncBalanceMatches) {
  cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 5000;

  auto result = reconciler().syncBalance(1);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(result->isReconciled);
  EXPECT_EQ(result->internal, 5000);
  EXPECT_EQ(result->external, 5000);
  EXPECT_TRUE(result->reportId.empty());
  EXPECT_TRUE(reconciler().listReports(1).empty());
  ASSERT_EQ(gateway_.balanceQueries.size(), 1u);
  EXPECT_EQ(gateway_.balanceQueries[0], "acct-1");
}

TEST_F(ReconcilerTest, SyncBalanceWithinTolerance) {
  Reconciler::Config config;
  config.toleranceMinor = 100;
  build(config);

  cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 4950;

  auto result = reconciler().syncBalance(1);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result->isReconciled);
  EXPECT_TRUE(gateway_.statementQueries.empty());
}

TEST_F(ReconcilerTest, SyncMismatchRunsDeepReconciliation) {
  auto externalId = cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 4000;
  gateway_.statement.push_back(item(externalId, 5000, Status::COMPLETED));

  auto result = reconciler().syncBalance(1);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result->isReconciled);
  ASSERT_FALSE(result->reportId.empty());

  auto report = reconciler().getReport(result->reportId);
  ASSERT_TRUE(report.isOk());
  EXPECT_EQ(report->status, Reconciler::ReportStatus::DISCREPANCY_FOUND);
  EXPECT_EQ(report->difference, 1000);
  EXPECT_EQ(report->from, now_ - 24 * 3600);
  EXPECT_EQ(report->to, now_);
  ASSERT_EQ(report->discrepancies.size(), 1u);
  EXPECT_EQ(report->discrepancies[0].type, "balance_mismatch");
  EXPECT_EQ(reconciler().listOpenReports().size(), 1u);

  // The ledger is left alone
  EXPECT_EQ(store_.getBalance(1), 5000);
}

TEST_F(ReconcilerTest, ReconcileComparesTransactions) {
  auto mismatched = cashIn("order-1", 5000, Status::COMPLETED);
  auto missingAtGateway = cashIn("order-2", 3000, Status::COMPLETED);
  auto stillPending = cashIn("order-3", 2000, Status::PENDING);
  gateway_.balance = 8000;
  gateway_.statement.push_back(item(mismatched, 4000, Status::COMPLETED));
  gateway_.statement.push_back(item(stillPending, 2000, Status::COMPLETED));
  gateway_.statement.push_back(item("pay-unknown", 1500, Status::COMPLETED));
  gateway_.statement.push_back(item("pay-refused", 900, Status::FAILED));

  auto report = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(report.isOk()) << report.error().message;

  EXPECT_EQ(report->transactionCount, 2u);
  EXPECT_EQ(report->status, Reconciler::ReportStatus::DISCREPANCY_FOUND);
  EXPECT_EQ(countType(*report, "balance_mismatch"), 0u);
  EXPECT_EQ(countType(*report, "amount_mismatch"), 1u);
  EXPECT_EQ(countType(*report, "missing_at_gateway"), 1u);
  EXPECT_EQ(countType(*report, "missing_in_ledger"), 2u);
  EXPECT_EQ(report->discrepancies.size(), 4u);

  for (const auto &discrepancy : report->discrepancies) {
    if (discrepancy.type == "amount_mismatch") {
      EXPECT_EQ(discrepancy.externalId, mismatched);
      EXPECT_EQ(discrepancy.internalAmount, 5000);
      EXPECT_EQ(discrepancy.externalAmount, 4000);
    } else if (discrepancy.type == "missing_at_gateway") {
      EXPECT_EQ(discrepancy.externalId, missingAtGateway);
    } else if (discrepancy.externalId == stillPending) {
      EXPECT_FALSE(discrepancy.entryId.empty());
    } else {
      EXPECT_EQ(discrepancy.externalId, "pay-unknown");
      EXPECT_TRUE(discrepancy.entryId.empty());
    }
  }
}

TEST_F(ReconcilerTest, ReconcileReportsStalePending) {
  cashIn("order-1", 5000, Status::PENDING);
  now_ += 25 * 3600;

  auto report = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(report.isOk());
  ASSERT_EQ(report->discrepancies.size(), 1u);
  EXPECT_EQ(report->discrepancies[0].type, "stale_pending");
  EXPECT_EQ(report->discrepancies[0].internalAmount, 5000);
}

TEST_F(ReconcilerTest, CleanReconciliationIsStored) {
  auto externalId = cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 5000;
  gateway_.statement.push_back(item(externalId, 5000, Status::COMPLETED));

  auto report = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(report.isOk());
  EXPECT_EQ(report->status, Reconciler::ReportStatus::RECONCILED);
  EXPECT_TRUE(report->discrepancies.empty());
  EXPECT_EQ(report->id.substr(0, 4), "rec_");

  auto reports = reconciler().listReports(1);
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].id, report->id);
  EXPECT_TRUE(reconciler().listOpenReports().empty());
}

TEST_F(ReconcilerTest, ReconcileRejectsBadRequests) {
  auto inverted = reconciler().reconcile(1, now_, now_ - 1);
  ASSERT_TRUE(inverted.isError());
  EXPECT_EQ(inverted.error().code, err::E_INVALID_INPUT);

  auto unknown = reconciler().reconcile(9, now_ - 3600, now_);
  ASSERT_TRUE(unknown.isError());
  EXPECT_EQ(unknown.error().code, err::E_TENANT);

  auto suspended = reconciler().syncBalance(2);
  ASSERT_TRUE(suspended.isError());
  EXPECT_EQ(suspended.error().code, err::E_TENANT);
  EXPECT_TRUE(gateway_.balanceQueries.empty());
}

TEST_F(ReconcilerTest, GatewayReadsAreRetried) {
  gateway_.queueBalance(FakeGateway::failure(err::E_GATEWAY_TIMEOUT));
  gateway_.queueBalance(FakeGateway::failure(err::E_GATEWAY_NETWORK));

  auto result = reconciler().syncBalance(1);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result->isReconciled);
  EXPECT_EQ(gateway_.balanceQueries.size(), 3u);
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{ 200, 400 }));
}

TEST_F(ReconcilerTest, GatewayFailureAbortsWithoutReport) {
  for (int i = 0; i < 3; ++i) {
    gateway_.queueBalance(FakeGateway::failure(err::E_GATEWAY_TIMEOUT));
  }
  auto sync = reconciler().syncBalance(1);
  ASSERT_TRUE(sync.isError());
  EXPECT_EQ(sync.error().code, err::E_GATEWAY_TIMEOUT);

  gateway_.statementError = err::E_AUTHENTICATION;
  auto report = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(report.isError());
  EXPECT_EQ(report.error().code, err::E_AUTHENTICATION);
  EXPECT_EQ(gateway_.statementQueries.size(), 1u);
  EXPECT_TRUE(reconciler().listReports(1).empty());
}

TEST_F(ReconcilerTest, ResolveReport) {
  cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 0;
  auto report = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(report.isOk());
  ASSERT_EQ(report->status, Reconciler::ReportStatus::DISCREPANCY_FOUND);

  EXPECT_EQ(reconciler().resolveReport(report->id, "", "checked").error().code,
            err::E_INVALID_INPUT);
  EXPECT_EQ(reconciler().resolveReport("rec_missing", "ops", "").error().code, err::E_NOT_FOUND);

  now_ += 60;
  auto resolved = reconciler().resolveReport(report->id, "ops@example.com", "settled late");
  ASSERT_TRUE(resolved.isOk());
  EXPECT_EQ(resolved->status, Reconciler::ReportStatus::RESOLVED);
  EXPECT_EQ(resolved->resolvedBy, "ops@example.com");
  EXPECT_EQ(resolved->notes, "settled late");
  EXPECT_EQ(resolved->resolvedAt, now_);
  EXPECT_TRUE(reconciler().listOpenReports().empty());

  auto again = reconciler().resolveReport(report->id, "ops@example.com", "");
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, err::E_INVALID_STATE_TRANSITION);

  auto json = reconciler().getReport(report->id)->toJson();
  EXPECT_EQ(json["status"], "resolved");
  EXPECT_EQ(json["resolvedBy"], "ops@example.com");
  EXPECT_EQ(json["internal"], "50.00");
  EXPECT_EQ(json["external"], "0.00");
}

TEST_F(ReconcilerTest, ReportsSurviveRestart) {
  auto dir = std::filesystem::temp_directory_path() / "payledger_reconciler_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  ASSERT_TRUE(reconciler().init({ dir.string() }).isOk());

  cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 0;
  auto open = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(open.isOk());
  auto disputed = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(disputed.isOk());
  ASSERT_TRUE(reconciler().resolveReport(disputed->id, "ops", "written off").isOk());

  build(Reconciler::Config());
  ASSERT_TRUE(reconciler().init({ dir.string() }).isOk());

  EXPECT_EQ(reconciler().listReports(1).size(), 2u);
  auto openReports = reconciler().listOpenReports();
  ASSERT_EQ(openReports.size(), 1u);
  EXPECT_EQ(openReports[0].id, open->id);
  ASSERT_EQ(openReports[0].discrepancies.size(), open->discrepancies.size());
  EXPECT_EQ(openReports[0].toJson(), open->toJson());

  auto resolved = reconciler().getReport(disputed->id);
  ASSERT_TRUE(resolved.isOk());
  EXPECT_EQ(resolved->status, Reconciler::ReportStatus::RESOLVED);
  EXPECT_EQ(resolved->resolvedBy, "ops");
  EXPECT_EQ(resolved->notes, "written off");

  std::filesystem::remove_all(dir);
}

TEST_F(ReconcilerTest, SettledReportsBeyondLimitAreDropped) {
  Reconciler::Config config;
  config.maxReports = 2;
  build(config);

  auto externalId = cashIn("order-1", 5000, Status::COMPLETED);
  gateway_.balance = 0;
  auto open = reconciler().reconcile(1, now_ - 3600, now_);
  ASSERT_TRUE(open.isOk());
  ASSERT_EQ(open->status, Reconciler::ReportStatus::DISCREPANCY_FOUND);

  gateway_.balance = 5000;
  gateway_.statement.push_back(item(externalId, 5000, Status::COMPLETED));
  std::vector<std::string> clean;
  for (int i = 0; i < 3; ++i) {
    auto report = reconciler().reconcile(1, now_ - 3600, now_);
    ASSERT_TRUE(report.isOk());
    ASSERT_EQ(report->status, Reconciler::ReportStatus::RECONCILED);
    clean.push_back(report->id);
  }

  EXPECT_EQ(reconciler().listReports(1).size(), 3u);
  EXPECT_TRUE(reconciler().getReport(open->id).isOk());
  EXPECT_EQ(reconciler().getReport(clean[0]).error().code, err::E_NOT_FOUND);
  EXPECT_TRUE(reconciler().getReport(clean[1]).isOk());
  EXPECT_TRUE(reconciler().getReport(clean[2]).isOk());
  EXPECT_EQ(reconciler().listOpenReports().size(), 1u);
}

TEST_F(ReconcilerTest, RunOnceSweepsAndSyncsActiveTenants) {
  cashIn("order-1", 5000, Status::PENDING);
  gateway_.queueStatus(Status::COMPLETED);
  gateway_.balance = 5000;

  reconciler().runOnce();

  EXPECT_EQ(store_.getBalance(1), 5000);
  EXPECT_TRUE(store_.listPending(1).empty());
  ASSERT_EQ(gateway_.balanceQueries.size(), 1u);
  EXPECT_EQ(gateway_.balanceQueries[0], "acct-1");
  EXPECT_TRUE(reconciler().listReports(1).empty());
}

TEST_F(ReconcilerTest, RunsAsService) {
  Reconciler::Config config;
  config.intervalSec = 3600;
  build(config);

  ASSERT_TRUE(reconciler().start().isOk());
  EXPECT_TRUE(reconciler().isRunning());
  reconciler().stop();
  EXPECT_FALSE(reconciler().isRunning());
}
