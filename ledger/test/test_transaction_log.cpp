#include "../TransactionLog.h"
#include "ErrorCodes.h"
#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>

using namespace pl;

class TransactionLogTest : public ::testing::Test {
protected:
  using Record = TransactionLog::Record;
  using Update = TransactionLog::Update;
  using OperationType = TransactionLog::OperationType;

  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "payledger_txlog_test";
    std::filesystem::remove_all(testDir_);
    std::filesystem::create_directories(testDir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  static Record makeRow(const std::string &correlationId, uint64_t tenantId,
                        const std::string &referenceId,
                        OperationType type = OperationType::PAYMENT) {
    Record row;
    row.correlationId = correlationId;
    row.tenantId = tenantId;
    row.referenceId = referenceId;
    row.operationType = type;
    row.amount = 1500;
    row.requestPayload = { { "amount", "15.00" } };
    return row;
  }

  std::filesystem::path testDir_;
};

TEST_F(TransactionLogTest, RecordAssignsIdAndTimestamps) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());

  auto id = txLog.record(makeRow("ci_1", 1, "order-1"));
  ASSERT_TRUE(id.isOk());
  EXPECT_EQ(id->rfind("tl_", 0), 0u);

  auto row = txLog.find("ci_1");
  ASSERT_TRUE(row.isOk());
  EXPECT_EQ(row->id, *id);
  EXPECT_GT(row->createdAt, 0);
  EXPECT_EQ(row->createdAt, row->updatedAt);
  EXPECT_EQ(row->amount, 1500);
}

TEST_F(TransactionLogTest, CorrelationIdIsUnique) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_1", 1, "a")).isOk());
  auto duplicate = txLog.record(makeRow("ci_1", 1, "b"));
  ASSERT_TRUE(duplicate.isError());
  EXPECT_EQ(duplicate.error().code, err::E_DUPLICATE_REFERENCE);

  auto empty = txLog.record(makeRow("", 1, "c"));
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, err::E_INVALID_INPUT);
}

TEST_F(TransactionLogTest, UpdateMergesPartialFields) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("co_1", 2, "w-1", OperationType::WITHDRAWAL)).isOk());

  Update first;
  first.gatewayTransactionId = "gw-9";
  first.httpStatus = 201;
  first.gatewayStatus = "pending";
  first.responsePayload = nlohmann::json{ { "transactionId", "gw-9" } };
  first.errorMessage = "slow";
  ASSERT_TRUE(txLog.update("co_1", first).isOk());

  Update second;
  second.gatewayStatus = "completed";
  second.isSuccessful = true;
  second.fee = 150;
  second.responsePayload = nlohmann::json{ { "webhook", { { "status", "paid" } } } };
  second.errorMessage = "retried";
  auto merged = txLog.update("co_1", second);
  ASSERT_TRUE(merged.isOk());

  EXPECT_EQ(merged->gatewayTransactionId, "gw-9");
  EXPECT_EQ(merged->httpStatus, 201);
  EXPECT_EQ(merged->gatewayStatus, "completed");
  EXPECT_TRUE(merged->isSuccessful);
  EXPECT_EQ(merged->fee, 150);
  EXPECT_EQ(merged->responsePayload["transactionId"], "gw-9");
  EXPECT_EQ(merged->responsePayload["webhook"]["status"], "paid");
  EXPECT_EQ(merged->errorMessage, "slow; retried");

  auto byGateway = txLog.findByGatewayId("gw-9");
  ASSERT_TRUE(byGateway.isOk());
  EXPECT_EQ(byGateway->correlationId, "co_1");
}

TEST_F(TransactionLogTest, GatewayIdCannotBeRebound) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_1", 1, "a")).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_2", 1, "b")).isOk());

  Update bind;
  bind.gatewayTransactionId = "gw-1";
  ASSERT_TRUE(txLog.update("ci_1", bind).isOk());

  auto taken = txLog.update("ci_2", bind);
  ASSERT_TRUE(taken.isError());
  EXPECT_EQ(taken.error().code, err::E_DUPLICATE_REFERENCE);

  Update rebind;
  rebind.gatewayTransactionId = "gw-2";
  auto conflict = txLog.update("ci_1", rebind);
  ASSERT_TRUE(conflict.isError());
  EXPECT_EQ(conflict.error().code, err::E_INVALID_STATE_TRANSITION);
}

TEST_F(TransactionLogTest, RepeatedWebhookHashIsNoOp) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_1", 1, "a")).isOk());

  Update webhook;
  webhook.webhookReceived = true;
  webhook.webhookPayloadHash = "hash-1";
  webhook.webhookTimestamp = 100;
  webhook.gatewayStatus = "completed";
  auto applied = txLog.update("ci_1", webhook);
  ASSERT_TRUE(applied.isOk());
  int64_t updatedAt = applied->updatedAt;

  webhook.gatewayStatus = "failed";
  auto replay = txLog.update("ci_1", webhook);
  ASSERT_TRUE(replay.isOk());
  EXPECT_EQ(replay->gatewayStatus, "completed");
  EXPECT_EQ(replay->updatedAt, updatedAt);
}

TEST_F(TransactionLogTest, UpdateUnknownRowIsNotFound) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  auto missing = txLog.update("nope", Update());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, err::E_NOT_FOUND);
  EXPECT_TRUE(txLog.updateByGatewayId("gw-x", Update()).isError());
}

TEST_F(TransactionLogTest, LatestByReferenceAndTenantListing) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_1", 1, "order")).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_2", 1, "order")).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_3", 2, "order")).isOk());

  auto latest = txLog.findLatestByReference(1, OperationType::PAYMENT, "order");
  ASSERT_TRUE(latest.isOk());
  EXPECT_EQ(latest->correlationId, "ci_2");
  EXPECT_TRUE(txLog.findLatestByReference(1, OperationType::WITHDRAWAL, "order").isError());

  auto rows = txLog.listByTenant(1, 0, INT64_MAX);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].correlationId, "ci_1");
}

TEST_F(TransactionLogTest, OrphanListingReturnsWebhookRows) {
  TransactionLog txLog;
  ASSERT_TRUE(txLog.init({}).isOk());
  ASSERT_TRUE(txLog.record(makeRow("ci_1", 1, "a")).isOk());
  ASSERT_TRUE(txLog.record(makeRow("orphan:gw-77", 0, "", OperationType::WEBHOOK)).isOk());

  auto orphans = txLog.listOrphans();
  ASSERT_EQ(orphans.size(), 1u);
  EXPECT_EQ(orphans[0].correlationId, "orphan:gw-77");
}

TEST_F(TransactionLogTest, RowsSurviveReopen) {
  TransactionLog::InitConfig config;
  config.workDir = testDir_.string();
  {
    TransactionLog txLog;
    ASSERT_TRUE(txLog.init(config).isOk());
    ASSERT_TRUE(txLog.record(makeRow("ci_1", 3, "order")).isOk());
    Update update;
    update.gatewayTransactionId = "gw-1";
    update.gatewayStatus = "completed";
    update.isSuccessful = true;
    ASSERT_TRUE(txLog.update("ci_1", update).isOk());
  }

  TransactionLog reopened;
  ASSERT_TRUE(reopened.init(config).isOk());
  auto row = reopened.findByGatewayId("gw-1");
  ASSERT_TRUE(row.isOk());
  EXPECT_EQ(row->correlationId, "ci_1");
  EXPECT_EQ(row->gatewayStatus, "completed");
  EXPECT_TRUE(row->isSuccessful);
  EXPECT_EQ(row->requestPayload["amount"], "15.00");

  auto duplicate = reopened.record(makeRow("ci_1", 3, "order"));
  ASSERT_TRUE(duplicate.isError());
}
