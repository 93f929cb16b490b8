#include "../CelcoinGateway.h"
#include "../HttplibClient.h"
#include "ErrorCodes.h"
#include "Utilities.h"
#include <gtest/gtest.h>

#include <deque>
#include <memory>

using namespace pl;

namespace {

/** Scripted HTTP client: replies are consumed in order, requests are kept */
class ScriptedHttpClient : public IHttpClient {
public:
  struct Call {
    std::string method;
    std::string path;
    Headers headers;
    std::string body;
  };

  void reply(int status, const std::string &body) {
    replies_.push_back(Response{ status, body });
  }

  void fail(int32_t code) { replies_.push_back(Error(code, "transport failure")); }

  Roe<Response> get(const std::string &path, const Headers &headers) override {
    calls.push_back({ "GET", path, headers, "" });
    return next();
  }

  Roe<Response> post(const std::string &path, const Headers &headers,
                     const std::string &jsonBody) override {
    calls.push_back({ "POST", path, headers, jsonBody });
    return next();
  }

  std::string header(size_t callIndex, const std::string &name) const {
    for (const auto &[key, value] : calls.at(callIndex).headers) {
      if (key == name) {
        return value;
      }
    }
    return "";
  }

  std::vector<Call> calls;

private:
  Roe<Response> next() {
    if (replies_.empty()) {
      return Error(err::E_GATEWAY_NETWORK, "no scripted reply");
    }
    Roe<Response> front = replies_.front();
    replies_.pop_front();
    return front;
  }

  std::deque<Roe<Response>> replies_;
};

const char *TOKEN_REPLY = R"({"access_token":"tok-1","expires_in":3600})";

} // namespace

class CelcoinGatewayTest : public ::testing::Test {
protected:
  void SetUp() override {
    spHttp_ = std::make_shared<ScriptedHttpClient>();
    config_.clientId = "client";
    config_.clientSecret = "secret";
    config_.webhookSecret = "whsec";
    now_ = 1714564800;
  }

  std::unique_ptr<CelcoinGateway> makeGateway() {
    return std::make_unique<CelcoinGateway>(spHttp_, config_, [this] { return now_; });
  }

  IGateway::PaymentRequest pixRequest() const {
    IGateway::PaymentRequest request;
    request.accountId = "acc-1";
    request.correlationId = "ci_abc";
    request.amount = 15075;
    request.method = IGateway::PaymentMethod::PIX;
    request.payer = { "Ana", "ana@example.com", "12345678900" };
    request.description = "order 42";
    return request;
  }

  std::shared_ptr<ScriptedHttpClient> spHttp_;
  CelcoinGateway::Config config_;
  int64_t now_{ 0 };
};

TEST_F(CelcoinGatewayTest, AuthenticateStoresToken) {
  spHttp_->reply(200, TOKEN_REPLY);
  auto gateway = makeGateway();
  ASSERT_TRUE(gateway->authenticate().isOk());
  EXPECT_TRUE(gateway->hasValidToken());

  ASSERT_EQ(spHttp_->calls.size(), 1u);
  EXPECT_EQ(spHttp_->calls[0].path, "/token");
  auto body = nlohmann::json::parse(spHttp_->calls[0].body);
  EXPECT_EQ(body["client_id"], "client");
  EXPECT_EQ(body["grant_type"], "client_credentials");
}

TEST_F(CelcoinGatewayTest, AuthenticationRejectedIsAuthError) {
  spHttp_->reply(400, R"({"message":"bad client"})");
  auto gateway = makeGateway();
  auto result = gateway->authenticate();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, err::E_AUTHENTICATION);
  EXPECT_NE(result.error().message.find("bad client"), std::string::npos);
  EXPECT_FALSE(gateway->hasValidToken());
}

TEST_F(CelcoinGatewayTest, TokenRefreshedInsideSafetyMargin) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(200, R"({"status":"paid"})");
  spHttp_->reply(200, R"({"access_token":"tok-2","expires_in":3600})");
  spHttp_->reply(200, R"({"status":"paid"})");
  auto gateway = makeGateway();

  ASSERT_TRUE(gateway->getStatus("gw-1").isOk());
  now_ += 3600 - 30; // inside the 60s margin
  ASSERT_TRUE(gateway->getStatus("gw-1").isOk());

  ASSERT_EQ(spHttp_->calls.size(), 4u);
  EXPECT_EQ(spHttp_->calls[2].path, "/token");
  EXPECT_EQ(spHttp_->header(3, "Authorization"), "Bearer tok-2");
}

TEST_F(CelcoinGatewayTest, UnauthorizedCallReauthenticatesOnce) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(401, "");
  spHttp_->reply(200, R"({"access_token":"tok-2","expires_in":3600})");
  spHttp_->reply(200, R"({"status":"completed"})");
  auto gateway = makeGateway();

  auto status = gateway->getStatus("gw-1");
  ASSERT_TRUE(status.isOk()) << status.error().message;
  EXPECT_EQ(*status, IGateway::Status::COMPLETED);
  EXPECT_EQ(spHttp_->header(3, "Authorization"), "Bearer tok-2");
}

TEST_F(CelcoinGatewayTest, RepeatedUnauthorizedIsAuthError) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(401, "");
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(401, "");
  auto gateway = makeGateway();

  auto status = gateway->getStatus("gw-1");
  ASSERT_TRUE(status.isError());
  EXPECT_EQ(status.error().code, err::E_AUTHENTICATION);
}

TEST_F(CelcoinGatewayTest, CreatePixPaymentMapsResponse) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(201, R"({"transactionId":"gw-100","status":"pending",
                          "pixCopiaECola":"000201...","expirationDate":"2024-05-01T13:00:00Z"})");
  auto gateway = makeGateway();

  auto payment = gateway->createPayment(pixRequest());
  ASSERT_TRUE(payment.isOk()) << payment.error().message;
  EXPECT_EQ(payment->externalId, "gw-100");
  EXPECT_EQ(payment->status, IGateway::Status::PENDING);
  EXPECT_EQ(payment->qrOrBarcode, "000201...");
  EXPECT_EQ(payment->expiresAt, 1714568400);
  EXPECT_EQ(payment->httpStatus, 201);

  ASSERT_EQ(spHttp_->calls.size(), 2u);
  EXPECT_EQ(spHttp_->calls[1].path, "/pix/payment");
  auto body = nlohmann::json::parse(spHttp_->calls[1].body);
  EXPECT_DOUBLE_EQ(body["amount"].get<double>(), 150.75);
  EXPECT_EQ(body["correlationID"], "ci_abc");
  EXPECT_EQ(body["payer"]["cpf"], "12345678900");
}

TEST_F(CelcoinGatewayTest, BoletoPaymentCarriesDueDate) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(200, R"({"id":"gw-200","status":"pending","digitableLine":"23790.1234"})");
  auto gateway = makeGateway();

  auto request = pixRequest();
  request.method = IGateway::PaymentMethod::BOLETO;
  auto payment = gateway->createPayment(request);
  ASSERT_TRUE(payment.isOk());
  EXPECT_EQ(payment->qrOrBarcode, "23790.1234");
  auto body = nlohmann::json::parse(spHttp_->calls[1].body);
  EXPECT_EQ(spHttp_->calls[1].path, "/boleto/payment");
  EXPECT_EQ(body["expiresDate"], "2024-05-04");
}

TEST_F(CelcoinGatewayTest, CardPaymentIsNotOffered) {
  auto gateway = makeGateway();
  auto request = pixRequest();
  request.method = IGateway::PaymentMethod::CREDIT_CARD;
  auto payment = gateway->createPayment(request);
  ASSERT_TRUE(payment.isError());
  EXPECT_EQ(payment.error().code, err::E_INVALID_INPUT);
  EXPECT_TRUE(spHttp_->calls.empty());
}

TEST_F(CelcoinGatewayTest, HttpStatusClassification) {
  auto gateway = makeGateway();

  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(422, R"({"message":"invalid pix key"})");
  auto rejected = gateway->createPayment(pixRequest());
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, err::E_GATEWAY_REJECTED);

  spHttp_->reply(503, "Service Unavailable");
  auto unavailable = gateway->createPayment(pixRequest());
  ASSERT_TRUE(unavailable.isError());
  EXPECT_EQ(unavailable.error().code, err::E_GATEWAY_TIMEOUT);

  spHttp_->reply(200, "not json");
  auto garbled = gateway->createPayment(pixRequest());
  ASSERT_TRUE(garbled.isError());
  EXPECT_EQ(garbled.error().code, err::E_GATEWAY_PROTOCOL);

  spHttp_->reply(200, R"({"status":"pending"})");
  auto noId = gateway->createPayment(pixRequest());
  ASSERT_TRUE(noId.isError());
  EXPECT_EQ(noId.error().code, err::E_GATEWAY_PROTOCOL);

  spHttp_->fail(err::E_GATEWAY_TIMEOUT);
  auto timeout = gateway->createPayment(pixRequest());
  ASSERT_TRUE(timeout.isError());
  EXPECT_EQ(timeout.error().code, err::E_GATEWAY_TIMEOUT);
}

TEST_F(CelcoinGatewayTest, WithdrawalReportsFee) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(200, R"({"transactionId":"gw-300","status":"processing","fee":"1.50"})");
  auto gateway = makeGateway();

  IGateway::WithdrawalRequest request;
  request.accountId = "acc-1";
  request.correlationId = "co_1";
  request.amount = 10000;
  request.bankAccount = { "001", "1234", "56789-0", "", "Ana", "12345678900" };
  auto withdrawal = gateway->createWithdrawal(request);
  ASSERT_TRUE(withdrawal.isOk()) << withdrawal.error().message;
  EXPECT_EQ(withdrawal->externalId, "gw-300");
  EXPECT_EQ(withdrawal->status, IGateway::Status::PENDING);
  EXPECT_EQ(withdrawal->fee, 150);

  auto body = nlohmann::json::parse(spHttp_->calls[1].body);
  EXPECT_EQ(spHttp_->calls[1].path, "/account/withdrawal");
  EXPECT_EQ(body["bankAccount"]["accountType"], "checking");
  EXPECT_EQ(body["bankAccount"]["accountHolder"]["name"], "Ana");
}

TEST_F(CelcoinGatewayTest, BalanceAndStatement) {
  spHttp_->reply(200, TOKEN_REPLY);
  spHttp_->reply(200, R"({"available":1234.56})");
  spHttp_->reply(200, R"({"transactions":[
      {"id":"gw-1","amount":"100.00","status":"paid","type":"pix_in","createdAt":"2024-05-01T10:00:00Z"},
      {"id":"gw-2","amount":"40.00","status":"completed","type":"withdrawal","createdAt":"2024-05-01T11:00:00Z"},
      {"id":"gw-3","amount":"5.00","status":"paid","createdAt":"2024-04-01T00:00:00Z"},
      {"amount":"1.00"}
    ]})");
  auto gateway = makeGateway();

  auto balance = gateway->getBalance("acc-1");
  ASSERT_TRUE(balance.isOk());
  EXPECT_EQ(*balance, 123456);
  EXPECT_EQ(spHttp_->calls[1].path, "/account/acc-1/balance");

  auto items = gateway->listTransactions("acc-1", now_ - 86400, now_);
  ASSERT_TRUE(items.isOk()) << items.error().message;
  ASSERT_EQ(items->size(), 2u);
  EXPECT_EQ((*items)[0].amount, 10000);
  EXPECT_EQ((*items)[0].status, IGateway::Status::COMPLETED);
  EXPECT_EQ((*items)[1].amount, -4000);
  EXPECT_EQ(spHttp_->calls[2].path,
            "/account/acc-1/statement?startDate=2024-04-30&endDate=2024-05-01");
}

TEST_F(CelcoinGatewayTest, StatusMapping) {
  EXPECT_EQ(CelcoinGateway::mapStatus("PAID"), IGateway::Status::COMPLETED);
  EXPECT_EQ(CelcoinGateway::mapStatus("approved"), IGateway::Status::COMPLETED);
  EXPECT_EQ(CelcoinGateway::mapStatus("expired"), IGateway::Status::FAILED);
  EXPECT_EQ(CelcoinGateway::mapStatus("Cancelled"), IGateway::Status::FAILED);
  EXPECT_EQ(CelcoinGateway::mapStatus("processing"), IGateway::Status::PENDING);
  EXPECT_EQ(CelcoinGateway::mapStatus(""), IGateway::Status::PENDING);
}

TEST_F(CelcoinGatewayTest, WebhookSignatureVerification) {
  auto gateway = makeGateway();
  std::string payload = R"({"transactionId":"gw-1","status":"paid"})";
  std::string signature = utl::hmacSha256Hex("whsec", payload);

  EXPECT_TRUE(gateway->verifyWebhookSignature(payload, signature));
  EXPECT_TRUE(gateway->verifyWebhookSignature(payload, "sha256=" + signature));
  EXPECT_FALSE(gateway->verifyWebhookSignature(payload + " ", signature));
  EXPECT_FALSE(gateway->verifyWebhookSignature(payload, ""));
  EXPECT_FALSE(gateway->verifyWebhookSignature(payload, utl::hmacSha256Hex("other", payload)));

  config_.webhookSecret.clear();
  auto unconfigured = makeGateway();
  EXPECT_FALSE(unconfigured->verifyWebhookSignature(payload, signature));
}

TEST_F(CelcoinGatewayTest, ParseWebhookEnvelopeAndFlat) {
  auto gateway = makeGateway();

  auto wrapped = gateway->parseWebhook(
      R"({"event":"payment.updated","data":{"transactionId":"gw-1","correlationId":"ci_9",
          "status":"paid","amount":"12.34","timestamp":"2024-05-01T12:00:00Z"}})");
  ASSERT_TRUE(wrapped.isOk()) << wrapped.error().message;
  EXPECT_EQ(wrapped->gatewayTransactionId, "gw-1");
  EXPECT_EQ(wrapped->correlationId, "ci_9");
  EXPECT_EQ(wrapped->status, IGateway::Status::COMPLETED);
  EXPECT_EQ(wrapped->amount, 1234);
  EXPECT_EQ(wrapped->occurredAt, 1714564800);

  auto flat = gateway->parseWebhook(R"({"id":"gw-2","status":"failed"})");
  ASSERT_TRUE(flat.isOk());
  EXPECT_EQ(flat->status, IGateway::Status::FAILED);
  EXPECT_TRUE(flat->correlationId.empty());

  auto notJson = gateway->parseWebhook("{oops");
  ASSERT_TRUE(notJson.isError());
  EXPECT_EQ(notJson.error().code, err::E_INVALID_INPUT);

  auto noId = gateway->parseWebhook(R"({"status":"paid"})");
  ASSERT_TRUE(noId.isError());
  EXPECT_EQ(noId.error().code, err::E_GATEWAY_PROTOCOL);
}

TEST(HttplibClientTest, SplitBaseUrl) {
  std::string origin;
  std::string prefix;
  ASSERT_TRUE(HttplibClient::splitBaseUrl("https://sandbox.openfinance.celcoin.dev/v5/", origin,
                                          prefix));
  EXPECT_EQ(origin, "https://sandbox.openfinance.celcoin.dev");
  EXPECT_EQ(prefix, "/v5");

  ASSERT_TRUE(HttplibClient::splitBaseUrl("http://localhost:8080", origin, prefix));
  EXPECT_EQ(origin, "http://localhost:8080");
  EXPECT_EQ(prefix, "");

  EXPECT_FALSE(HttplibClient::splitBaseUrl("localhost:8080", origin, prefix));
  EXPECT_FALSE(HttplibClient::splitBaseUrl("https://", origin, prefix));
}

TEST(HttplibClientTest, InitRejectsBadConfig) {
  HttplibClient client;
  HttplibClient::Config config;
  config.baseUrl = "not a url";
  EXPECT_TRUE(client.init(config).isError());

  config.baseUrl = "http://localhost:1";
  config.timeoutMs = 0;
  EXPECT_TRUE(client.init(config).isError());
}
