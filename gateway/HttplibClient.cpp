#include "HttplibClient.h"
#include "ErrorCodes.h"

#include <httplib.h>

namespace pl {

namespace {

httplib::Headers toHttplibHeaders(const IHttpClient::Headers &headers) {
  httplib::Headers result;
  for (const auto &[name, value] : headers) {
    result.emplace(name, value);
  }
  return result;
}

// Connection-level failures mean the request never left; anything after the
// request was written is ambiguous.
int32_t classify(httplib::Error error) {
  switch (error) {
  case httplib::Error::Connection:
  case httplib::Error::ConnectionTimeout:
  case httplib::Error::BindIPAddress:
  case httplib::Error::SSLConnection:
  case httplib::Error::SSLLoadingCerts:
  case httplib::Error::SSLServerVerification:
  case httplib::Error::ProxyConnection:
    return err::E_GATEWAY_NETWORK;
  default:
    return err::E_GATEWAY_TIMEOUT;
  }
}

} // namespace

HttplibClient::HttplibClient() : Module("gateway.http") {}

HttplibClient::~HttplibClient() = default;

bool HttplibClient::splitBaseUrl(const std::string &baseUrl, std::string &origin,
                                 std::string &prefix) {
  auto schemeEnd = baseUrl.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0) {
    return false;
  }
  auto pathStart = baseUrl.find('/', schemeEnd + 3);
  origin = baseUrl.substr(0, pathStart);
  prefix = pathStart == std::string::npos ? std::string() : baseUrl.substr(pathStart);
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.pop_back();
  }
  return origin.size() > schemeEnd + 3;
}

HttplibClient::Roe<void> HttplibClient::init(const Config &config) {
  if (!splitBaseUrl(config.baseUrl, origin_, prefix_)) {
    return Error(err::E_INVALID_INPUT, "Invalid gateway base URL: " + config.baseUrl);
  }
  if (config.timeoutMs <= 0) {
    return Error(err::E_INVALID_INPUT, "Gateway timeout must be positive");
  }
  timeoutMs_ = config.timeoutMs;

  if (!makeClient()->is_valid()) {
    return Error(err::E_INVALID_INPUT, "Unsupported gateway URL: " + config.baseUrl);
  }
  initialized_ = true;

  log().info << "Gateway HTTP client for " << origin_ << prefix_ << " (timeout "
             << timeoutMs_ << " ms)";
  return {};
}

std::unique_ptr<httplib::Client> HttplibClient::makeClient() const {
  auto upClient = std::make_unique<httplib::Client>(origin_);
  auto timeout = std::chrono::milliseconds(timeoutMs_);
  upClient->set_connection_timeout(timeout);
  upClient->set_read_timeout(timeout);
  upClient->set_write_timeout(timeout);
  return upClient;
}

HttplibClient::Roe<IHttpClient::Response> HttplibClient::get(const std::string &path,
                                                             const Headers &headers) {
  if (!initialized_) {
    return Error(err::E_GATEWAY_NETWORK, "HTTP client is not initialized");
  }
  auto result = makeClient()->Get(prefix_ + path, toHttplibHeaders(headers));
  if (!result) {
    auto error = result.error();
    log().warning << "GET " << path << " failed: " << httplib::to_string(error);
    return Error(classify(error), "GET " + path + " failed: " + httplib::to_string(error));
  }
  log().debug << "GET " << path << " -> " << result->status;
  return Response{ result->status, result->body };
}

HttplibClient::Roe<IHttpClient::Response> HttplibClient::post(const std::string &path,
                                                              const Headers &headers,
                                                              const std::string &jsonBody) {
  if (!initialized_) {
    return Error(err::E_GATEWAY_NETWORK, "HTTP client is not initialized");
  }
  auto result = makeClient()->Post(prefix_ + path, toHttplibHeaders(headers), jsonBody,
                                "application/json");
  if (!result) {
    auto error = result.error();
    log().warning << "POST " << path << " failed: " << httplib::to_string(error);
    return Error(classify(error), "POST " + path + " failed: " + httplib::to_string(error));
  }
  log().debug << "POST " << path << " -> " << result->status;
  return Response{ result->status, result->body };
}

} // namespace pl
