#pragma once

#include "IHttpClient.hpp"
#include "Module.h"

#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
class Client;
}

namespace pl {

/**
 * IHttpClient over cpp-httplib. HTTPS base URLs need the library built
 * with OpenSSL support. Each call uses its own connection so concurrent
 * callers never queue behind one another.
 */
class HttplibClient : public IHttpClient, public Module {
public:
  struct Config {
    std::string baseUrl;       // scheme://host[:port][/prefix]
    int64_t timeoutMs{ 30000 }; // connect, read and write each
  };

  HttplibClient();
  ~HttplibClient() override;

  Roe<void> init(const Config &config);

  Roe<Response> get(const std::string &path, const Headers &headers) override;
  Roe<Response> post(const std::string &path, const Headers &headers,
                     const std::string &jsonBody) override;

  /**
   * Split a base URL into origin ("https://host:443") and path prefix ("/v5")
   * @return false if the URL has no scheme or host
   */
  static bool splitBaseUrl(const std::string &baseUrl, std::string &origin,
                           std::string &prefix);

private:
  std::unique_ptr<httplib::Client> makeClient() const;

  std::string origin_;
  std::string prefix_;
  int64_t timeoutMs_{ 30000 };
  bool initialized_{ false };
};

} // namespace pl
