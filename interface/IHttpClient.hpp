#pragma once

#include "ResultOrError.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pl {

/**
 * Minimal outbound HTTP client, relative to a fixed base URL.
 * Transport failures are errors (E_GATEWAY_NETWORK when the request was
 * never sent, E_GATEWAY_TIMEOUT when it may have reached the server);
 * any HTTP status is a successful Response.
 */
class IHttpClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  using Headers = std::vector<std::pair<std::string, std::string>>;

  struct Response {
    int status{ 0 };
    std::string body;
  };

  virtual ~IHttpClient() = default;

  virtual Roe<Response> get(const std::string &path, const Headers &headers) = 0;
  virtual Roe<Response> post(const std::string &path, const Headers &headers,
                             const std::string &jsonBody) = 0;
};

} // namespace pl
