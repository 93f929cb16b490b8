#ifndef PAYLEDGER_TENANT_DIRECTORY_H
#define PAYLEDGER_TENANT_DIRECTORY_H

#include "Module.h"
#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pl {

/**
 * TenantDirectory - maps tenants to their account at the settlement provider.
 *
 * Accounts are provisioned out of band (configuration); only accounts in the
 * active state resolve. Everything else is reported as E_TENANT.
 */
class TenantDirectory : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  enum class AccountStatus { ACTIVE, PENDING, SUSPENDED };

  static const char *toString(AccountStatus status);
  static bool parseAccountStatus(const std::string &str, AccountStatus &status);

  struct GatewayAccount {
    uint64_t tenantId{ 0 };
    std::string externalAccountId;
    AccountStatus status{ AccountStatus::PENDING };

    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json &j);
  };

  TenantDirectory();
  ~TenantDirectory() override = default;

  /** Register an account; a tenant has at most one */
  Roe<void> add(const GatewayAccount &account);

  /** Change the status of a registered account */
  Roe<void> setStatus(uint64_t tenantId, AccountStatus status);

  /** Load accounts from a JSON array of GatewayAccount objects */
  Roe<void> load(const nlohmann::json &accounts);

  Roe<GatewayAccount> get(uint64_t tenantId) const;

  /** External account id of an active tenant */
  Roe<std::string> resolve(uint64_t tenantId) const;

  std::vector<uint64_t> listActiveTenants() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<uint64_t, GatewayAccount> accounts_;
};

} // namespace pl

#endif // PAYLEDGER_TENANT_DIRECTORY_H
