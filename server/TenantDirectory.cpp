#include "TenantDirectory.h"
#include "ErrorCodes.h"

namespace pl {

const char *TenantDirectory::toString(AccountStatus status) {
  switch (status) {
  case AccountStatus::ACTIVE:
    return "active";
  case AccountStatus::SUSPENDED:
    return "suspended";
  default:
    return "pending";
  }
}

bool TenantDirectory::parseAccountStatus(const std::string &str, AccountStatus &status) {
  if (str == "active") {
    status = AccountStatus::ACTIVE;
  } else if (str == "pending") {
    status = AccountStatus::PENDING;
  } else if (str == "suspended") {
    status = AccountStatus::SUSPENDED;
  } else {
    return false;
  }
  return true;
}

nlohmann::json TenantDirectory::GatewayAccount::toJson() const {
  nlohmann::json j;
  j["tenantId"] = tenantId;
  j["externalAccountId"] = externalAccountId;
  j["status"] = TenantDirectory::toString(status);
  return j;
}

bool TenantDirectory::GatewayAccount::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return false;
  }
  if (!j.contains("tenantId") || !j["tenantId"].is_number_unsigned()) {
    return false;
  }
  if (!j.contains("externalAccountId") || !j["externalAccountId"].is_string()) {
    return false;
  }
  tenantId = j["tenantId"].get<uint64_t>();
  externalAccountId = j["externalAccountId"].get<std::string>();
  status = AccountStatus::ACTIVE;
  if (j.contains("status")) {
    if (!j["status"].is_string() ||
        !parseAccountStatus(j["status"].get<std::string>(), status)) {
      return false;
    }
  }
  return tenantId != 0 && !externalAccountId.empty();
}

TenantDirectory::TenantDirectory() : Module("server.tenants") {}

TenantDirectory::Roe<void> TenantDirectory::add(const GatewayAccount &account) {
  if (account.tenantId == 0) {
    return Error(err::E_INVALID_INPUT, "Tenant id must be non-zero");
  }
  if (account.externalAccountId.empty()) {
    return Error(err::E_INVALID_INPUT, "External account id is required");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (accounts_.count(account.tenantId) > 0) {
    return Error(err::E_INVALID_INPUT,
                 "Tenant " + std::to_string(account.tenantId) + " already has an account");
  }
  accounts_[account.tenantId] = account;
  log().info << "Registered tenant " << account.tenantId << " -> "
             << account.externalAccountId << " (" << toString(account.status) << ")";
  return {};
}

TenantDirectory::Roe<void> TenantDirectory::setStatus(uint64_t tenantId, AccountStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(tenantId);
  if (it == accounts_.end()) {
    return Error(err::E_TENANT, "Unknown tenant " + std::to_string(tenantId));
  }
  it->second.status = status;
  log().info << "Tenant " << tenantId << " is now " << toString(status);
  return {};
}

TenantDirectory::Roe<void> TenantDirectory::load(const nlohmann::json &accounts) {
  if (!accounts.is_array()) {
    return Error(err::E_INVALID_INPUT, "Tenant list must be an array");
  }
  for (const auto &item : accounts) {
    GatewayAccount account;
    if (!account.fromJson(item)) {
      return Error(err::E_INVALID_INPUT, "Invalid tenant account: " + item.dump());
    }
    auto result = add(account);
    if (!result) {
      return result;
    }
  }
  return {};
}

TenantDirectory::Roe<TenantDirectory::GatewayAccount>
TenantDirectory::get(uint64_t tenantId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(tenantId);
  if (it == accounts_.end()) {
    return Error(err::E_TENANT, "Unknown tenant " + std::to_string(tenantId));
  }
  return it->second;
}

TenantDirectory::Roe<std::string> TenantDirectory::resolve(uint64_t tenantId) const {
  auto result = get(tenantId);
  if (!result) {
    return result.error();
  }
  if (result->status != AccountStatus::ACTIVE) {
    return Error(err::E_TENANT, "Gateway account of tenant " + std::to_string(tenantId) +
                                    " is " + toString(result->status));
  }
  return result->externalAccountId;
}

std::vector<uint64_t> TenantDirectory::listActiveTenants() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> tenants;
  for (const auto &kv : accounts_) {
    if (kv.second.status == AccountStatus::ACTIVE) {
      tenants.push_back(kv.first);
    }
  }
  return tenants;
}

size_t TenantDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accounts_.size();
}

} // namespace pl
