#include "ErrorCodes.h"

namespace pl {
namespace err {

std::string errorName(int32_t code) {
  switch (code) {
  case 0:
    return "";
  case E_INVALID_INPUT:
    return "InvalidInputError";
  case E_NOT_FOUND:
    return "NotFoundError";
  case E_STORAGE:
    return "StorageError";
  case E_TENANT:
    return "TenantLookupError";
  case E_LIMIT_EXCEEDED:
    return "LimitExceededError";
  case E_RATE_LIMITED:
    return "RateLimitedError";
  case E_AUTHENTICATION:
    return "AuthenticationError";
  case E_GATEWAY_TIMEOUT:
    return "GatewayTimeoutError";
  case E_GATEWAY_REJECTED:
    return "GatewayRejectedError";
  case E_GATEWAY_NETWORK:
    return "GatewayNetworkError";
  case E_GATEWAY_PROTOCOL:
    return "GatewayProtocolError";
  case E_INSUFFICIENT_BALANCE:
    return "InsufficientBalanceError";
  case E_DUPLICATE_REFERENCE:
    return "DuplicateReferenceError";
  case E_INVALID_WEBHOOK_SIGNATURE:
    return "InvalidWebhookSignatureError";
  case E_INVALID_STATE_TRANSITION:
    return "InvalidStateTransitionError";
  case E_RECONCILIATION_MISMATCH:
    return "ReconciliationMismatchError";
  default:
    return "UnknownError";
  }
}

} // namespace err
} // namespace pl
