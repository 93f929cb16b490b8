#ifndef PAYLEDGER_ERROR_CODES_H
#define PAYLEDGER_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace pl {
namespace err {

// Shared error taxonomy. Components report these codes through their own
// RoeErrorBase-derived Error types so callers can branch on the kind of
// failure without caring which layer raised it.
constexpr int32_t E_INVALID_INPUT = 1;
constexpr int32_t E_NOT_FOUND = 2;
constexpr int32_t E_STORAGE = 3;
constexpr int32_t E_TENANT = 4;
constexpr int32_t E_LIMIT_EXCEEDED = 5;
constexpr int32_t E_RATE_LIMITED = 6;

constexpr int32_t E_AUTHENTICATION = 101;
constexpr int32_t E_GATEWAY_TIMEOUT = 102;
constexpr int32_t E_GATEWAY_REJECTED = 103;
constexpr int32_t E_GATEWAY_NETWORK = 104;
constexpr int32_t E_GATEWAY_PROTOCOL = 105;

constexpr int32_t E_INSUFFICIENT_BALANCE = 201;
constexpr int32_t E_DUPLICATE_REFERENCE = 202;
constexpr int32_t E_INVALID_WEBHOOK_SIGNATURE = 203;
constexpr int32_t E_INVALID_STATE_TRANSITION = 204;
constexpr int32_t E_RECONCILIATION_MISMATCH = 205;

/** Taxonomy name for a code, e.g. "InsufficientBalanceError". */
std::string errorName(int32_t code);

/** True for gateway errors where the request may have reached the provider. */
inline bool isAmbiguousGatewayError(int32_t code) {
  return code == E_GATEWAY_TIMEOUT;
}

/** True for errors worth retrying on idempotent gateway calls. */
inline bool isTransientGatewayError(int32_t code) {
  return code == E_GATEWAY_TIMEOUT || code == E_GATEWAY_NETWORK;
}

} // namespace err
} // namespace pl

#endif // PAYLEDGER_ERROR_CODES_H
