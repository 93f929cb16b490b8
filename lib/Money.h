#ifndef PAYLEDGER_MONEY_H
#define PAYLEDGER_MONEY_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pl {

/** Signed amount in minor currency units (cents). */
using Amount = int64_t;

namespace money {

constexpr Amount UNIT = 100;

/** Largest magnitude accepted by parse(), keeps sums far from overflow. */
constexpr Amount MAX_AMOUNT = 1000000000000000LL;

/**
 * Parse a decimal string ("100", "-12.5", "+0.01") into minor units.
 * Up to two fractional digits; surrounding whitespace is ignored.
 * @return false on malformed input or when |value| exceeds MAX_AMOUNT
 */
bool parse(const std::string &str, Amount &amount);

/** Render with exactly two fractional digits, e.g. -1234 -> "-12.34". */
std::string format(Amount amount);

/**
 * Read an amount from a JSON value: a decimal string, an integer, or a
 * floating point number with no more than two decimals.
 */
bool fromJson(const nlohmann::json &value, Amount &amount);

} // namespace money
} // namespace pl

#endif // PAYLEDGER_MONEY_H
