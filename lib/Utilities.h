#ifndef PAYLEDGER_UTILITIES_H
#define PAYLEDGER_UTILITIES_H

#include <string>
#include <cstdint>
#include <vector>
#include "ResultOrError.hpp"
#include <nlohmann/json.hpp>

namespace pl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/** Current time in milliseconds since the epoch */
int64_t getCurrentTimeMs();

/**
 * Format a unix timestamp as ISO-8601 UTC ("2024-05-01T12:00:00Z")
 */
std::string formatIso8601(int64_t unixSeconds);

/** Format the UTC calendar date of a unix timestamp ("2024-05-01") */
std::string formatDate(int64_t unixSeconds);

/**
 * Parse an ISO-8601 UTC timestamp. Accepts "YYYY-MM-DDTHH:MM:SS" with an
 * optional fractional part and an optional trailing "Z", or a bare date.
 * @return true if parsing succeeded
 */
bool parseIso8601(const std::string &str, int64_t &unixSeconds);

/** Unix timestamp of 00:00:00 UTC of the day containing the given time */
int64_t startOfUtcDay(int64_t unixSeconds);

/**
 * Parse an integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a 64-bit signed integer from a string
 * @return true if parsing succeeded, false otherwise
 */
bool parseInt64(const std::string &str, int64_t &value);

/**
 * Parse a 64-bit unsigned integer from a string
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON object or error
 */
pl::Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Parse a JSON request body; the body must be a JSON object
 */
pl::Roe<nlohmann::json> parseJsonObject(const std::string &body);

/**
 * Read an environment variable
 * @return Its value, or defaultValue when unset or empty
 */
std::string getEnv(const std::string &name, const std::string &defaultValue);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Hexadecimal string representation of the SHA-256 hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * HMAC-SHA256 of data under key (OpenSSL)
 * @return Lowercase hex digest
 */
std::string hmacSha256Hex(const std::string &key, const std::string &data);

/**
 * Compare two strings without early exit on the first differing byte.
 * Strings of different length compare unequal.
 */
bool constantTimeEquals(const std::string &a, const std::string &b);

/**
 * Random bytes from libsodium, hex encoded
 * @param numBytes Number of random bytes (output has twice as many chars)
 */
std::string randomHex(size_t numBytes);

/**
 * Encode binary data as hex string
 * @param data Raw bytes
 * @return Lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/** Lowercase copy of an ASCII string */
std::string toLower(const std::string &s);

} // namespace utl
} // namespace pl

#endif // PAYLEDGER_UTILITIES_H
