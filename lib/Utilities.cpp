#include "Utilities.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace pl {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
  struct SodiumInitializer {
    SodiumInitializer() {
      if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
      }
    }
  };
  static SodiumInitializer sodium_initializer;

  // Days since 1970-01-01 for a proleptic Gregorian date
  int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
  }

  bool parseFixedDigits(const std::string &str, size_t pos, size_t len, int &out) {
    if (pos + len > str.size()) {
      return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
      if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
        return false;
      }
      value = value * 10 + (str[i] - '0');
    }
    out = value;
    return true;
  }
}

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatIso8601(int64_t unixSeconds) {
  time_t t = static_cast<time_t>(unixSeconds);
  std::tm tmBuf{};
  if (!gmtime_r(&t, &tmBuf)) {
    return std::to_string(unixSeconds);
  }
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf) == 0) {
    return std::to_string(unixSeconds);
  }
  return std::string(buf);
}

std::string formatDate(int64_t unixSeconds) {
  return formatIso8601(unixSeconds).substr(0, 10);
}

bool parseIso8601(const std::string &str, int64_t &unixSeconds) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!parseFixedDigits(str, 0, 4, year) || str.size() < 10 || str[4] != '-' ||
      !parseFixedDigits(str, 5, 2, month) || str[7] != '-' ||
      !parseFixedDigits(str, 8, 2, day)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return false;
  }
  size_t pos = 10;
  if (pos < str.size()) {
    if ((str[pos] != 'T' && str[pos] != ' ') ||
        !parseFixedDigits(str, pos + 1, 2, hour) || str.size() < pos + 9 ||
        str[pos + 3] != ':' || !parseFixedDigits(str, pos + 4, 2, minute) ||
        str[pos + 6] != ':' || !parseFixedDigits(str, pos + 7, 2, second)) {
      return false;
    }
    pos += 9;
    if (pos < str.size() && str[pos] == '.') {
      ++pos;
      while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        ++pos;
      }
    }
    if (pos < str.size() && str[pos] == 'Z') {
      ++pos;
    }
    if (pos != str.size()) {
      return false;
    }
    if (hour > 23 || minute > 59 || second > 60) {
      return false;
    }
  }
  unixSeconds = daysFromCivil(year, static_cast<unsigned>(month),
                              static_cast<unsigned>(day)) * 86400 +
                hour * 3600 + minute * 60 + second;
  return true;
}

int64_t startOfUtcDay(int64_t unixSeconds) {
  int64_t days = unixSeconds / 86400;
  if (unixSeconds < 0 && unixSeconds % 86400 != 0) {
    --days;
  }
  return days * 86400;
}

bool parseInt(const std::string &str, int &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseInt64(const std::string &str, int64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

pl::Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

pl::Roe<nlohmann::json> parseJsonObject(const std::string &body) {
  nlohmann::json reqJson;
  try {
    reqJson = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Failed to parse request JSON: " + std::string(e.what()));
  }

  if (!reqJson.is_object()) {
    return Error(2, "Request body must be a JSON object");
  }

  return reqJson;
}

std::string getEnv(const std::string &name, const std::string &defaultValue) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr || value[0] == '\0') {
    return defaultValue;
  }
  return value;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char*>(input.c_str()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

std::string hmacSha256Hex(const std::string &key, const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;

  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()), data.size(),
           digest, &digestLen) == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(digest), digestLen));
}

bool constantTimeEquals(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string randomHex(size_t numBytes) {
  std::string bytes(numBytes, '\0');
  randombytes_buf(bytes.data(), bytes.size());
  return hexEncode(bytes);
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = 0, lo = 0;
    char c1 = hex[i], c2 = hex[i + 1];
    if (c1 >= '0' && c1 <= '9') hi = c1 - '0';
    else if (c1 >= 'a' && c1 <= 'f') hi = c1 - 'a' + 10;
    else if (c1 >= 'A' && c1 <= 'F') hi = c1 - 'A' + 10;
    else return {};
    if (c2 >= '0' && c2 <= '9') lo = c2 - '0';
    else if (c2 >= 'a' && c2 <= 'f') lo = c2 - 'a' + 10;
    else if (c2 >= 'A' && c2 <= 'F') lo = c2 - 'A' + 10;
    else return {};
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

std::string toLower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace utl
} // namespace pl
