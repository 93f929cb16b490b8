#include "Money.h"

#include <cctype>
#include <cmath>

namespace pl {
namespace money {

bool parse(const std::string &str, Amount &amount) {
  const char *p = str.c_str();

  while (std::isspace(static_cast<unsigned char>(*p))) {
    p++;
  }

  bool negative = false;
  if (*p == '-' || *p == '+') {
    negative = *p == '-';
    p++;
  }

  Amount whole = 0;
  int wholeDigits = 0;
  for (; std::isdigit(static_cast<unsigned char>(*p)); p++) {
    if (++wholeDigits > 16) {
      return false;
    }
    whole = whole * 10 + (*p - '0');
  }

  Amount fraction = 0;
  int fractionDigits = 0;
  if (*p == '.') {
    p++;
    for (; std::isdigit(static_cast<unsigned char>(*p)); p++) {
      if (++fractionDigits > 2) {
        return false;
      }
      fraction = fraction * 10 + (*p - '0');
    }
    if (fractionDigits == 0) {
      return false;
    }
  }
  if (fractionDigits == 1) {
    fraction *= 10;
  }

  if (wholeDigits == 0 && fractionDigits == 0) {
    return false;
  }

  for (; *p; p++) {
    if (!std::isspace(static_cast<unsigned char>(*p))) {
      return false;
    }
  }

  Amount value = whole * UNIT + fraction;
  if (value > MAX_AMOUNT) {
    return false;
  }
  amount = negative ? -value : value;
  return true;
}

std::string format(Amount amount) {
  // Avoid negating INT64_MIN
  uint64_t magnitude = amount < 0 ? static_cast<uint64_t>(-(amount + 1)) + 1
                                  : static_cast<uint64_t>(amount);
  std::string fraction = std::to_string(magnitude % UNIT);
  if (fraction.size() < 2) {
    fraction.insert(0, 1, '0');
  }
  std::string str = std::to_string(magnitude / UNIT) + "." + fraction;
  if (amount < 0) {
    str.insert(0, 1, '-');
  }
  return str;
}

bool fromJson(const nlohmann::json &value, Amount &amount) {
  if (value.is_string()) {
    return parse(value.get<std::string>(), amount);
  }
  if (value.is_number_integer()) {
    int64_t whole = value.get<int64_t>();
    if (whole > MAX_AMOUNT / UNIT || whole < -MAX_AMOUNT / UNIT) {
      return false;
    }
    amount = whole * UNIT;
    return true;
  }
  if (value.is_number_float()) {
    double scaled = value.get<double>() * UNIT;
    if (!std::isfinite(scaled) || std::fabs(scaled) > static_cast<double>(MAX_AMOUNT)) {
      return false;
    }
    double rounded = std::round(scaled);
    if (std::fabs(scaled - rounded) > 1e-6) {
      return false;
    }
    amount = static_cast<Amount>(rounded);
    return true;
  }
  return false;
}

} // namespace money
} // namespace pl
