#include "unitsparser.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

#include "mdist_cctype.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_string.hpp"
#include "overflow-check.hpp"
#include "stringconv.hpp"

namespace mdist {

namespace {

// Removes and returns the longest prefix of 'str' made of chars satisfying 'pred'
std::string_view ExtractPrefix(std::string_view &str, auto pred) {
  const std::string_view prefix(str.begin(), std::ranges::find_if_not(str, pred));
  str.remove_prefix(prefix.size());
  return prefix;
}

void SkipSpaces(std::string_view &str) {
  ExtractPrefix(str, [](char ch) { return isspace(ch); });
}

}  // namespace

int64_t ParseAmountWithUnits(std::string_view str, std::span<const AmountUnit> units, std::string_view quantityName) {
  const std::string_view fullStr = str;

  SkipSpaces(str);
  if (str.empty()) {
    throw invalid_argument("Empty {} is not allowed", quantityName);
  }

  int64_t total = 0;
  do {
    const std::string_view digits = ExtractPrefix(str, [](char ch) { return isdigit(ch); });
    if (digits.empty()) {
      throw invalid_argument("Expecting an integral amount in {} '{}'", quantityName, fullStr);
    }

    int64_t amount = 0;
    for (char digit : digits) {
      const int64_t digitValue = digit - '0';
      if (WillNonNegativeProductOverflow(amount, int64_t{10}) || WillSumOverflow(10 * amount, digitValue)) {
        throw invalid_argument("Too large {} '{}'", quantityName, fullStr);
      }
      amount = 10 * amount + digitValue;
    }

    SkipSpaces(str);
    const std::string_view symbol = ExtractPrefix(str, [](char ch) { return isalpha(ch); });
    const auto unitIt = std::ranges::find(units, symbol, &AmountUnit::symbol);
    if (unitIt == units.end()) {
      throw invalid_argument("Unknown unit '{}' in {} '{}'", symbol, quantityName, fullStr);
    }

    if (WillNonNegativeProductOverflow(amount, unitIt->value) || WillSumOverflow(total, amount * unitIt->value)) {
      throw invalid_argument("Too large {} '{}'", quantityName, fullStr);
    }
    total += amount * unitIt->value;

    SkipSpaces(str);
  } while (!str.empty());

  return total;
}

void AppendAmountWithUnits(int64_t amount, std::span<const AmountUnit> units, int nbSignificantUnits, string &out) {
  if (amount < 0) {
    out.push_back('-');
  }
  // unsigned to support the opposite of the minimum value
  uint64_t remaining = amount < 0 ? uint64_t{0} - static_cast<uint64_t>(amount) : static_cast<uint64_t>(amount);
  if (remaining == 0) {
    out.push_back('0');
    out.append(units.back().symbol);
    return;
  }

  for (const auto &[symbol, value] : units) {
    if (remaining == 0 || nbSignificantUnits == 0) {
      break;
    }
    const uint64_t nbInThisUnit = remaining / static_cast<uint64_t>(value);
    if (nbInThisUnit != 0) {
      AppendIntegralToString(out, nbInThisUnit);
      out.append(symbol);
      remaining %= static_cast<uint64_t>(value);
      --nbSignificantUnits;
    }
  }
}

namespace {

constexpr int64_t kKi = 1024;
constexpr int64_t kK = 1000;

constexpr AmountUnit kBytesParsingUnits[] = {
    {"Ti", kKi * kKi * kKi * kKi}, {"T", kK * kK * kK * kK}, {"Gi", kKi * kKi * kKi}, {"G", kK * kK * kK},
    {"Mi", kKi * kKi},             {"M", kK * kK},           {"Ki", kKi},             {"K", kK},
    {"k", kK},                     {"", 1}};

constexpr AmountUnit kBytesDisplayUnits[] = {
    {"Ti", kKi * kKi * kKi * kKi}, {"Gi", kKi * kKi * kKi}, {"Mi", kKi * kKi}, {"Ki", kKi}, {"", 1}};

}  // namespace

int64_t ParseNumberOfBytes(std::string_view sizeStr) {
  return ParseAmountWithUnits(sizeStr, kBytesParsingUnits, "number of bytes");
}

string BytesToStr(int64_t numberOfBytes) {
  string ret;
  AppendAmountWithUnits(numberOfBytes, kBytesDisplayUnits, std::numeric_limits<int>::max(), ret);
  return ret;
}

}  // namespace mdist
