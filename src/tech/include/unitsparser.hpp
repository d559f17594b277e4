#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "mdist_string.hpp"

namespace mdist {

/// A unit symbol with its value expressed in the base unit of its quantity.
struct AmountUnit {
  std::string_view symbol;
  int64_t value;
};

/// Parses a sum of integral amounts, each one followed by one of the symbols of 'units', and returns the total in
/// the base unit. For instance, with time units, "1h45min" gives the number of base units in 105 minutes.
/// Spaces are accepted before and after amounts and symbols. An amount without symbol is only accepted if 'units'
/// contains a unit with an empty symbol.
/// Throws invalid_argument for empty strings, decimal or negative amounts, unknown symbols, or totals not fitting
/// in an int64_t. 'quantityName' is only used in error messages.
int64_t ParseAmountWithUnits(std::string_view str, std::span<const AmountUnit> units, std::string_view quantityName);

/// Appends to 'out' the representation of 'amount' with at most 'nbSignificantUnits' of the given 'units', which
/// should be sorted by decreasing value and end with the unit of value 1.
/// Remaining amount smaller than the last displayed unit is truncated.
void AppendAmountWithUnits(int64_t amount, std::span<const AmountUnit> units, int nbSignificantUnits, string &out);

/// Parses a number of bytes, an integral amount possibly followed by a multiplier:
///  - k (or K), M, G, T for powers of 1000
///  - Ki, Mi, Gi, Ti for powers of 1024
/// Several terms can be summed, for instance "1Gi512Mi".
int64_t ParseNumberOfBytes(std::string_view sizeStr);

/// String representation of a number of bytes with binary multipliers, for instance "5Mi" or "1Gi512Mi".
string BytesToStr(int64_t numberOfBytes);

}  // namespace mdist
