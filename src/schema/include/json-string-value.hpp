#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace mdist::details {

/// Reads a JSON string value from glaze input iterators, leaving 'it' after its closing quote.
template <class It, class End>
std::string_view ReadJsonStringValue(It &&it, End &&end) {
  if (it != end && *it == '"') {
    ++it;
  }
  const auto closingQuoteIt = std::find(it, end, '"');
  const std::string_view value(it, closingQuoteIt);
  it = closingQuoteIt == end ? closingQuoteIt : std::next(closingQuoteIt);
  return value;
}

/// Writes 'value' as a quoted JSON string at position 'ix' of glaze output buffer 'b', growing it if needed.
template <class B, class IX>
void WriteJsonStringValue(std::string_view value, B &&b, IX &&ix) {
  const auto requiredSize = static_cast<std::size_t>(ix) + value.size() + 2U;
  if (b.size() < requiredSize) {
    b.append(requiredSize - b.size(), ' ');
  }
  b[ix++] = '"';
  std::ranges::copy(value, b.data() + ix);
  ix += value.size();
  b[ix++] = '"';
}

}  // namespace mdist::details
