#include "levenshteindistancecalculator.hpp"

#include <string_view>

namespace mdist {

int LevenshteinDistanceCalculator::operator()(std::string_view word1, std::string_view word2) {
  return compute(word1, word2);
}

int LevenshteinDistance(std::string_view word1, std::string_view word2) {
  LevenshteinDistanceCalculator calc;
  return calc(word1, word2);
}

}  // namespace mdist
