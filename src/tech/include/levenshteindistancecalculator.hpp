#pragma once

#include <algorithm>
#include <concepts>
#include <numeric>
#include <span>
#include <string_view>
#include <utility>

#include "mdist_vector.hpp"

namespace mdist {

/// Computes Levenshtein distances, reusing its internal buffer from one call to the next.
/// An instance is not thread safe: use one calculator per thread, or the one shot LevenshteinDistance functions.
class LevenshteinDistanceCalculator {
 public:
  LevenshteinDistanceCalculator() noexcept = default;

  /// Computes the levenshtein distance between both input words.
  /// Complexity is in 'word1.length() * word2.length()' in time,
  /// min(word1.length(), word2.length()) in space.
  int operator()(std::string_view word1, std::string_view word2);

  /// Computes the levenshtein distance between two sequences of symbols comparable for equality.
  template <std::equality_comparable T>
  int operator()(std::span<const T> seq1, std::span<const T> seq2) {
    return compute(seq1, seq2);
  }

 private:
  template <class Seq>
  int compute(Seq seq1, Seq seq2);

  // This is only for caching purposes, so that repeated calls to distance calculation do not allocate memory each time
  vector<int> _minDistance;
};

/// One shot version, allocating its own buffer.
int LevenshteinDistance(std::string_view word1, std::string_view word2);

/// One shot version for sequences of symbols comparable for equality, allocating its own buffer.
template <std::equality_comparable T>
int LevenshteinDistance(std::span<const T> seq1, std::span<const T> seq2) {
  LevenshteinDistanceCalculator calc;
  return calc(seq1, seq2);
}

template <class Seq>
int LevenshteinDistanceCalculator::compute(Seq seq1, Seq seq2) {
  if (seq1.size() > seq2.size()) {
    std::swap(seq1, seq2);
  }

  using size_type = typename Seq::size_type;

  // Row of the distance matrix over the shortest sequence.
  // _minDistance[pos] holds the distance between seq1[0, pos) and seq2[0, seq2Pos)
  const auto l1 = seq1.size() + static_cast<size_type>(1);
  if (l1 > _minDistance.size()) {
    // Favor insert instead of resize to ensure reallocations are exponential
    _minDistance.insert(_minDistance.end(), l1 - _minDistance.size(), 0);
  }

  std::iota(_minDistance.begin(), _minDistance.begin() + l1, 0);

  const auto l2 = seq2.size() + static_cast<size_type>(1);
  for (size_type seq2Pos = 1; seq2Pos < l2; ++seq2Pos) {
    auto previousDiagonal = _minDistance[0];

    ++_minDistance[0];

    for (size_type seq1Pos = 1; seq1Pos < l1; ++seq1Pos) {
      const auto previousDiagonalSave = _minDistance[seq1Pos];
      if (seq1[seq1Pos - 1] == seq2[seq2Pos - 1]) {
        _minDistance[seq1Pos] = previousDiagonal;
      } else {
        _minDistance[seq1Pos] = std::min({_minDistance[seq1Pos - 1], _minDistance[seq1Pos], previousDiagonal}) + 1;
      }
      previousDiagonal = previousDiagonalSave;
    }
  }

  return _minDistance[l1 - 1];
}

}  // namespace mdist
