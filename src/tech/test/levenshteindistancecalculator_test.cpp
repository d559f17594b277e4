#include "levenshteindistancecalculator.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <functional>
#include <span>
#include <string_view>

#include "mdist_string.hpp"
#include "mdist_vector.hpp"
#include "threadpool.hpp"
#include "timedef.hpp"

namespace mdist {

TEST(LevenshteinDistanceCalculator, EmptyAndEqualWords) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("", ""), 0);
  EXPECT_EQ(calc("", "abc"), 3);
  EXPECT_EQ(calc("memo", ""), 4);
  EXPECT_EQ(calc("memo", "memo"), 0);
}

TEST(LevenshteinDistanceCalculator, KnownDistances) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("kitten", "sitting"), 3);
  EXPECT_EQ(calc("flaw", "lawn"), 2);
  EXPECT_EQ(calc("gumbo", "gambol"), 2);
  EXPECT_EQ(calc("sunday", "saturday"), 3);
  EXPECT_EQ(calc("rosettacode", "raisethysword"), 8);
}

TEST(LevenshteinDistanceCalculator, OptionNameTypos) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("--fibonaci", "--fibonacci"), 1);
  EXPECT_EQ(calc("--timeout", "timeout"), 2);
  EXPECT_EQ(calc("--distnace", "--distance"), 2);
  EXPECT_EQ(calc("--treads", "--threads"), 1);
}

TEST(LevenshteinDistanceCalculator, Symmetry) {
  LevenshteinDistanceCalculator calc;

  static constexpr std::string_view kWords[] = {"", "a", "kitten", "sitting", "saturday", "sunday", "rosettacode"};
  for (std::string_view word1 : kWords) {
    EXPECT_EQ(calc(word1, word1), 0);
    for (std::string_view word2 : kWords) {
      EXPECT_EQ(calc(word1, word2), calc(word2, word1));
    }
  }
}

TEST(LevenshteinDistanceCalculator, TriangleInequality) {
  LevenshteinDistanceCalculator calc;

  static constexpr std::string_view kWords[] = {"", "flaw", "lawn", "gumbo", "gambol", "book", "back", "memoize"};
  for (std::string_view word1 : kWords) {
    for (std::string_view word2 : kWords) {
      for (std::string_view word3 : kWords) {
        EXPECT_LE(calc(word1, word3), calc(word1, word2) + calc(word2, word3));
      }
    }
  }
}

TEST(LevenshteinDistanceCalculator, BufferReusedWithShorterWords) {
  LevenshteinDistanceCalculator calc;

  EXPECT_EQ(calc("a very long sentence to make the buffer grow", "another long sentence"), 29);
  EXPECT_EQ(calc("saturday", "sunday"), 3);
  EXPECT_EQ(calc("", "abcd"), 4);
}

TEST(LevenshteinDistanceCalculator, GenericSequences) {
  LevenshteinDistanceCalculator calc;

  static constexpr std::array kSeq1{1, 2, 3, 4, 5};
  static constexpr std::array kSeq2{1, 3, 4, 6, 5, 7};

  EXPECT_EQ(calc(std::span<const int>(kSeq1), std::span<const int>(kSeq2)), 3);
  EXPECT_EQ(calc(std::span<const int>(kSeq2), std::span<const int>(kSeq1)), 3);
  EXPECT_EQ(calc(std::span<const int>(kSeq1), std::span<const int>()), 5);
  EXPECT_EQ(calc(std::span<const int>(), std::span<const int>()), 0);

  static constexpr std::array<std::string_view, 3> kSentence1{"the", "quick", "fox"};
  static constexpr std::array<std::string_view, 4> kSentence2{"the", "slow", "brown", "fox"};

  EXPECT_EQ(calc(std::span<const std::string_view>(kSentence1), std::span<const std::string_view>(kSentence2)), 2);
}

TEST(LevenshteinDistanceCalculator, OneShot) {
  EXPECT_EQ(LevenshteinDistance("kitten", "sitting"), 3);
  EXPECT_EQ(LevenshteinDistance("", ""), 0);
}

TEST(LevenshteinDistanceCalculator, OneShotSequences) {
  static constexpr std::array<std::string_view, 2> kPath1{"ab", "cd"};
  static constexpr std::array<std::string_view, 3> kPath2{"ab", "ce", "cd"};

  EXPECT_EQ(LevenshteinDistance(std::span<const std::string_view>(kPath1), std::span<const std::string_view>(kPath2)),
            1);
  EXPECT_EQ(LevenshteinDistance(std::span<const int>(), std::span<const int>()), 0);
}

TEST(LevenshteinDistanceCalculator, OneShotFromSeveralThreads) {
  static constexpr std::string_view kWords[] = {"memoizing", "memorizing", "kitten", "sitting", "saturday", "sunday"};
  static constexpr int kExpectedDistances[] = {1, 3, 3};

  ThreadPool threadPool(3);
  vector<std::function<int()>> tasks;
  for (int round = 0; round < 20; ++round) {
    for (int pairPos = 0; pairPos < 3; ++pairPos) {
      tasks.emplace_back([pairPos] { return LevenshteinDistance(kWords[2 * pairPos], kWords[2 * pairPos + 1]); });
    }
  }

  const auto distances = threadPool.invokeAllFor(tasks, seconds(10));

  ASSERT_EQ(distances.size(), tasks.size());
  for (decltype(distances.size()) pos = 0; pos < distances.size(); ++pos) {
    EXPECT_EQ(distances[pos], kExpectedDistances[pos % 3]);
  }
}

TEST(LevenshteinDistanceCalculator, LongWords) {
  LevenshteinDistanceCalculator calc;

  string word1;
  for (int repetition = 0; repetition < 300; ++repetition) {
    word1.append("memoize");
  }
  string word2 = word1;
  for (std::size_t pos = 0; pos < word2.size(); pos += 100) {
    word2[pos] = '#';
  }

  EXPECT_EQ(calc(word1, word2), 21);

  // one char removed in the middle, another one appended at the end
  string word3 = word1;
  word3.erase(1000, 1);
  word3.push_back('x');

  EXPECT_EQ(calc(word1, word3), 2);
}

}  // namespace mdist
