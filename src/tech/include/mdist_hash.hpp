#pragma once

#include <cstddef>
#include <functional>
#include <tuple>

namespace mdist {
constexpr std::size_t HashCombine(std::size_t h1, std::size_t h2) {
  // Taken from boost::hash_combine
  static_assert(sizeof(std::size_t) == 4 || sizeof(std::size_t) == 8, "HashCombine not defined for this std::size_t");

  if constexpr (sizeof(std::size_t) == 4) {
    h1 ^= h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2);
  } else {
    // see https://github.com/HowardHinnant/hash_append/issues/7
    h1 ^= h2 + 0x9e3779b97f4a7c15ULL + (h1 << 12) + (h1 >> 4);
  }

  return h1;
}

/// Hashes a std::tuple by combining the std::hash of each of its components.
class HashTuple {
 public:
  template <class Tuple>
  std::size_t operator()(const Tuple& tuple) const {
    return std::hash<std::size_t>()(std::apply([](const auto&... xs) { return (Component{xs}, ..., 0); }, tuple));
  }

 private:
  template <class T>
  struct Component {
    const T& value;

    std::size_t operator,(std::size_t n) const { return HashCombine(std::hash<T>()(value), n); }
  };
};

}  // namespace mdist
