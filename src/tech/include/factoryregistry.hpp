#pragma once

#include <algorithm>
#include <concepts>
#include <functional>
#include <iterator>
#include <memory>
#include <string_view>
#include <utility>

#include "levenshteindistancecalculator.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_log.hpp"
#include "mdist_string.hpp"
#include "mdist_vector.hpp"

namespace mdist {

/// Table of named creators of objects deriving from Base, taking CtorArgs as construction arguments.
/// It allows creation of an object from the name of its type, known at runtime only.
/// Names are kept sorted, lookups are in logarithmic time.
template <class Base, class... CtorArgs>
class FactoryRegistry {
 public:
  using Creator = std::function<std::unique_ptr<Base>(CtorArgs...)>;

  /// Register a creator of Derived objects under given name.
  template <class Derived>
    requires std::derived_from<Derived, Base> && std::constructible_from<Derived, CtorArgs...>
  FactoryRegistry &registerType(std::string_view name) {
    return registerCreator(name,
                           [](CtorArgs... args) { return std::make_unique<Derived>(std::forward<CtorArgs>(args)...); });
  }

  /// Register given creator under given name.
  /// Throws invalid_argument if a creator is already registered for this name.
  FactoryRegistry &registerCreator(std::string_view name, Creator creator) {
    auto it = lowerBound(name);
    if (it != _creators.end() && it->first == name) {
      throw invalid_argument("A creator is already registered for type '{}'", name);
    }
    _creators.emplace(it, string(name), std::move(creator));
    return *this;
  }

  /// Creates an object from its registered type name.
  /// Returns a nullptr if name is unknown. Exceptions thrown by the constructor are propagated.
  std::unique_ptr<Base> create(std::string_view name, CtorArgs... args) const {
    auto it = lowerBound(name);
    if (it == _creators.end() || it->first != name) {
      logUnknownName(name);
      return nullptr;
    }
    return it->second(std::forward<CtorArgs>(args)...);
  }

  bool contains(std::string_view name) const {
    auto it = lowerBound(name);
    return it != _creators.end() && it->first == name;
  }

  /// Registered names, sorted.
  vector<std::string_view> names() const {
    vector<std::string_view> ret;
    ret.reserve(_creators.size());
    std::ranges::transform(_creators, std::back_inserter(ret),
                           [](const auto &nameAndCreator) { return std::string_view(nameAndCreator.first); });
    return ret;
  }

  auto size() const noexcept { return _creators.size(); }

  bool empty() const noexcept { return _creators.empty(); }

 private:
  using NameAndCreator = std::pair<string, Creator>;
  using Creators = vector<NameAndCreator>;

  auto lowerBound(std::string_view name) const {
    return std::ranges::lower_bound(_creators, name, std::less<>{},
                                    [](const NameAndCreator &nameAndCreator) -> std::string_view {
                                      return nameAndCreator.first;
                                    });
  }

  auto lowerBound(std::string_view name) {
    return std::ranges::lower_bound(_creators, name, std::less<>{},
                                    [](const NameAndCreator &nameAndCreator) -> std::string_view {
                                      return nameAndCreator.first;
                                    });
  }

  void logUnknownName(std::string_view name) const {
    if (_creators.empty()) {
      log::error("Unknown type '{}', no type registered", name);
      return;
    }
    LevenshteinDistanceCalculator calc;
    auto closestIt = std::ranges::min_element(_creators, std::less<>{}, [&calc, name](const auto &nameAndCreator) {
      return calc(nameAndCreator.first, name);
    });
    log::error("Unknown type '{}' - closest registered type is '{}'", name, closestIt->first);
  }

  Creators _creators;
};

}  // namespace mdist
