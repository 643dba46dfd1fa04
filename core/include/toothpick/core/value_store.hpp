#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "toothpick/core/segment.hpp"

namespace toothpick::core {

template <typename T, typename THash>
concept HashableValue = std::equality_comparable<T> && requires(const T& value, const THash& hasher) {
  { hasher(value) } -> std::convertible_to<std::size_t>;
};

// Insertion-ordered collection of unique values with O(1) membership lookup.
template <typename T, typename THash>
  requires HashableValue<T, THash>
class ValueStore {
 public:
  ValueStore() = default;

  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool empty() const { return items_.empty(); }

  [[nodiscard]] bool contains(const T& value) const { return index_by_value_.contains(value); }

  [[nodiscard]] std::optional<std::size_t> index_of(const T& value) const {
    auto it = index_by_value_.find(value);
    if (it == index_by_value_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] const T* at_index(std::size_t index) const {
    if (index >= items_.size()) {
      return nullptr;
    }
    return &items_[index];
  }

  // Returns false and leaves the store untouched when an equal value is already present.
  bool insert(const T& value) {
    if (index_by_value_.contains(value)) {
      return false;
    }
    items_.push_back(value);
    index_by_value_.emplace(value, items_.size() - 1);
    return true;
  }

  void reserve(std::size_t count) {
    items_.reserve(count);
    index_by_value_.reserve(count);
  }

  void clear() {
    items_.clear();
    index_by_value_.clear();
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  std::vector<T> items_;
  std::unordered_map<T, std::size_t, THash> index_by_value_;
};

using SegmentStore = ValueStore<Segment, SegmentHash>;

}  // namespace toothpick::core
