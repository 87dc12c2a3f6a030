#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wordbpe {

// Appended to every word's initial decomposition. Never a single code point.
inline constexpr std::string_view kEndOfWord = "</w>";

using Symbol = std::string;
using SymbolSequence = std::vector<Symbol>;
using Pair = std::pair<Symbol, Symbol>;

struct PairHash {
  std::size_t operator()(const Pair& p) const noexcept;
};

struct SequenceHash {
  std::size_t operator()(const SymbolSequence& seq) const noexcept;
};

// Key -> count table that iterates in first-insertion order. Adding an
// existing key accumulates onto it without moving it.
template <typename Key, typename Hash = std::hash<Key>>
class CountTable {
 public:
  using Entry = std::pair<Key, std::uint64_t>;
  using const_iterator = typename std::vector<Entry>::const_iterator;

  void Add(Key key, std::uint64_t count) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      entries_[it->second].second += count;
      return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), count);
  }

  [[nodiscard]] std::uint64_t Count(const Key& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? 0 : entries_[it->second].second;
  }

  [[nodiscard]] bool Contains(const Key& key) const { return index_.find(key) != index_.end(); }

  [[nodiscard]] std::uint64_t Total() const {
    std::uint64_t total = 0;
    for (const auto& entry : entries_) {
      total += entry.second;
    }
    return total;
  }

  void Reserve(std::size_t n) {
    entries_.reserve(n);
    index_.reserve(n);
  }

  void Clear() {
    entries_.clear();
    index_.clear();
  }

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const Entry& operator[](std::size_t i) const { return entries_[i]; }
  [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
  [[nodiscard]] const_iterator end() const { return entries_.end(); }

  // Map equality: same keys with the same counts, order ignored.
  friend bool operator==(const CountTable& lhs, const CountTable& rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (const auto& [key, count] : lhs.entries_) {
      auto it = rhs.index_.find(key);
      if (it == rhs.index_.end() || rhs.entries_[it->second].second != count) {
        return false;
      }
    }
    return true;
  }
  friend bool operator!=(const CountTable& lhs, const CountTable& rhs) { return !(lhs == rhs); }

 private:
  std::vector<Entry> entries_;
  std::unordered_map<Key, std::size_t, Hash> index_;
};

using WordFrequencyTable = CountTable<std::string>;
using Vocabulary = CountTable<SymbolSequence, SequenceHash>;
using PairCounts = CountTable<Pair, PairHash>;

struct MergeRule {
  Symbol left;
  Symbol right;
  std::size_t rank = 0;  // position in the learned order, starting at 0

  [[nodiscard]] Symbol Merged() const { return left + right; }
  [[nodiscard]] Pair AsPair() const { return {left, right}; }
};

inline bool operator==(const MergeRule& lhs, const MergeRule& rhs) {
  return lhs.rank == rhs.rank && lhs.left == rhs.left && lhs.right == rhs.right;
}

using MergeHistory = std::vector<MergeRule>;

struct TrainingArtifacts {
  Vocabulary vocab;
  MergeHistory merges;
};

// Sum over entries of sequence length times frequency.
[[nodiscard]] std::uint64_t WeightedSymbolCount(const Vocabulary& vocab);

// Symbols joined with single spaces, for log lines.
[[nodiscard]] std::string JoinSymbols(const SymbolSequence& seq);

}  // namespace wordbpe
