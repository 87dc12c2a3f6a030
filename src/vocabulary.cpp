#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

namespace {
inline std::size_t HashCombine(std::size_t seed, std::size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}
}  // namespace

std::size_t PairHash::operator()(const Pair& p) const noexcept {
  std::hash<std::string> h;
  return HashCombine(h(p.first), h(p.second));
}

std::size_t SequenceHash::operator()(const SymbolSequence& seq) const noexcept {
  std::hash<std::string> h;
  std::size_t seed = seq.size();
  for (const auto& symbol : seq) {
    seed = HashCombine(seed, h(symbol));
  }
  return seed;
}

std::uint64_t WeightedSymbolCount(const Vocabulary& vocab) {
  std::uint64_t total = 0;
  for (const auto& [seq, freq] : vocab) {
    total += static_cast<std::uint64_t>(seq.size()) * freq;
  }
  return total;
}

std::string JoinSymbols(const SymbolSequence& seq) {
  std::string out;
  for (std::size_t i = 0; i < seq.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += seq[i];
  }
  return out;
}

}  // namespace wordbpe
