#include "wordbpe/merge.hpp"

namespace wordbpe {

SymbolSequence MergeSequence(const SymbolSequence& seq, const Pair& pair) {
  SymbolSequence merged;
  merged.reserve(seq.size());
  for (std::size_t i = 0; i < seq.size();) {
    if (i + 1 < seq.size() && seq[i] == pair.first && seq[i + 1] == pair.second) {
      merged.push_back(pair.first + pair.second);
      i += 2;
    } else {
      merged.push_back(seq[i]);
      ++i;
    }
  }
  return merged;
}

Vocabulary ApplyMerge(const Pair& pair, const Vocabulary& vocab) {
  Vocabulary out;
  out.Reserve(vocab.size());
  for (const auto& [seq, freq] : vocab) {
    if (seq.size() < 2) {
      out.Add(seq, freq);
      continue;
    }
    out.Add(MergeSequence(seq, pair), freq);
  }
  return out;
}

}  // namespace wordbpe
