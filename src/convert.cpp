#include "wordbpe/convert.hpp"

namespace wordbpe {

namespace {
bool EndsWithMarker(const Symbol& symbol) {
  return symbol.size() >= kEndOfWord.size() &&
         symbol.compare(symbol.size() - kEndOfWord.size(), kEndOfWord.size(), kEndOfWord) == 0;
}
}  // namespace

SymbolSequence CompactSequence(const SymbolSequence& seq) {
  // A lone marker has nothing to attach to.
  if (seq.size() < 2 || seq.back() != kEndOfWord) {
    return seq;
  }
  SymbolSequence out(seq.begin(), seq.end() - 1);
  out.back() += kEndOfWord;
  return out;
}

SymbolSequence ExpandSequence(const SymbolSequence& seq) {
  if (seq.empty() || seq.back().size() <= kEndOfWord.size() || !EndsWithMarker(seq.back())) {
    return seq;
  }
  SymbolSequence out(seq);
  out.back().resize(out.back().size() - kEndOfWord.size());
  out.emplace_back(kEndOfWord);
  return out;
}

Vocabulary ToCompact(const Vocabulary& vocab) {
  Vocabulary out;
  out.Reserve(vocab.size());
  for (const auto& [seq, freq] : vocab) {
    out.Add(CompactSequence(seq), freq);
  }
  return out;
}

Vocabulary ToExpanded(const Vocabulary& vocab) {
  Vocabulary out;
  out.Reserve(vocab.size());
  for (const auto& [seq, freq] : vocab) {
    out.Add(ExpandSequence(seq), freq);
  }
  return out;
}

}  // namespace wordbpe
