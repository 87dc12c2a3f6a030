#undef NDEBUG
#include <cassert>

#include "wordbpe/convert.hpp"
#include "wordbpe/symbolizer.hpp"
#include "wordbpe/trainer.hpp"

using namespace wordbpe;

namespace {

WordFrequencyTable Words() {
  WordFrequencyTable words;
  words.Add("villa", 4);
  words.Add("a", 2);
  words.Add("", 1);
  words.Add("naïve", 3);
  return words;
}

void TestCompactAndExpandSequences() {
  assert(CompactSequence({"v", "i", "l", "l", "a", "</w>"}) == (SymbolSequence{"v", "i", "l", "l", "a</w>"}));
  assert(ExpandSequence({"v", "i", "l", "l", "a</w>"}) == (SymbolSequence{"v", "i", "l", "l", "a", "</w>"}));
  assert(CompactSequence({"a", "</w>"}) == (SymbolSequence{"a</w>"}));
  assert(ExpandSequence({"a</w>"}) == (SymbolSequence{"a", "</w>"}));
}

void TestRoundTripOnSymbolizedVocab() {
  const auto vocab = Symbolize(Words());
  const auto compact = ToCompact(vocab);
  assert(compact.size() == vocab.size());
  assert(compact.Total() == vocab.Total());
  assert(compact.Contains({"v", "i", "l", "l", "a</w>"}));
  assert(ToExpanded(compact) == vocab);
}

void TestRoundTripAfterTraining() {
  TrainerOptions opts;
  opts.num_merges = 4;
  BpeTrainer trainer(opts);
  trainer.Fit(Words());
  const auto& vocab = trainer.vocab();
  // Merged symbols ending in the marker expand back into the marker form.
  auto expanded = ToExpanded(ToCompact(vocab));
  assert(expanded.Total() == vocab.Total());
  assert(ToCompact(expanded) == ToCompact(vocab));
}

void TestAlreadyConvertedPassesThrough() {
  const auto vocab = Symbolize(Words());
  const auto compact = ToCompact(vocab);
  assert(ToCompact(compact) == compact);
  assert(ToExpanded(vocab) == vocab);

  // No marker at all.
  Vocabulary plain;
  plain.Add({"x", "y"}, 1);
  assert(ToCompact(plain) == plain);
  assert(ToExpanded(plain) == plain);

  // A lone marker has no symbol to attach to.
  Vocabulary lone;
  lone.Add({"</w>"}, 1);
  assert(ToCompact(lone) == lone);
  assert(ToExpanded(lone) == lone);
}

}  // namespace

int main() {
  TestCompactAndExpandSequences();
  TestRoundTripOnSymbolizedVocab();
  TestRoundTripAfterTraining();
  TestAlreadyConvertedPassesThrough();
  return 0;
}
