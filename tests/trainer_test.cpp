#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "wordbpe/merge.hpp"
#include "wordbpe/pair_counter.hpp"
#include "wordbpe/symbolizer.hpp"
#include "wordbpe/trainer.hpp"

using namespace wordbpe;

namespace {

WordFrequencyTable CanonicalCorpus() {
  WordFrequencyTable words;
  words.Add("low", 5);
  words.Add("lower", 2);
  words.Add("newest", 6);
  words.Add("widest", 3);
  return words;
}

void TestSymbolize() {
  auto vocab = Symbolize(CanonicalCorpus());
  assert(vocab.size() == 4);
  for (const auto& [seq, freq] : vocab) {
    (void)freq;
    assert(seq.back() == kEndOfWord);
  }
  assert(vocab[0].first == (SymbolSequence{"l", "o", "w", "</w>"}));
  assert(vocab[0].second == 5);
  assert(vocab[2].first.size() == 7);
  assert(vocab.Total() == 16);

  WordFrequencyTable accented;
  accented.Add("café", 1);
  auto v = Symbolize(accented);
  assert(v[0].first == (SymbolSequence{"c", "a", "f", "é", "</w>"}));

  assert(Symbolize(WordFrequencyTable{}).empty());
}

void TestCanonicalFirstMerge() {
  auto vocab = Symbolize(CanonicalCorpus());
  auto counts = CountPairs(vocab);
  assert(counts.Count({"e", "s"}) == 9);
  assert(counts.Count({"w", "e"}) == 8);
  assert(counts.Count({"l", "o"}) == 7);

  // (e, s), (s, t) and (t, </w>) all reach 9; (e, s) is seen first.
  auto best = SelectBestPair(counts);
  assert(best == Pair("e", "s"));

  const auto before = WeightedSymbolCount(vocab);
  auto merged = ApplyMerge(best, vocab);
  assert(WeightedSymbolCount(merged) == before - 9);
  assert(merged[2].first == (SymbolSequence{"n", "e", "w", "es", "t", "</w>"}));
  assert(merged[3].first == (SymbolSequence{"w", "i", "d", "es", "t", "</w>"}));
  assert(merged[1].first == vocab[1].first);
}

void TestCanonicalTraining() {
  TrainerOptions opts;
  opts.num_merges = 3;
  BpeTrainer trainer(opts);
  const auto& merges = trainer.Fit(CanonicalCorpus());
  assert(merges.size() == 3);
  assert(merges[0] == (MergeRule{"e", "s", 0}));
  assert(merges[1] == (MergeRule{"es", "t", 1}));
  assert(merges[2] == (MergeRule{"est", "</w>", 2}));
  assert(trainer.state() == TrainingState::kExhausted);
  assert(trainer.vocab()[2].first == (SymbolSequence{"n", "e", "w", "est</w>"}));
}

void TestInvariantsPerStep() {
  TrainerOptions opts;
  opts.num_merges = 50;
  BpeTrainer trainer(opts);
  const auto words = CanonicalCorpus();
  trainer.Begin(words);
  const auto total = words.Total();
  assert(trainer.vocab().Total() == total);

  while (true) {
    const auto before = WeightedSymbolCount(trainer.vocab());
    const auto counts = CountPairs(trainer.vocab());
    if (!trainer.Step()) {
      break;
    }
    const auto& rule = trainer.merges().back();
    assert(trainer.vocab().Total() == total);
    // Non-overlapping matches can leave fewer merges than the pair count
    // only when a symbol pairs with itself.
    const auto drop = before - WeightedSymbolCount(trainer.vocab());
    if (rule.left != rule.right) {
      assert(drop == counts.Count(rule.AsPair()));
    } else {
      assert(drop > 0 && drop <= counts.Count(rule.AsPair()));
    }
  }
  assert(trainer.state() == TrainingState::kConverged);
  assert(trainer.merges().size() < opts.num_merges);
  for (std::size_t i = 0; i < trainer.merges().size(); ++i) {
    assert(trainer.merges()[i].rank == i);
  }
  // Every word collapses to a single symbol once training converges.
  for (const auto& [seq, freq] : trainer.vocab()) {
    (void)freq;
    assert(seq.size() == 1);
  }
}

void TestConvergesBeforeBudget() {
  WordFrequencyTable words;
  words.Add("ab", 1);
  TrainerOptions opts;
  opts.num_merges = 10;
  BpeTrainer trainer(opts);
  const auto& merges = trainer.Fit(words);
  assert(merges.size() == 2);
  assert(merges[0].Merged() == "ab");
  assert(merges[1].Merged() == "ab</w>");
  assert(trainer.state() == TrainingState::kConverged);
}

void TestBudgetRespected() {
  TrainerOptions opts;
  opts.num_merges = 1;
  BpeTrainer trainer(opts);
  trainer.Fit(CanonicalCorpus());
  assert(trainer.merges().size() == 1);
  assert(trainer.state() == TrainingState::kExhausted);
  assert(!trainer.Step());
}

void TestTieBreakFollowsInsertionOrder() {
  WordFrequencyTable ab_first;
  ab_first.Add("ab", 1);
  ab_first.Add("ba", 1);
  WordFrequencyTable ba_first;
  ba_first.Add("ba", 1);
  ba_first.Add("ab", 1);

  TrainerOptions opts;
  opts.num_merges = 1;
  BpeTrainer t1(opts);
  BpeTrainer t2(opts);
  assert(t1.Fit(ab_first)[0].AsPair() == Pair("a", "b"));
  assert(t2.Fit(ba_first)[0].AsPair() == Pair("b", "a"));
}

void TestEmptyInput() {
  BpeTrainer trainer;
  assert(!trainer.Statistics().has_value());
  const auto& merges = trainer.Fit(WordFrequencyTable{});
  assert(merges.empty());
  assert(trainer.vocab().empty());
  assert(trainer.state() == TrainingState::kConverged);
  auto stats = trainer.Statistics();
  assert(stats.has_value());
  assert(stats->entry_count == 0);
  assert(stats->merge_count == 0);
  assert(stats->avg_symbols_per_word == 0.0);
}

void TestStatistics() {
  TrainingArtifacts artifacts;
  artifacts.vocab = Symbolize(CanonicalCorpus());
  auto stats = Summarize(artifacts);
  assert(stats.entry_count == 4);
  assert(stats.merge_count == 0);
  assert(stats.avg_symbols_per_word == 95.0 / 16.0);

  std::ostringstream log_out;
  BpeTrainer untrained({}, Logger(log_out));
  untrained.LogStatistics();
  assert(log_out.str().find("[warn] No vocabulary found") != std::string::npos);

  std::ostringstream trained_out;
  TrainerOptions opts;
  opts.num_merges = 2;
  BpeTrainer trained(opts, Logger(trained_out));
  trained.Fit(CanonicalCorpus());
  trained.LogStatistics();
  assert(trained_out.str().find("Merge operations learned: 2") != std::string::npos);
  assert(trained_out.str().find("[warn]") == std::string::npos);
}

void TestThreadedCountingMatchesSerial() {
  // Deterministic pseudo-random corpus large enough to be sharded.
  WordFrequencyTable words;
  std::uint32_t state = 12345;
  auto next = [&state] {
    state = state * 1103515245u + 12345u;
    return (state >> 16) & 0x7fff;
  };
  while (words.size() < 6000) {
    std::string word;
    const std::size_t len = 2 + next() % 7;
    for (std::size_t i = 0; i < len; ++i) {
      word.push_back(static_cast<char>('a' + next() % 6));
    }
    words.Add(word, 1 + next() % 20);
  }

  const auto vocab = Symbolize(words);
  const auto serial = CountPairs(vocab, 1);
  const auto threaded = CountPairs(vocab, 4);
  assert(serial == threaded);
  assert(serial.size() == threaded.size());
  for (std::size_t i = 0; i < serial.size(); ++i) {
    assert(serial[i].first == threaded[i].first);
  }

  TrainerOptions serial_opts;
  serial_opts.num_merges = 40;
  TrainerOptions threaded_opts = serial_opts;
  threaded_opts.num_threads = 4;
  BpeTrainer a(serial_opts);
  BpeTrainer b(threaded_opts);
  assert(a.Fit(words) == b.Fit(words));
  assert(a.vocab().Total() == words.Total());
}

void TestZeroBudgetRejected() {
  TrainerOptions opts;
  opts.num_merges = 0;
  bool threw = false;
  try {
    BpeTrainer trainer(opts);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestSymbolize();
  TestCanonicalFirstMerge();
  TestCanonicalTraining();
  TestInvariantsPerStep();
  TestConvergesBeforeBudget();
  TestBudgetRespected();
  TestTieBreakFollowsInsertionOrder();
  TestEmptyInput();
  TestStatistics();
  TestThreadedCountingMatchesSerial();
  TestZeroBudgetRejected();
  return 0;
}
