#include "wordbpe/pair_counter.hpp"

#include <algorithm>
#include <future>
#include <vector>

#include "wordbpe/errors.hpp"

namespace wordbpe {

namespace {
constexpr std::size_t kMinEntriesPerShard = 2048;

void CountRange(const Vocabulary& vocab, std::size_t begin, std::size_t end, PairCounts& out) {
  for (std::size_t i = begin; i < end; ++i) {
    const auto& [seq, freq] = vocab[i];
    for (std::size_t j = 0; j + 1 < seq.size(); ++j) {
      out.Add(Pair(seq[j], seq[j + 1]), freq);
    }
  }
}
}  // namespace

PairCounts CountPairs(const Vocabulary& vocab, std::size_t num_threads) {
  PairCounts counts;
  const std::size_t max_shards = std::max<std::size_t>(1, vocab.size() / kMinEntriesPerShard);
  const std::size_t threads = std::min(std::max<std::size_t>(1, num_threads), max_shards);
  if (threads == 1) {
    CountRange(vocab, 0, vocab.size(), counts);
    return counts;
  }

  const std::size_t shard = (vocab.size() + threads - 1) / threads;
  std::vector<std::future<PairCounts>> futures;
  futures.reserve(threads);
  for (std::size_t start = 0; start < vocab.size(); start += shard) {
    const std::size_t end = std::min(start + shard, vocab.size());
    futures.push_back(std::async(std::launch::async, [&vocab, start, end] {
      PairCounts partial;
      CountRange(vocab, start, end, partial);
      return partial;
    }));
  }

  // Reducing shards in vocabulary order keeps first-seen order intact.
  for (auto& future : futures) {
    for (const auto& [pair, count] : future.get()) {
      counts.Add(pair, count);
    }
  }
  return counts;
}

Pair SelectBestPair(const PairCounts& counts) {
  if (counts.empty()) {
    throw EmptyInputError("cannot select a merge from empty pair counts");
  }
  auto best = counts.begin();
  for (auto it = counts.begin(); it != counts.end(); ++it) {
    if (it->second > best->second) {
      best = it;
    }
  }
  return best->first;
}

}  // namespace wordbpe
