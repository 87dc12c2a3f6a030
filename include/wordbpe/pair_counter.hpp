#pragma once

#include <cstddef>

#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

// Frequency-weighted counts of adjacent symbol pairs. Pairs appear in the
// order they are first seen while scanning the vocabulary in its own order,
// regardless of num_threads.
[[nodiscard]] PairCounts CountPairs(const Vocabulary& vocab, std::size_t num_threads = 1);

// Highest count wins; on a tie the pair seen first wins.
// Throws EmptyInputError when counts is empty.
[[nodiscard]] Pair SelectBestPair(const PairCounts& counts);

}  // namespace wordbpe
