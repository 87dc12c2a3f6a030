#pragma once

#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

// Replaces every non-overlapping occurrence of pair, scanning left to right,
// with the concatenated symbol. Only whole adjacent symbols match.
[[nodiscard]] SymbolSequence MergeSequence(const SymbolSequence& seq, const Pair& pair);

// Returns a new vocabulary with pair merged in every entry. Entries that end
// up identical have their frequencies summed.
[[nodiscard]] Vocabulary ApplyMerge(const Pair& pair, const Vocabulary& vocab);

}  // namespace wordbpe
