#pragma once

#include <string_view>
#include <vector>

#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

// Splits UTF-8 text into one string per code point. Bytes that do not start
// a well-formed sequence are returned as single-byte symbols.
[[nodiscard]] std::vector<Symbol> SplitCodepoints(std::string_view text);

// Each word becomes its code points followed by kEndOfWord, keeping the
// word's frequency and the table's order.
[[nodiscard]] Vocabulary Symbolize(const WordFrequencyTable& words);

}  // namespace wordbpe
