#pragma once

#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

// (..., "a", "</w>") -> (..., "a</w>")
[[nodiscard]] SymbolSequence CompactSequence(const SymbolSequence& seq);

// (..., "a</w>") -> (..., "a", "</w>")
[[nodiscard]] SymbolSequence ExpandSequence(const SymbolSequence& seq);

// Marker as a trailing suffix of the last symbol.
[[nodiscard]] Vocabulary ToCompact(const Vocabulary& vocab);

// Marker as a standalone last symbol. Inverse of ToCompact.
[[nodiscard]] Vocabulary ToExpanded(const Vocabulary& vocab);

}  // namespace wordbpe
