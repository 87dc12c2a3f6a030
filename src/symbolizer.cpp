#include "wordbpe/symbolizer.hpp"

#include <cstdint>

namespace wordbpe {

namespace {
// Length of the well-formed UTF-8 sequence starting at text[i], or 0.
std::size_t SequenceLength(std::string_view text, std::size_t i) {
  const auto lead = static_cast<std::uint8_t>(text[i]);
  std::size_t len = 0;
  if (lead < 0x80) {
    return 1;
  } else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
    len = 2;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
  } else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
    len = 4;
  } else {
    return 0;
  }
  if (i + len > text.size()) {
    return 0;
  }
  for (std::size_t k = 1; k < len; ++k) {
    if ((static_cast<std::uint8_t>(text[i + k]) & 0xC0) != 0x80) {
      return 0;
    }
  }
  return len;
}
}  // namespace

std::vector<Symbol> SplitCodepoints(std::string_view text) {
  std::vector<Symbol> out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t len = SequenceLength(text, i);
    if (len == 0) {
      len = 1;
    }
    out.emplace_back(text.substr(i, len));
    i += len;
  }
  return out;
}

Vocabulary Symbolize(const WordFrequencyTable& words) {
  Vocabulary vocab;
  vocab.Reserve(words.size());
  for (const auto& [word, freq] : words) {
    auto symbols = SplitCodepoints(word);
    symbols.emplace_back(kEndOfWord);
    vocab.Add(std::move(symbols), freq);
  }
  return vocab;
}

}  // namespace wordbpe
