#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wordbpe/corpus_reader.hpp"
#include "wordbpe/logging.hpp"
#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

// Splits text at whitespace and punctuation and keeps the tokens made only
// of alphabetic code points, optionally lower-cased. English clitics after an
// apostrophe ('s, n't, 'll, 're, 've, 'm, 'd) are dropped: "don't" -> "do".
[[nodiscard]] std::vector<std::string> ExtractWords(std::string_view text, bool lowercase = false);

namespace detail {
// Walks text in windows of at most window_bytes, never splitting a code
// point, so ICU's int32 offsets stay valid for arbitrarily long records.
[[nodiscard]] std::vector<std::string> ExtractWords(std::string_view text, bool lowercase, std::size_t window_bytes);
}  // namespace detail

class WordCounter {
 public:
  explicit WordCounter(bool lowercase = false) : lowercase_(lowercase) {}

  void AddText(std::string_view text);
  void AddWord(std::string word, std::uint64_t count = 1);

  [[nodiscard]] const WordFrequencyTable& counts() const { return counts_; }
  [[nodiscard]] WordFrequencyTable Release() { return std::move(counts_); }

 private:
  bool lowercase_;
  WordFrequencyTable counts_;
};

struct WordCountOptions {
  bool lowercase = false;
  CorpusReadOptions read;
};

// Counts words in every corpus file directly under input_dir, visiting files
// in name order. Throws CorpusError if the directory or a file is unreadable.
[[nodiscard]] WordFrequencyTable BuildWordFrequencies(const std::filesystem::path& input_dir,
                                                      const WordCountOptions& options,
                                                      const Logger& logger = {});

}  // namespace wordbpe
