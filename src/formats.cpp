#include "wordbpe/formats.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "wordbpe/convert.hpp"
#include "wordbpe/errors.hpp"
#include "wordbpe/merge.hpp"
#include "wordbpe/pair_counter.hpp"
#include "wordbpe/symbolizer.hpp"

namespace wordbpe {

namespace {
// Writes through a sibling temp file and renames it over path, so an
// existing file is either fully replaced or left as it was.
template <typename WriteFn>
void WriteFileAtomically(const std::filesystem::path& path, WriteFn&& write) {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw ArtifactIoError("failed to create output file", tmp);
    }
    write(out);
    out.flush();
    if (!out) {
      std::error_code ignored;
      out.close();
      std::filesystem::remove(tmp, ignored);
      throw ArtifactIoError("failed to write output file", tmp);
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw ArtifactIoError("failed to replace file (" + ec.message() + ")", path);
  }
}
}  // namespace

std::string SurfaceWord(const SymbolSequence& seq) {
  std::string word;
  for (const auto& symbol : seq) {
    word += symbol;
  }
  if (word.size() >= kEndOfWord.size() &&
      word.compare(word.size() - kEndOfWord.size(), kEndOfWord.size(), kEndOfWord) == 0) {
    word.resize(word.size() - kEndOfWord.size());
  }
  return word;
}

void SaveVocab(const Vocabulary& vocab, const std::filesystem::path& path) {
  WriteFileAtomically(path, [&](std::ofstream& out) {
    for (const auto& [seq, freq] : vocab) {
      out << SurfaceWord(seq) << ' ' << freq << '\n';
    }
  });
}

void SaveMerges(const MergeHistory& merges, const std::filesystem::path& path) {
  WriteFileAtomically(path, [&](std::ofstream& out) {
    for (const auto& rule : merges) {
      out << rule.left << ' ' << rule.right << '\n';
    }
  });
}

void SaveArtifacts(const TrainingArtifacts& artifacts,
                   const std::filesystem::path& output_dir,
                   const Logger& logger) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    throw ArtifactIoError("failed to create output directory (" + ec.message() + ")", output_dir);
  }

  const auto vocab_path = output_dir / kVocabFileName;
  const auto merges_path = output_dir / kMergesFileName;
  SaveVocab(artifacts.vocab, vocab_path);
  logger.Info("Saved vocab to: ", vocab_path.string());
  SaveMerges(artifacts.merges, merges_path);
  logger.Info("Saved merges to: ", merges_path.string());
}

void SaveAsTokenizerJson(const TrainingArtifacts& artifacts, const std::filesystem::path& path) {
  // Hugging Face BPE models attach end_of_word_suffix to the last character
  // of a word, so the exported model uses the compact form: "t</w>" rather
  // than "t", "</w>". The learned merges are replayed over the compact
  // vocabulary of the surface words to get the equivalent compact rules.
  WordFrequencyTable words;
  words.Reserve(artifacts.vocab.size());
  for (const auto& [seq, freq] : artifacts.vocab) {
    words.Add(SurfaceWord(seq), freq);
  }
  Vocabulary compact = ToCompact(Symbolize(words));

  // Ids follow first appearance: initial symbols of every word, then each
  // merged symbol in learned order.
  nlohmann::json vocab_json = nlohmann::json::object();
  std::size_t next_id = 0;
  auto add_token = [&](const std::string& token) {
    if (!vocab_json.contains(token)) {
      vocab_json[token] = next_id++;
    }
  };
  for (const auto& [seq, freq] : compact) {
    (void)freq;
    for (const auto& symbol : seq) {
      add_token(symbol);
    }
  }

  nlohmann::json merges_json = nlohmann::json::array();
  for (const auto& rule : artifacts.merges) {
    // (x, "</w>") is already x</w> in the compact form.
    if (rule.right == kEndOfWord) {
      continue;
    }
    // A rule on the last base character of a word becomes (left, right</w>).
    const Pair candidates[] = {rule.AsPair(), Pair(rule.left, rule.right + std::string(kEndOfWord))};
    for (const auto& pair : candidates) {
      if (CountPairs(compact).Count(pair) == 0) {
        continue;
      }
      compact = ApplyMerge(pair, compact);
      add_token(pair.first + pair.second);
      merges_json.push_back(pair.first + " " + pair.second);
    }
  }

  nlohmann::json j;
  j["version"] = "1.0";
  j["truncation"] = nullptr;
  j["padding"] = nullptr;
  j["added_tokens"] = nlohmann::json::array();
  j["normalizer"] = nullptr;
  j["pre_tokenizer"] = {{"type", "Whitespace"}};
  j["post_processor"] = nullptr;
  j["decoder"] = {{"type", "BPEDecoder"}, {"suffix", std::string(kEndOfWord)}};
  j["model"] = {
      {"type", "BPE"},
      {"dropout", nullptr},
      {"unk_token", nullptr},
      {"continuing_subword_prefix", nullptr},
      {"end_of_word_suffix", std::string(kEndOfWord)},
      {"fuse_unk", false},
      {"vocab", std::move(vocab_json)},
      {"merges", std::move(merges_json)},
  };

  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw ArtifactIoError("failed to create output directory (" + ec.message() + ")", path.parent_path());
    }
  }
  WriteFileAtomically(path, [&](std::ofstream& out) { out << j.dump(2) << '\n'; });
}

}  // namespace wordbpe
