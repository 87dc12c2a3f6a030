#pragma once

#include <filesystem>
#include <string>

#include "wordbpe/logging.hpp"
#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

inline constexpr const char* kVocabFileName = "vocab.txt";
inline constexpr const char* kMergesFileName = "merges.txt";

// Concatenated symbols with the trailing end-of-word marker removed.
[[nodiscard]] std::string SurfaceWord(const SymbolSequence& seq);

// Writes vocab.txt ("<word> <frequency>") and merges.txt ("<a> <b>") into
// output_dir, creating it if needed. Each file is replaced atomically.
// Throws ArtifactIoError.
void SaveArtifacts(const TrainingArtifacts& artifacts,
                   const std::filesystem::path& output_dir,
                   const Logger& logger = {});

void SaveVocab(const Vocabulary& vocab, const std::filesystem::path& path);
void SaveMerges(const MergeHistory& merges, const std::filesystem::path& path);

// Hugging Face style tokenizer.json with a BPE model using the "</w>" suffix.
// Vocab and merges are in the compact form, where a word's last symbol
// carries the suffix ("t</w>").
// Throws ArtifactIoError.
void SaveAsTokenizerJson(const TrainingArtifacts& artifacts, const std::filesystem::path& path);

}  // namespace wordbpe
