#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "wordbpe/logging.hpp"

namespace wordbpe {

enum class LoadMode { kLine, kChunk };

// Throws UnsupportedModeError for anything but "line" or "chunk".
[[nodiscard]] LoadMode ParseLoadMode(std::string_view text);
[[nodiscard]] std::string_view LoadModeName(LoadMode mode);

struct CorpusReadOptions {
  LoadMode mode = LoadMode::kLine;
  std::size_t chunk_bytes = 8192;
  std::vector<std::string> json_text_fields = {"text", "content"};
};

using RecordFn = std::function<void(const std::string&)>;

// Streams text records out of plain, gzip or xz compressed corpus files.
// Text files yield trimmed lines or fixed-size chunks depending on the mode;
// .json and .jsonl files yield the first matching text field of each record.
class CorpusReader {
 public:
  explicit CorpusReader(CorpusReadOptions options = {}, Logger logger = {});

  // False when the file cannot be opened or decompressed.
  bool ForEachRecord(const std::filesystem::path& path, const RecordFn& fn) const;

  [[nodiscard]] static bool IsCorpusFile(const std::filesystem::path& path);
  [[nodiscard]] const CorpusReadOptions& options() const { return options_; }

 private:
  bool ReadLines(const std::filesystem::path& path, const RecordFn& fn) const;
  bool ReadChunks(const std::filesystem::path& path, const RecordFn& fn) const;
  bool ReadJsonl(const std::filesystem::path& path, const RecordFn& fn) const;
  bool ReadJson(const std::filesystem::path& path, const RecordFn& fn) const;

  CorpusReadOptions options_;
  Logger logger_;
};

}  // namespace wordbpe
