#include "wordbpe/words.hpp"

#include <algorithm>
#include <limits>
#include <system_error>

#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include "wordbpe/errors.hpp"

namespace wordbpe {

namespace {
constexpr std::size_t kMaxWindowBytes = static_cast<std::size_t>(std::numeric_limits<int32_t>::max());
// Longer than any clitic plus the code point after it.
constexpr std::size_t kCliticLookahead = 16;

std::string LowercaseUtf8(const std::string& text) {
  std::string out;
  icu::UnicodeString::fromUTF8(text).toLower().toUTF8String(out);
  return out;
}

bool IsContinuationByte(char c) { return (static_cast<uint8_t>(c) & 0xC0) == 0x80; }

bool IsApostrophe(UChar32 cp) { return cp == 0x27 || cp == 0x2019; }

std::string AsciiLower(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

// rest starts just past an apostrophe that follows token. If it begins with
// an English clitic ('s, 'll, 're, 've, 'm, 'd, or n't with the n still on
// token), returns the clitic's byte length so the caller can drop it.
// Otherwise returns 0 and the apostrophe is a plain word boundary.
std::size_t CliticLength(std::string_view rest, std::string& token) {
  rest = rest.substr(0, kCliticLookahead);
  const auto* data = reinterpret_cast<const uint8_t*>(rest.data());
  const auto length = static_cast<int32_t>(rest.size());
  int32_t end = 0;
  while (end < length) {
    int32_t next = end;
    UChar32 cp = 0;
    U8_NEXT(data, next, length, cp);
    if (cp < 0 || !u_isalpha(cp)) {
      if (cp >= 0 && !u_isUWhiteSpace(cp) && !u_ispunct(cp)) {
        return 0;
      }
      break;
    }
    end = next;
  }
  const auto suffix = AsciiLower(rest.substr(0, static_cast<std::size_t>(end)));
  if (suffix == "s" || suffix == "ll" || suffix == "re" || suffix == "ve" || suffix == "m" || suffix == "d") {
    return static_cast<std::size_t>(end);
  }
  if (suffix == "t" && token.size() > 1 && (token.back() == 'n' || token.back() == 'N')) {
    token.pop_back();
    return static_cast<std::size_t>(end);
  }
  return 0;
}
}  // namespace

namespace detail {

std::vector<std::string> ExtractWords(std::string_view text, bool lowercase, std::size_t window_bytes) {
  std::vector<std::string> words;
  std::string token;
  bool alphabetic = true;

  auto flush = [&] {
    if (!token.empty() && alphabetic) {
      words.push_back(lowercase ? LowercaseUtf8(token) : token);
    }
    token.clear();
    alphabetic = true;
  };

  window_bytes = std::clamp<std::size_t>(window_bytes, 4, kMaxWindowBytes);
  std::size_t offset = 0;
  while (offset < text.size()) {
    std::size_t window = std::min(window_bytes, text.size() - offset);
    if (offset + window < text.size()) {
      // Start the next window on a lead byte.
      std::size_t back = 0;
      while (back < 3 && back + 1 < window && IsContinuationByte(text[offset + window - back])) {
        ++back;
      }
      window -= back;
    }
    std::size_t next_offset = offset + window;
    const std::string_view part = text.substr(offset, window);
    const auto* data = reinterpret_cast<const uint8_t*>(part.data());
    const auto length = static_cast<int32_t>(part.size());
    int32_t i = 0;
    while (i < length) {
      const int32_t start = i;
      UChar32 cp = 0;
      U8_NEXT(data, i, length, cp);
      const auto bytes = part.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(i - start));
      if (cp < 0) {
        // Malformed byte: treat as a non-alphabetic character inside the token.
        alphabetic = false;
        token.append(bytes);
        continue;
      }
      if (u_isUWhiteSpace(cp)) {
        flush();
        continue;
      }
      if (IsApostrophe(cp) && !token.empty()) {
        const std::size_t clitic = CliticLength(text.substr(offset + static_cast<std::size_t>(i)), token);
        flush();
        const std::size_t resume = static_cast<std::size_t>(i) + clitic;
        if (resume > window) {
          next_offset = offset + resume;
          break;
        }
        i = static_cast<int32_t>(resume);
        continue;
      }
      if (u_ispunct(cp)) {
        flush();
        continue;
      }
      if (!u_isalpha(cp)) {
        alphabetic = false;
      }
      token.append(bytes);
    }
    offset = next_offset;
  }
  flush();
  return words;
}

}  // namespace detail

std::vector<std::string> ExtractWords(std::string_view text, bool lowercase) {
  return detail::ExtractWords(text, lowercase, kMaxWindowBytes);
}

void WordCounter::AddText(std::string_view text) {
  for (auto& word : ExtractWords(text, lowercase_)) {
    counts_.Add(std::move(word), 1);
  }
}

void WordCounter::AddWord(std::string word, std::uint64_t count) {
  counts_.Add(std::move(word), count);
}

WordFrequencyTable BuildWordFrequencies(const std::filesystem::path& input_dir,
                                        const WordCountOptions& options,
                                        const Logger& logger) {
  std::error_code ec;
  if (!std::filesystem::is_directory(input_dir, ec)) {
    throw CorpusError("input directory not found: " + input_dir.string());
  }

  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file() && CorpusReader::IsCorpusFile(it->path())) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw CorpusError("failed to list " + input_dir.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  logger.Info("Scanning directory: ", input_dir.string(), " (", files.size(), " files)");
  CorpusReader reader(options.read, logger);
  WordCounter counter(options.lowercase);
  for (const auto& file : files) {
    logger.Info("Processing file: ", file.filename().string());
    const bool ok = reader.ForEachRecord(file, [&](const std::string& record) { counter.AddText(record); });
    if (!ok) {
      throw CorpusError("failed to read corpus file: " + file.string());
    }
  }
  logger.Info("Word frequency table built with ", counter.counts().size(), " unique words.");
  return counter.Release();
}

}  // namespace wordbpe
