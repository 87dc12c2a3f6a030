#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

#include <zlib.h>

#include "test_util.hpp"
#include "wordbpe/corpus_reader.hpp"
#include "wordbpe/errors.hpp"
#include "wordbpe/words.hpp"

using namespace wordbpe;
using wordbpe::testing::TempDir;
using wordbpe::testing::WriteFile;

namespace {

using Records = std::vector<std::string>;

Records ReadAll(const CorpusReader& reader, const std::filesystem::path& path) {
  Records out;
  const bool ok = reader.ForEachRecord(path, [&](const std::string& r) { out.push_back(r); });
  assert(ok);
  return out;
}

void WriteGzip(const std::filesystem::path& path, const std::string& content) {
  gzFile gz = gzopen(path.string().c_str(), "wb");
  assert(gz != nullptr);
  assert(gzwrite(gz, content.data(), static_cast<unsigned int>(content.size())) == static_cast<int>(content.size()));
  gzclose(gz);
}

void TestExtractWords() {
  assert((ExtractWords("Hello, world! It's 2024 a1b caf\xC3\xA9.") ==
          Records{"Hello", "world", "It", "caf\xC3\xA9"}));
  assert((ExtractWords("Hello, WORLD", true) == Records{"hello", "world"}));
  assert((ExtractWords("\xC3\x89" "COLE", true) == Records{"\xC3\xA9" "cole"}));
  assert(ExtractWords("  \t\n").empty());
  assert(ExtractWords("42 3.14 --").empty());
}

void TestExtractWordsDropsClitics() {
  assert((ExtractWords("don't we'll they're I've I'm he'd can't") ==
          Records{"do", "we", "they", "I", "I", "he", "ca"}));
  assert((ExtractWords("DON'T It\xE2\x80\x99s", true) == Records{"do", "it"}));
  // Not clitics: the apostrophe is an ordinary boundary.
  assert((ExtractWords("rock'n'roll o'clock") == Records{"rock", "n", "roll", "o", "clock"}));
  assert((ExtractWords("'tis ' s") == Records{"tis", "s"}));
}

void TestExtractWordsInSmallWindows() {
  const std::string text = "h\xC3\xA9llo w\xC3\xB6rld, it's a long line of \xE6\x97\xA5\xE6\x9C\xAC words";
  const auto whole = ExtractWords(text);
  assert(whole.size() == 9);
  for (std::size_t window : {4, 5, 7, 16}) {
    assert(detail::ExtractWords(text, false, window) == whole);
  }
}

void TestWordCounterKeepsFirstSeenOrder() {
  WordCounter counter;
  counter.AddText("the cat saw the dog");
  counter.AddWord("cat", 3);
  const auto& counts = counter.counts();
  assert(counts.size() == 4);
  assert(counts[0].first == "the");
  assert(counts[0].second == 2);
  assert(counts[1].first == "cat");
  assert(counts[1].second == 4);
  assert(counts[3].first == "dog");
}

void TestParseLoadMode() {
  assert(ParseLoadMode("line") == LoadMode::kLine);
  assert(ParseLoadMode("CHUNK") == LoadMode::kChunk);
  bool threw = false;
  try {
    (void)ParseLoadMode("paragraph");
  } catch (const UnsupportedModeError& e) {
    threw = true;
    assert(e.mode() == "paragraph");
  }
  assert(threw);
}

void TestLineMode() {
  TempDir dir("lines");
  const auto path = dir.path() / "a.txt";
  WriteFile(path, "  the cat \n\nthe dog\r\nlast");
  CorpusReader reader;
  assert((ReadAll(reader, path) == Records{"the cat", "", "the dog", "last"}));

  assert(!reader.ForEachRecord(dir.path() / "missing.txt", [](const std::string&) {}));
}

void TestChunkModeKeepsCodepointsWhole() {
  TempDir dir("chunks");
  const auto path = dir.path() / "a.txt";
  const std::string text = "a\xC3\xA9\xC3\xA9";
  WriteFile(path, text);
  CorpusReadOptions opts;
  opts.mode = LoadMode::kChunk;
  opts.chunk_bytes = 4;
  CorpusReader reader(opts);
  const auto chunks = ReadAll(reader, path);
  assert((chunks == Records{"a\xC3\xA9", "\xC3\xA9"}));
}

void TestGzipAndJsonl() {
  TempDir dir("compressed");
  const auto gz_path = dir.path() / "a.txt.gz";
  WriteGzip(gz_path, "first line\nsecond line\n");
  CorpusReader reader;
  assert((ReadAll(reader, gz_path) == Records{"first line", "second line"}));

  const auto jsonl_path = dir.path() / "b.jsonl";
  WriteFile(jsonl_path,
            "{\"text\": \"hello world\"}\n"
            "{broken\n"
            "\n"
            "{\"content\": \"from content\"}\n"
            "{\"other\": 1}\n");
  assert((ReadAll(reader, jsonl_path) == Records{"hello world", "from content"}));

  const auto json_path = dir.path() / "c.json";
  WriteFile(json_path, R"([{"text": "one"}, {"text": "two"}, 3])");
  assert((ReadAll(reader, json_path) == Records{"one", "two"}));

  assert(CorpusReader::IsCorpusFile("x.jsonl.gz"));
  assert(CorpusReader::IsCorpusFile("x.TXT"));
  assert(!CorpusReader::IsCorpusFile("x.csv"));
  assert(!CorpusReader::IsCorpusFile("x.gz"));
}

void TestBuildWordFrequencies() {
  TempDir dir("corpus");
  WriteFile(dir.path() / "b.txt", "Zeta alpha\n");
  WriteFile(dir.path() / "a.txt", "beta alpha\n");
  WriteFile(dir.path() / "notes.csv", "ignored words\n");
  std::filesystem::create_directories(dir.path() / "sub");
  WriteFile(dir.path() / "sub" / "c.txt", "nested\n");

  WordCountOptions opts;
  opts.lowercase = true;
  const auto table = BuildWordFrequencies(dir.path(), opts);
  assert(table.size() == 3);
  assert(table[0].first == "beta");
  assert(table[1].first == "alpha");
  assert(table[1].second == 2);
  assert(table[2].first == "zeta");
  assert(!table.Contains("nested"));
  assert(!table.Contains("ignored"));
}

void TestBuildWordFrequenciesErrors() {
  TempDir dir("corpus_errors");
  bool threw = false;
  try {
    (void)BuildWordFrequencies(dir.path() / "absent", WordCountOptions{});
  } catch (const CorpusError&) {
    threw = true;
  }
  assert(threw);

  WriteFile(dir.path() / "broken.txt.xz", "this is not xz data");
  threw = false;
  try {
    (void)BuildWordFrequencies(dir.path(), WordCountOptions{});
  } catch (const CorpusError&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestExtractWords();
  TestExtractWordsDropsClitics();
  TestExtractWordsInSmallWindows();
  TestWordCounterKeepsFirstSeenOrder();
  TestParseLoadMode();
  TestLineMode();
  TestChunkModeKeepsCodepointsWhole();
  TestGzipAndJsonl();
  TestBuildWordFrequencies();
  TestBuildWordFrequenciesErrors();
  return 0;
}
