#include "wordbpe/corpus_reader.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

#include <lzma.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

#include "wordbpe/errors.hpp"

namespace wordbpe {

namespace {
enum class Compression { kNone, kGzip, kXz };

using BytesFn = std::function<void(const char*, std::size_t)>;

std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

Compression DetectCompression(const std::filesystem::path& path) {
  const auto ext = ToLowerAscii(path.extension().string());
  if (ext == ".gz") return Compression::kGzip;
  if (ext == ".xz") return Compression::kXz;
  return Compression::kNone;
}

// Extension with any compression suffix removed, e.g. ".jsonl" for a.jsonl.gz.
std::string InnerExtension(const std::filesystem::path& path) {
  if (DetectCompression(path) == Compression::kNone) {
    return ToLowerAscii(path.extension().string());
  }
  return ToLowerAscii(path.stem().extension().string());
}

bool StreamPlain(const std::filesystem::path& path, const BytesFn& on_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::vector<char> buf(1 << 16);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) {
      on_bytes(buf.data(), static_cast<std::size_t>(got));
    }
  }
  return in.eof();
}

bool StreamGzip(const std::filesystem::path& path, const BytesFn& on_bytes) {
  gzFile gz = gzopen(path.string().c_str(), "rb");
  if (!gz) {
    return false;
  }
  std::vector<char> buf(1 << 16);
  bool ok = true;
  while (true) {
    const int got = gzread(gz, buf.data(), static_cast<unsigned int>(buf.size()));
    if (got < 0) {
      ok = false;
      break;
    }
    if (got == 0) {
      break;
    }
    on_bytes(buf.data(), static_cast<std::size_t>(got));
  }
  gzclose(gz);
  return ok;
}

bool StreamXz(const std::filesystem::path& path, const BytesFn& on_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  lzma_action action = LZMA_RUN;
  bool eof = false;
  bool ok = true;
  while (true) {
    if (strm.avail_in == 0 && !eof) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      const std::streamsize got = in.gcount();
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) {
        eof = true;
        action = LZMA_FINISH;
      }
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();
    const lzma_ret ret = lzma_code(&strm, action);
    const std::size_t produced = out_buf.size() - strm.avail_out;
    if (produced > 0) {
      on_bytes(reinterpret_cast<const char*>(out_buf.data()), produced);
    }
    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK || (eof && strm.avail_in == 0 && produced == 0)) {
      ok = false;
      break;
    }
  }
  lzma_end(&strm);
  return ok;
}

bool StreamBytes(const std::filesystem::path& path, const BytesFn& on_bytes) {
  switch (DetectCompression(path)) {
    case Compression::kGzip:
      return StreamGzip(path, on_bytes);
    case Compression::kXz:
      return StreamXz(path, on_bytes);
    case Compression::kNone:
      break;
  }
  return StreamPlain(path, on_bytes);
}

bool StreamLines(const std::filesystem::path& path, const RecordFn& fn) {
  std::string pending;
  const bool ok = StreamBytes(path, [&](const char* data, std::size_t n) {
    pending.append(data, n);
    std::size_t start = 0;
    while (true) {
      const std::size_t pos = pending.find('\n', start);
      if (pos == std::string::npos) {
        break;
      }
      fn(pending.substr(start, pos - start));
      start = pos + 1;
    }
    pending.erase(0, start);
  });
  if (ok && !pending.empty()) {
    fn(pending);
  }
  return ok;
}

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

// Bytes at the end of buf that start a UTF-8 sequence not yet complete.
std::size_t IncompleteUtf8Tail(const std::string& buf) {
  const std::size_t n = buf.size();
  for (std::size_t back = 1; back <= 3 && back <= n; ++back) {
    const auto c = static_cast<std::uint8_t>(buf[n - back]);
    if ((c & 0xC0) == 0x80) {
      continue;
    }
    std::size_t need = 1;
    if ((c & 0xE0) == 0xC0) {
      need = 2;
    } else if ((c & 0xF0) == 0xE0) {
      need = 3;
    } else if ((c & 0xF8) == 0xF0) {
      need = 4;
    }
    return need > back ? back : 0;
  }
  return 0;
}

bool EmitTextField(const nlohmann::json& record, const std::vector<std::string>& fields, const RecordFn& fn) {
  if (!record.is_object()) {
    return false;
  }
  for (const auto& field : fields) {
    auto it = record.find(field);
    if (it != record.end() && it->is_string()) {
      fn(it->get<std::string>());
      return true;
    }
  }
  return false;
}
}  // namespace

LoadMode ParseLoadMode(std::string_view text) {
  const auto v = ToLowerAscii(std::string(text));
  if (v == "line") return LoadMode::kLine;
  if (v == "chunk") return LoadMode::kChunk;
  throw UnsupportedModeError(std::string(text));
}

std::string_view LoadModeName(LoadMode mode) {
  switch (mode) {
    case LoadMode::kLine:
      return "line";
    case LoadMode::kChunk:
      return "chunk";
  }
  return "line";
}

CorpusReader::CorpusReader(CorpusReadOptions options, Logger logger)
    : options_(std::move(options)), logger_(logger) {
  if (options_.chunk_bytes < 4) {
    options_.chunk_bytes = 4;
  }
}

bool CorpusReader::IsCorpusFile(const std::filesystem::path& path) {
  const auto ext = InnerExtension(path);
  return ext == ".txt" || ext == ".json" || ext == ".jsonl";
}

bool CorpusReader::ForEachRecord(const std::filesystem::path& path, const RecordFn& fn) const {
  const auto ext = InnerExtension(path);
  logger_.Info("Loading file: ", path.string(), " (mode: ", LoadModeName(options_.mode), ")");
  if (ext == ".jsonl") return ReadJsonl(path, fn);
  if (ext == ".json") return ReadJson(path, fn);
  if (options_.mode == LoadMode::kChunk) {
    logger_.Warn("Chunk mode may split words across chunk boundaries. Not recommended for BPE or word-level "
                 "preprocessing.");
    return ReadChunks(path, fn);
  }
  return ReadLines(path, fn);
}

bool CorpusReader::ReadLines(const std::filesystem::path& path, const RecordFn& fn) const {
  logger_.Debug("Reading file line-by-line: ", path.string());
  return StreamLines(path, [&](const std::string& line) { fn(Trim(line)); });
}

bool CorpusReader::ReadChunks(const std::filesystem::path& path, const RecordFn& fn) const {
  logger_.Debug("Reading file in chunks: ", path.string(), " (chunk size: ", options_.chunk_bytes, " bytes)");
  const std::size_t chunk_bytes = options_.chunk_bytes;
  std::string pending;
  const bool ok = StreamBytes(path, [&](const char* data, std::size_t n) {
    pending.append(data, n);
    while (pending.size() >= chunk_bytes) {
      std::string chunk = pending.substr(0, chunk_bytes);
      const std::size_t tail = IncompleteUtf8Tail(chunk);
      chunk.resize(chunk.size() - tail);
      pending.erase(0, chunk.size());
      fn(chunk);
    }
  });
  if (ok && !pending.empty()) {
    fn(pending);
  }
  return ok;
}

bool CorpusReader::ReadJsonl(const std::filesystem::path& path, const RecordFn& fn) const {
  return StreamLines(path, [&](const std::string& line) {
    if (Trim(line).empty()) {
      return;
    }
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      logger_.Debug("Skipping malformed JSON line in ", path.string());
      return;
    }
    EmitTextField(j, options_.json_text_fields, fn);
  });
}

bool CorpusReader::ReadJson(const std::filesystem::path& path, const RecordFn& fn) const {
  std::string payload;
  if (!StreamBytes(path, [&](const char* data, std::size_t n) { payload.append(data, n); })) {
    return false;
  }
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    // Some dumps named .json are really JSON lines.
    std::istringstream iss(payload);
    std::string line;
    while (std::getline(iss, line)) {
      auto record = nlohmann::json::parse(line, nullptr, false);
      if (!record.is_discarded()) {
        EmitTextField(record, options_.json_text_fields, fn);
      }
    }
    return true;
  }
  if (j.is_array()) {
    for (const auto& item : j) {
      EmitTextField(item, options_.json_text_fields, fn);
    }
  } else {
    EmitTextField(j, options_.json_text_fields, fn);
  }
  return true;
}

}  // namespace wordbpe
