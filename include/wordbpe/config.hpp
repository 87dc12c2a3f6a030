#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "wordbpe/corpus_reader.hpp"
#include "wordbpe/logging.hpp"

namespace wordbpe {

struct Config {
  std::string env_path = ".env";
  std::string config_path;
  std::filesystem::path data_dir = "datasets/raw";
  std::filesystem::path base_dir = "artifacts";
  std::filesystem::path output_dir;  // empty -> <base_dir>/data/vocabulary
  std::size_t num_merges = 10000;
  bool lowercase = false;
  LoadMode load_mode = LoadMode::kLine;
  std::size_t threads = 1;  // 0 -> hardware concurrency
  std::size_t log_interval = 100;
  bool debug = false;
  bool write_tokenizer_json = false;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// KEY=VALUE lines; '#' comments, optional quotes, leading BOM tolerated.
// A missing file yields an empty map.
[[nodiscard]] EnvMap ReadEnvFile(const std::string& path);
// Unparseable numbers and booleans keep the previous value. Throws
// UnsupportedModeError on an unknown LOAD_MODE.
void ApplyEnvOverrides(Config& cfg, const EnvMap& env, const Logger& logger = {});

// Applies a YAML config file (plain JSON also parses). Returns false if the
// file does not exist. Throws ConfigError on malformed YAML or a wrongly typed
// value, UnsupportedModeError on an unknown load_mode.
bool LoadConfigFile(Config& cfg, const std::string& path, const Logger& logger = {});

// Throws ConfigError when a value is out of range.
void ValidateConfig(const Config& cfg);

// Absolute paths are kept. Relative ones resolve against base_dir, then the
// working directory, whichever exists; otherwise against base_dir.
[[nodiscard]] std::filesystem::path ResolvePath(const std::filesystem::path& base_dir,
                                                const std::filesystem::path& value);

[[nodiscard]] std::filesystem::path EffectiveOutputDir(const Config& cfg);

void LogConfig(const Config& cfg, const Logger& logger);

}  // namespace wordbpe
