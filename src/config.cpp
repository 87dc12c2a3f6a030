#include "wordbpe/config.hpp"

#include <cctype>
#include <fstream>
#include <string>
#include <type_traits>

#include <yaml-cpp/yaml.h>

#include "wordbpe/errors.hpp"

namespace wordbpe {

namespace {
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

std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

std::size_t ParseSize(const std::string& s, std::size_t def_val) {
  try {
    std::size_t pos = 0;
    const auto v = std::stoull(s, &pos, 10);
    return pos == s.size() ? static_cast<std::size_t>(v) : def_val;
  } catch (const std::exception&) {
    return def_val;
  }
}

bool ParseBool(const std::string& s, bool def_val) {
  const auto v = ToLowerAscii(Trim(s));
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  return def_val;
}

const char* BoolText(bool v) { return v ? "true" : "false"; }

template <typename T>
T RequireType(const YAML::Node& root, const char* key, const char* type_name) {
  const YAML::Node node = root[key];
  if (!node.IsScalar()) {
    throw ConfigError(std::string(key) + " must be " + type_name);
  }
  try {
    if constexpr (std::is_same_v<T, std::size_t>) {
      const auto v = node.as<long long>();
      if (v < 0) {
        throw ConfigError(std::string(key) + " must be " + type_name);
      }
      return static_cast<std::size_t>(v);
    } else {
      return node.as<T>();
    }
  } catch (const YAML::Exception&) {
    throw ConfigError(std::string(key) + " must be " + type_name);
  }
}
}  // namespace

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    const auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    auto key = Trim(trimmed.substr(0, eq));
    auto val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 &&
        ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[std::move(key)] = std::move(val);
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const EnvMap& env, const Logger& logger) {
  auto get = [&](const std::string& key) -> const std::string* {
    auto it = env.find(key);
    return it == env.end() ? nullptr : &it->second;
  };
  if (auto v = get("DATA_PATH")) cfg.data_dir = *v;
  if (auto v = get("BASE_DIR")) cfg.base_dir = *v;
  if (auto v = get("TOKENIZER_OUTPUT_DIR")) cfg.output_dir = *v;
  if (auto v = get("TOKENIZER_MERGES")) cfg.num_merges = ParseSize(*v, cfg.num_merges);
  if (auto v = get("LOWERCASE")) cfg.lowercase = ParseBool(*v, cfg.lowercase);
  if (auto v = get("THREADS")) cfg.threads = ParseSize(*v, cfg.threads);
  if (auto v = get("LOG_INTERVAL")) cfg.log_interval = ParseSize(*v, cfg.log_interval);
  if (auto v = get("DEBUG")) cfg.debug = ParseBool(*v, cfg.debug);
  if (auto v = get("LOAD_MODE")) cfg.load_mode = ParseLoadMode(*v);
  logger.Debug("Applied ", env.size(), " .env entries");
}

bool LoadConfigFile(Config& cfg, const std::string& path, const Logger& logger) {
  std::ifstream in(path);
  if (!in) {
    logger.Warn("Config file not found: ", path);
    return false;
  }
  in.close();
  YAML::Node loaded;
  try {
    loaded = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("malformed config file: " + path + " (" + e.what() + ")");
  }
  const YAML::Node& j = loaded;
  if (j.IsNull()) {
    logger.Warn("Config file is empty: ", path);
    return true;
  }
  if (!j.IsMap()) {
    throw ConfigError("malformed config file: " + path + " (expected a mapping)");
  }
  logger.Info("Loaded config file: ", path);

  if (j["debug"]) {
    const auto v = RequireType<bool>(j, "debug", "a boolean");
    logger.Info("Overriding 'debug': ", BoolText(cfg.debug), " -> ", BoolText(v));
    cfg.debug = v;
  }
  if (j["tokenizer_merges"]) {
    const auto v = RequireType<std::size_t>(j, "tokenizer_merges", "a non-negative integer");
    logger.Info("Overriding 'tokenizer_merges': ", cfg.num_merges, " -> ", v);
    cfg.num_merges = v;
  }
  if (j["lowercase"]) {
    const auto v = RequireType<bool>(j, "lowercase", "a boolean");
    logger.Info("Overriding 'lowercase': ", BoolText(cfg.lowercase), " -> ", BoolText(v));
    cfg.lowercase = v;
  }
  if (j["tokenizer_output_dir"]) {
    const auto v = RequireType<std::string>(j, "tokenizer_output_dir", "a string");
    logger.Info("Overriding 'tokenizer_output_dir': ", cfg.output_dir.string(), " -> ", v);
    cfg.output_dir = v;
  }
  if (j["data_path"]) {
    const auto v = RequireType<std::string>(j, "data_path", "a string");
    logger.Info("Overriding 'data_path': ", cfg.data_dir.string(), " -> ", v);
    cfg.data_dir = v;
  }
  if (j["load_mode"]) {
    const auto v = RequireType<std::string>(j, "load_mode", "a string");
    const auto mode = ParseLoadMode(v);
    logger.Info("Overriding 'load_mode': ", LoadModeName(cfg.load_mode), " -> ", LoadModeName(mode));
    cfg.load_mode = mode;
  }
  if (j["threads"]) {
    cfg.threads = RequireType<std::size_t>(j, "threads", "a non-negative integer");
  }
  if (j["log_interval"]) {
    cfg.log_interval = RequireType<std::size_t>(j, "log_interval", "a non-negative integer");
  }
  if (j["write_tokenizer_json"]) {
    cfg.write_tokenizer_json = RequireType<bool>(j, "write_tokenizer_json", "a boolean");
  }
  return true;
}

void ValidateConfig(const Config& cfg) {
  if (cfg.num_merges == 0) {
    throw ConfigError("tokenizer_merges must be positive");
  }
}

std::filesystem::path ResolvePath(const std::filesystem::path& base_dir, const std::filesystem::path& value) {
  if (value.empty() || value.is_absolute()) {
    return value;
  }
  std::error_code ec;
  const auto base_resolved = base_dir / value;
  if (std::filesystem::exists(base_resolved, ec)) {
    return base_resolved;
  }
  if (std::filesystem::exists(value, ec)) {
    return value;
  }
  return base_resolved;
}

std::filesystem::path EffectiveOutputDir(const Config& cfg) {
  if (cfg.output_dir.empty()) {
    return cfg.base_dir / "data" / "vocabulary";
  }
  return ResolvePath(cfg.base_dir, cfg.output_dir);
}

void LogConfig(const Config& cfg, const Logger& logger) {
  logger.Info("Data dir:      ", cfg.data_dir.string());
  logger.Info("Base dir:      ", cfg.base_dir.string());
  logger.Info("Output dir:    ", EffectiveOutputDir(cfg).string());
  logger.Info("Merges:        ", cfg.num_merges);
  logger.Info("Lowercase:     ", BoolText(cfg.lowercase));
  logger.Info("Load mode:     ", LoadModeName(cfg.load_mode));
  logger.Info("Threads:       ", cfg.threads);
}

}  // namespace wordbpe
