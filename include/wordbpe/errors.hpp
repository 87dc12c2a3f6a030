#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace wordbpe {

// Corpus loading mode other than "line" or "chunk".
class UnsupportedModeError : public std::invalid_argument {
 public:
  explicit UnsupportedModeError(const std::string& mode)
      : std::invalid_argument("unsupported load mode: " + mode + " (use 'line' or 'chunk')"), mode_(mode) {}

  [[nodiscard]] const std::string& mode() const noexcept { return mode_; }

 private:
  std::string mode_;
};

// Precondition violation: an operation that needs at least one element got none.
class EmptyInputError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class CorpusError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Persisting training output failed. The trained state in memory is unaffected.
class ArtifactIoError : public std::runtime_error {
 public:
  ArtifactIoError(const std::string& what, std::filesystem::path path)
      : std::runtime_error(what + ": " + path.string()), path_(std::move(path)) {}

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace wordbpe
