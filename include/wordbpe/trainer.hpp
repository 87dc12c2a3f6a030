#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include "wordbpe/logging.hpp"
#include "wordbpe/vocabulary.hpp"

namespace wordbpe {

struct TrainerOptions {
  std::size_t num_merges = 10000;
  std::size_t num_threads = 1;
  std::size_t log_interval = 100;
};

enum class TrainingState { kInitializing, kIterating, kConverged, kExhausted };

[[nodiscard]] std::string_view TrainingStateName(TrainingState state);

struct TrainingStats {
  std::size_t entry_count = 0;
  std::size_t merge_count = 0;
  double avg_symbols_per_word = 0.0;
};

[[nodiscard]] TrainingStats Summarize(const TrainingArtifacts& artifacts);

class Trainer {
 public:
  virtual ~Trainer() = default;

  // Learns from a word frequency table and returns the learned merges.
  virtual const MergeHistory& Fit(const WordFrequencyTable& words) = 0;
  virtual void SaveArtifacts(const std::filesystem::path& output_dir) const = 0;
  virtual void LogStatistics() const = 0;
};

// Merge-budgeted BPE over a word frequency table (Sennrich et al., 2016).
// Each iteration recounts pairs over the whole vocabulary, merges the best
// one everywhere and records it.
class BpeTrainer final : public Trainer {
 public:
  explicit BpeTrainer(TrainerOptions options = {}, Logger logger = {});

  const MergeHistory& Fit(const WordFrequencyTable& words) override;
  void SaveArtifacts(const std::filesystem::path& output_dir) const override;
  void LogStatistics() const override;

  // Symbolizes words and enters the iterating state, discarding any
  // previous run.
  void Begin(const WordFrequencyTable& words);

  // Runs one count/select/merge iteration. Returns false once training has
  // converged or the merge budget is used up.
  bool Step();

  [[nodiscard]] TrainingState state() const { return state_; }
  [[nodiscard]] const TrainerOptions& options() const { return options_; }
  [[nodiscard]] const Vocabulary& vocab() const { return artifacts_.vocab; }
  [[nodiscard]] const MergeHistory& merges() const { return artifacts_.merges; }
  [[nodiscard]] const TrainingArtifacts& artifacts() const { return artifacts_; }

  // Empty until Begin or Fit has run.
  [[nodiscard]] std::optional<TrainingStats> Statistics() const;

 private:
  TrainerOptions options_;
  Logger logger_;
  TrainingState state_ = TrainingState::kInitializing;
  bool started_ = false;
  TrainingArtifacts artifacts_;
};

}  // namespace wordbpe
