#include "wordbpe/trainer.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "wordbpe/formats.hpp"
#include "wordbpe/merge.hpp"
#include "wordbpe/pair_counter.hpp"
#include "wordbpe/symbolizer.hpp"

namespace wordbpe {

std::string_view TrainingStateName(TrainingState state) {
  switch (state) {
    case TrainingState::kInitializing:
      return "initializing";
    case TrainingState::kIterating:
      return "iterating";
    case TrainingState::kConverged:
      return "converged";
    case TrainingState::kExhausted:
      return "exhausted";
  }
  return "initializing";
}

TrainingStats Summarize(const TrainingArtifacts& artifacts) {
  TrainingStats stats;
  stats.entry_count = artifacts.vocab.size();
  stats.merge_count = artifacts.merges.size();
  const std::uint64_t total_freq = artifacts.vocab.Total();
  if (total_freq > 0) {
    stats.avg_symbols_per_word =
        static_cast<double>(WeightedSymbolCount(artifacts.vocab)) / static_cast<double>(total_freq);
  }
  return stats;
}

BpeTrainer::BpeTrainer(TrainerOptions options, Logger logger) : options_(options), logger_(logger) {
  if (options_.num_merges == 0) {
    throw std::invalid_argument("num_merges must be positive");
  }
  if (options_.log_interval == 0) {
    options_.log_interval = 1;
  }
  logger_.Info("Initialized BPE trainer with num_merges=", options_.num_merges);
}

void BpeTrainer::Begin(const WordFrequencyTable& words) {
  state_ = TrainingState::kInitializing;
  artifacts_.vocab = Symbolize(words);
  artifacts_.merges.clear();
  started_ = true;
  state_ = TrainingState::kIterating;
  logger_.Info("Initialized vocab with ", artifacts_.vocab.size(), " entries.");
}

bool BpeTrainer::Step() {
  if (state_ != TrainingState::kIterating) {
    return false;
  }
  const std::size_t i = artifacts_.merges.size();
  if (i >= options_.num_merges) {
    state_ = TrainingState::kExhausted;
    return false;
  }

  const auto counts = CountPairs(artifacts_.vocab, options_.num_threads);
  if (counts.empty()) {
    state_ = TrainingState::kConverged;
    logger_.Info("No more symbol pairs left after ", i, " merges.");
    return false;
  }

  auto best = SelectBestPair(counts);
  logger_.Debug("Pair (", best.first, ", ", best.second, ") count=", counts.Count(best), " among ", counts.size(),
                " pairs");
  artifacts_.vocab = ApplyMerge(best, artifacts_.vocab);
  artifacts_.merges.push_back(MergeRule{std::move(best.first), std::move(best.second), i});

  if (i % options_.log_interval == 0 || i + 1 == options_.num_merges) {
    const auto& rule = artifacts_.merges.back();
    logger_.Info("Merge ", i + 1, "/", options_.num_merges, ": (", rule.left, ", ", rule.right, ") -> ",
                 rule.Merged());
  }

  if (artifacts_.merges.size() >= options_.num_merges) {
    state_ = TrainingState::kExhausted;
  }
  return true;
}

const MergeHistory& BpeTrainer::Fit(const WordFrequencyTable& words) {
  logger_.Info("Starting BPE training...");
  Begin(words);
  while (Step()) {
  }
  logger_.Info("Training complete (", TrainingStateName(state_), "). Learned ", artifacts_.merges.size(),
               " merge operations.");
  return artifacts_.merges;
}

void BpeTrainer::SaveArtifacts(const std::filesystem::path& output_dir) const {
  wordbpe::SaveArtifacts(artifacts_, output_dir, logger_);
}

std::optional<TrainingStats> BpeTrainer::Statistics() const {
  if (!started_) {
    return std::nullopt;
  }
  return Summarize(artifacts_);
}

void BpeTrainer::LogStatistics() const {
  const auto stats = Statistics();
  if (!stats) {
    logger_.Warn("No vocabulary found. Run Fit() first.");
    return;
  }
  std::ostringstream avg;
  avg << std::fixed << std::setprecision(2) << stats->avg_symbols_per_word;
  logger_.Info("BPE merge statistics:");
  logger_.Info("  Unique symbolized words in final vocab: ", stats->entry_count);
  logger_.Info("  Merge operations learned: ", stats->merge_count);
  logger_.Info("  Avg symbols per word (weighted): ", avg.str());
}

}  // namespace wordbpe
