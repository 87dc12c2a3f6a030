#include <iostream>
#include <vector>

#include "wordbpe/convert.hpp"
#include "wordbpe/trainer.hpp"
#include "wordbpe/words.hpp"

int main() {
  using namespace wordbpe;

  std::vector<std::string> corpus = {
      "low low low low low lower lower",
      "newest newest newest newest newest newest",
      "widest widest widest",
  };

  WordCounter counter;
  for (const auto& line : corpus) {
    counter.AddText(line);
  }

  TrainerOptions opts;
  opts.num_merges = 10;
  opts.num_threads = 2;
  BpeTrainer trainer(opts, Logger(std::cout));
  const auto& merges = trainer.Fit(counter.counts());
  trainer.LogStatistics();
  trainer.SaveArtifacts(".");

  std::cout << "Merges:";
  for (const auto& rule : merges) {
    std::cout << " (" << rule.left << ", " << rule.right << ")";
  }
  std::cout << "\nCompact vocabulary:\n";
  for (const auto& [seq, freq] : ToCompact(trainer.vocab())) {
    std::cout << "  " << JoinSymbols(seq) << " : " << freq << '\n';
  }
  return 0;
}
