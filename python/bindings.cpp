#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "wordbpe/convert.hpp"
#include "wordbpe/errors.hpp"
#include "wordbpe/logging.hpp"
#include "wordbpe/trainer.hpp"
#include "wordbpe/words.hpp"

namespace py = pybind11;
using namespace wordbpe;

namespace {
// dict iteration order is insertion order, which the trainer relies on for
// tie-breaking.
WordFrequencyTable TableFromDict(const py::dict& words) {
  WordFrequencyTable table;
  table.Reserve(words.size());
  for (const auto& item : words) {
    table.Add(item.first.cast<std::string>(), item.second.cast<std::uint64_t>());
  }
  return table;
}

py::dict TableToDict(const WordFrequencyTable& table) {
  py::dict out;
  for (const auto& [word, count] : table) {
    out[py::str(word)] = count;
  }
  return out;
}

py::dict VocabToDict(const Vocabulary& vocab) {
  py::dict out;
  for (const auto& [seq, freq] : vocab) {
    out[py::tuple(py::cast(seq))] = freq;
  }
  return out;
}

Vocabulary VocabFromDict(const py::dict& d) {
  Vocabulary vocab;
  for (const auto& item : d) {
    vocab.Add(item.first.cast<SymbolSequence>(), item.second.cast<std::uint64_t>());
  }
  return vocab;
}

std::vector<std::pair<std::string, std::string>> MergesToList(const MergeHistory& merges) {
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(merges.size());
  for (const auto& rule : merges) {
    out.emplace_back(rule.left, rule.right);
  }
  return out;
}
}  // namespace

PYBIND11_MODULE(pywordbpe, m) {
  m.attr("END_OF_WORD") = std::string(kEndOfWord);

  py::class_<TrainerOptions>(m, "TrainerOptions")
      .def(py::init<>())
      .def_readwrite("num_merges", &TrainerOptions::num_merges)
      .def_readwrite("num_threads", &TrainerOptions::num_threads)
      .def_readwrite("log_interval", &TrainerOptions::log_interval);

  py::class_<TrainingStats>(m, "TrainingStats")
      .def_readonly("entry_count", &TrainingStats::entry_count)
      .def_readonly("merge_count", &TrainingStats::merge_count)
      .def_readonly("avg_symbols_per_word", &TrainingStats::avg_symbols_per_word);

  py::class_<BpeTrainer>(m, "BpeTrainer")
      .def(py::init([](TrainerOptions options, bool verbose, bool debug) {
             // Log lines go to the process's stderr, like the wordbpe_train tool.
             if (!verbose && !debug) {
               return BpeTrainer(options);
             }
             return BpeTrainer(options, Logger(std::cerr, debug ? LogLevel::kDebug : LogLevel::kInfo));
           }),
           py::arg("options") = TrainerOptions{}, py::arg("verbose") = false, py::arg("debug") = false)
      .def("fit",
           [](BpeTrainer& self, const py::dict& words) { return MergesToList(self.Fit(TableFromDict(words))); })
      .def("save_artifacts", &BpeTrainer::SaveArtifacts)
      .def("statistics", &BpeTrainer::Statistics)
      .def("log_statistics", &BpeTrainer::LogStatistics)
      .def_property_readonly("state",
                             [](const BpeTrainer& self) { return std::string(TrainingStateName(self.state())); })
      .def_property_readonly("vocab", [](const BpeTrainer& self) { return VocabToDict(self.vocab()); })
      .def_property_readonly("merges", [](const BpeTrainer& self) { return MergesToList(self.merges()); });

  m.def("extract_words", &ExtractWords, py::arg("text"), py::arg("lowercase") = false);
  m.def(
      "count_words",
      [](const std::string& input_dir, bool lowercase) {
        WordCountOptions opts;
        opts.lowercase = lowercase;
        return TableToDict(BuildWordFrequencies(input_dir, opts));
      },
      py::arg("input_dir"), py::arg("lowercase") = false);
  m.def("to_compact", [](const py::dict& vocab) { return VocabToDict(ToCompact(VocabFromDict(vocab))); });
  m.def("to_expanded", [](const py::dict& vocab) { return VocabToDict(ToExpanded(VocabFromDict(vocab))); });

  py::register_exception<EmptyInputError>(m, "EmptyInputError", PyExc_ValueError);
  py::register_exception<UnsupportedModeError>(m, "UnsupportedModeError", PyExc_ValueError);
  py::register_exception<ArtifactIoError>(m, "ArtifactIoError", PyExc_OSError);
  py::register_exception<CorpusError>(m, "CorpusError", PyExc_OSError);
}
