#include <epoch_zones/analysis/sequence.h>

#include <algorithm>

namespace epoch_zones::analysis {

std::optional<SequenceAnalysis> AnalyzeSequence(const ZoneList &zones,
                                                const SequenceOptions &options) {
  if (zones.size() < options.min_zones) {
    return std::nullopt;
  }

  std::vector<const Zone *> ordered;
  for (const auto &zone : zones) {
    ordered.push_back(&zone);
  }
  std::ranges::stable_sort(ordered, {}, [](const Zone *z) { return z->start_idx; });

  std::vector<std::string> labels;
  for (const auto *zone : ordered) {
    labels.push_back(zone->label);
  }

  SequenceAnalysis analysis;
  for (size_t i = 1; i < labels.size(); ++i) {
    ++analysis.transition_counts[labels[i - 1]][labels[i]];
  }
  for (const auto &[from, row] : analysis.transition_counts) {
    int64_t total = 0;
    for (const auto &[_, count] : row) {
      total += count;
    }
    for (const auto &[to, count] : row) {
      analysis.transition_probabilities[from][to] =
          static_cast<double>(count) / static_cast<double>(total);
    }
  }

  std::map<std::string, std::vector<int64_t>> runs;
  for (size_t i = 0; i < labels.size();) {
    size_t j = i;
    while (j < labels.size() && labels[j] == labels[i]) {
      ++j;
    }
    runs[labels[i]].push_back(static_cast<int64_t>(j - i));
    i = j;
  }
  for (const auto &[label, lengths] : runs) {
    int64_t total = 0;
    for (auto length : lengths) {
      total += length;
    }
    analysis.mean_run_length[label] =
        static_cast<double>(total) / static_cast<double>(lengths.size());
    analysis.max_run_length[label] = *std::ranges::max_element(lengths);
  }

  std::map<std::vector<std::string>, int64_t> ngrams;
  for (size_t length = options.min_pattern_length;
       length <= options.max_pattern_length; ++length) {
    for (size_t i = 0; i + length <= labels.size(); ++i) {
      ++ngrams[std::vector<std::string>(labels.begin() + i,
                                        labels.begin() + i + length)];
    }
  }
  for (const auto &[pattern, count] : ngrams) {
    if (count >= options.min_occurrences) {
      analysis.patterns.push_back({pattern, count});
    }
  }
  std::ranges::stable_sort(analysis.patterns, [](const auto &a, const auto &b) {
    return a.occurrences > b.occurrences;
  });
  if (analysis.patterns.size() > options.max_patterns) {
    analysis.patterns.resize(options.max_patterns);
  }
  return analysis;
}

} // namespace epoch_zones::analysis
