#include "matcher.hpp"
#include <algorithm>
#include <cmath>

namespace splice::engine {

    namespace {

        // Scale applied to matches that only hold with indentation ignored.
        constexpr double kIndentDriftWeight = 0.9;

    }

    FuzzyMatcher::FuzzyMatcher(const Normalizer& normalizer, double threshold, size_t min_fuzzy_window)
        : m_normalizer(normalizer), m_threshold(threshold), m_min_fuzzy_window(min_fuzzy_window) {}

    double FuzzyMatcher::threshold_for(size_t window) const {
        // Short anchors are inherently ambiguous, so they must match fully.
        return window >= m_min_fuzzy_window ? m_threshold : 1.0;
    }

    std::vector<MatchCandidate> FuzzyMatcher::find_candidates(const std::vector<std::string>& file_lines,
                                                              const std::vector<std::string>& pattern,
                                                              Region region) const {
        return find_candidates(file_lines, m_normalizer.normalize_all(file_lines), pattern, region);
    }

    std::vector<MatchCandidate> FuzzyMatcher::find_candidates(const std::vector<std::string>& file_lines,
                                                              const std::vector<NormalizedLine>& normalized_file,
                                                              const std::vector<std::string>& pattern,
                                                              Region region) const {
        region.end = std::min(region.end, file_lines.size());
        if (pattern.empty() || region.size() < pattern.size()) return {};

        const std::vector<NormalizedLine> wanted = m_normalizer.normalize_all(pattern);
        std::vector<MatchCandidate> candidates = scan(file_lines, normalized_file, pattern, wanted, region, 1.0);
        if (!candidates.empty()) return candidates;

        // Indentation drift: retry with leading indentation ignored.
        std::vector<NormalizedLine> loose_file(normalized_file.size());
        for (size_t i = region.begin; i < region.end; ++i) {
            loose_file[i] = normalized_file[i].unindented();
        }
        std::vector<NormalizedLine> loose_wanted;
        loose_wanted.reserve(wanted.size());
        for (const auto& w : wanted) loose_wanted.push_back(w.unindented());

        return scan(file_lines, loose_file, pattern, loose_wanted, region, kIndentDriftWeight);
    }

    std::vector<MatchCandidate> FuzzyMatcher::scan(const std::vector<std::string>& file_lines,
                                                   const std::vector<NormalizedLine>& normalized_file,
                                                   const std::vector<std::string>& pattern,
                                                   const std::vector<NormalizedLine>& wanted,
                                                   Region region,
                                                   double weight) const {
        std::vector<MatchCandidate> candidates;
        const size_t len = pattern.size();
        const size_t required = static_cast<size_t>(std::ceil(threshold_for(len) * len - 1e-9));
        const size_t allowed_misses = len - std::min(required, len);

        for (size_t start = region.begin; start + len <= region.end; ++start) {
            size_t fuzzy = 0;
            size_t exact = 0;
            size_t misses = 0;
            for (size_t k = 0; k < len; ++k) {
                if (normalized_file[start + k] == wanted[k]) {
                    ++fuzzy;
                    if (file_lines[start + k] == pattern[k]) ++exact;
                } else if (++misses > allowed_misses) {
                    break;
                }
            }
            if (misses > allowed_misses) continue;

            MatchCandidate c;
            c.start_line = start;
            c.end_line = start + len;
            c.score = weight * static_cast<double>(fuzzy) / static_cast<double>(len);
            c.exact_overlap = exact;
            candidates.push_back(c);
        }

        std::stable_sort(candidates.begin(), candidates.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.start_line < b.start_line;
        });
        return candidates;
    }

    std::vector<MatchCandidate> FuzzyMatcher::find_hunk_candidates(const std::vector<std::string>& file_lines,
                                                                   const std::vector<NormalizedLine>& normalized_file,
                                                                   const Hunk& hunk,
                                                                   Region region) const {
        if (!hunk.old_lines.empty()) {
            return find_candidates(file_lines, normalized_file, hunk.old_lines, region);
        }

        std::vector<std::string> context = hunk.before;
        context.insert(context.end(), hunk.after.begin(), hunk.after.end());

        if (context.empty()) {
            MatchCandidate c;
            size_t point = region.begin;
            if (hunk.at_eof) {
                point = std::min(region.end, file_lines.size());
                // Keep a trailing newline last.
                if (point == file_lines.size() && point > region.begin && file_lines.back().empty()) --point;
            }
            c.start_line = c.end_line = point;
            c.score = 1.0;
            return {c};
        }

        std::vector<MatchCandidate> candidates = find_candidates(file_lines, normalized_file, context, region);
        for (auto& c : candidates) {
            c.start_line += hunk.before.size();
            c.end_line = c.start_line;
        }
        return candidates;
    }

}
