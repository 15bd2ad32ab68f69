#pragma once

#include <string>
#include <vector>
#include "splice/types.hpp"
#include "normalizer.hpp"

namespace splice::engine {

    /**
     * @brief Half-open line range [begin, end) of the current file.
     */
    struct Region {
        size_t begin = 0;
        size_t end = 0;

        bool empty() const { return begin >= end; }
        size_t size() const { return empty() ? 0 : end - begin; }
    };

    class FuzzyMatcher {
    public:
        FuzzyMatcher(const Normalizer& normalizer, double threshold = 0.8, size_t min_fuzzy_window = 3);

        /**
         * @brief Slides a window of pattern.size() lines across the region.
         *
         * Every window whose fuzzy score reaches the acceptance threshold is
         * returned, best first (score, then position). When no window matches
         * with indentation intact, lines are compared with their indentation
         * removed and those candidates score below 1.0. Ties are left for the
         * disambiguator.
         */
        std::vector<MatchCandidate> find_candidates(const std::vector<std::string>& file_lines,
                                                    const std::vector<std::string>& pattern,
                                                    Region region) const;

        std::vector<MatchCandidate> find_candidates(const std::vector<std::string>& file_lines,
                                                    const std::vector<NormalizedLine>& normalized_file,
                                                    const std::vector<std::string>& pattern,
                                                    Region region) const;

        /**
         * @brief Candidates for a whole hunk, expressed as the span to replace.
         *
         * Replacement hunks search their old lines. Pure insertions search the
         * surrounding context and yield an empty span at the insertion point;
         * with no context at all the insertion point is the start of the region
         * (its end for end-of-file hunks).
         */
        std::vector<MatchCandidate> find_hunk_candidates(const std::vector<std::string>& file_lines,
                                                         const std::vector<NormalizedLine>& normalized_file,
                                                         const Hunk& hunk,
                                                         Region region) const;

        /**
         * @brief Minimum score a window of the given length must reach.
         */
        double threshold_for(size_t window) const;

    private:
        const Normalizer& m_normalizer;

        std::vector<MatchCandidate> scan(const std::vector<std::string>& file_lines,
                                         const std::vector<NormalizedLine>& normalized_file,
                                         const std::vector<std::string>& pattern,
                                         const std::vector<NormalizedLine>& wanted,
                                         Region region,
                                         double weight) const;

        double m_threshold;
        size_t m_min_fuzzy_window;
    };

}
