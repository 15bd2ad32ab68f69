#pragma once

#include <optional>
#include <string>
#include <vector>
#include "splice/types.hpp"
#include "matcher.hpp"
#include "normalizer.hpp"

namespace splice::engine {

    /**
     * @brief Where a hunk may be searched once its "@@" scope lines are resolved.
     *
     * block is the innermost scope's indented body. tail runs from the scope
     * line itself to the end of the enclosing region and is only searched when
     * block yields nothing. Both cover the whole file for unscoped hunks.
     */
    struct ScopeRegion {
        Region block;
        Region tail;
    };

    class ScopeDisambiguator {
    public:
        ScopeDisambiguator(const Normalizer& normalizer, size_t context_window = 3);

        /**
         * @brief Reduces candidates to exactly one.
         *
         * In order, each step only while more than one candidate remains:
         * highest score, end-of-file position for EOF hunks, best agreement of
         * the surrounding lines with the hunk's context (near window first,
         * then all supplied context), most byte-exact old lines, nearest to
         * prior_end.
         * Throws PatchError(NoMatch) for an empty list and
         * PatchError(AmbiguousMatch) when a tie survives every step.
         */
        MatchCandidate resolve(std::vector<MatchCandidate> candidates,
                               const Hunk& hunk,
                               const std::vector<std::string>& file_lines,
                               const std::vector<NormalizedLine>& normalized_file,
                               Region region,
                               std::optional<size_t> prior_end) const;

        /**
         * @brief Walks the hunk's scope lines outermost first.
         * Throws PatchError(NoMatch) or PatchError(AmbiguousMatch) per scope line.
         */
        ScopeRegion resolve_scope(const Hunk& hunk,
                                  const std::vector<std::string>& file_lines,
                                  const std::vector<NormalizedLine>& normalized_file,
                                  std::optional<size_t> prior_end) const;

        /**
         * @brief Lines nested under the given line by indentation.
         */
        Region block_of(size_t line,
                        const std::vector<std::string>& file_lines,
                        Region within) const;

    private:
        const Normalizer& m_normalizer;
        size_t m_context_window;

        std::pair<size_t, size_t> context_score(const MatchCandidate& candidate,
                                                const Hunk& hunk,
                                                const std::vector<std::string>& file_lines,
                                                const std::vector<NormalizedLine>& normalized_file,
                                                size_t window) const;
    };

}
