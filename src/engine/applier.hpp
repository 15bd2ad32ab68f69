#pragma once

#include <optional>
#include <string>
#include <vector>
#include "splice/types.hpp"

namespace splice::engine {

    /**
     * @brief Splits content on '\n'. join_lines(split_lines(s)) == s for every s.
     * A trailing newline yields a final empty line.
     */
    std::vector<std::string> split_lines(const std::string& content);
    std::string join_lines(const std::vector<std::string>& lines);

    /**
     * @brief Cumulative line delta of the hunks applied to one file.
     */
    class OffsetTracker {
    public:
        explicit OffsetTracker(size_t original_size = 0);

        void record(long delta);
        long delta() const { return m_delta; }

        /**
         * @brief Throws std::logic_error if original size + delta != actual_size.
         */
        void verify(size_t actual_size) const;

    private:
        size_t m_original_size;
        long m_delta = 0;
    };

    /**
     * @brief In-progress content of one file during an Update.
     */
    struct FileState {
        std::string path;
        std::vector<std::string> lines;
        OffsetTracker tracker;
        std::optional<size_t> prior_end; // end of the last applied hunk
    };

    class PatchApplier {
    public:
        /**
         * @brief Replaces [span.start_line, span.end_line) with new_lines verbatim.
         * @return new_lines.size() - span length.
         */
        static long apply(std::vector<std::string>& lines,
                          const MatchCandidate& span,
                          const std::vector<std::string>& new_lines);

        /**
         * @brief Applies one resolved hunk to the file state and advances prior_end.
         */
        static void apply(FileState& state,
                          const MatchCandidate& span,
                          const std::vector<std::string>& new_lines);
    };

}
