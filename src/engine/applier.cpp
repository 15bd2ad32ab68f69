#include "applier.hpp"
#include <cstddef>
#include <stdexcept>

namespace splice::engine {

    std::vector<std::string> split_lines(const std::string& content) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (true) {
            size_t nl = content.find('\n', start);
            if (nl == std::string::npos) {
                lines.push_back(content.substr(start));
                break;
            }
            lines.push_back(content.substr(start, nl - start));
            start = nl + 1;
        }
        return lines;
    }

    std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i) out += '\n';
            out += lines[i];
        }
        return out;
    }

    OffsetTracker::OffsetTracker(size_t original_size) : m_original_size(original_size) {}

    void OffsetTracker::record(long delta) {
        m_delta += delta;
    }

    void OffsetTracker::verify(size_t actual_size) const {
        long expected = static_cast<long>(m_original_size) + m_delta;
        if (expected != static_cast<long>(actual_size)) {
            throw std::logic_error("Line offset mismatch: expected " + std::to_string(expected) +
                                   " lines, found " + std::to_string(actual_size));
        }
    }

    long PatchApplier::apply(std::vector<std::string>& lines,
                             const MatchCandidate& span,
                             const std::vector<std::string>& new_lines) {
        if (span.start_line > span.end_line || span.end_line > lines.size()) {
            throw std::out_of_range("Span [" + std::to_string(span.start_line) + ", " +
                                    std::to_string(span.end_line) + ") outside file of " +
                                    std::to_string(lines.size()) + " lines");
        }

        auto first = lines.begin() + static_cast<std::ptrdiff_t>(span.start_line);
        auto last = lines.begin() + static_cast<std::ptrdiff_t>(span.end_line);
        first = lines.erase(first, last);
        lines.insert(first, new_lines.begin(), new_lines.end());

        return static_cast<long>(new_lines.size()) - static_cast<long>(span.end_line - span.start_line);
    }

    void PatchApplier::apply(FileState& state,
                             const MatchCandidate& span,
                             const std::vector<std::string>& new_lines) {
        state.tracker.record(apply(state.lines, span, new_lines));
        state.prior_end = span.start_line + new_lines.size();
    }

}
