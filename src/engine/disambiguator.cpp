#include "disambiguator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>

namespace splice::engine {

    namespace {

        template <typename Key>
        void keep_best(std::vector<MatchCandidate>& candidates, Key key) {
            if (candidates.size() < 2) return;
            auto best = key(candidates.front());
            for (const auto& c : candidates) best = std::max(best, key(c));
            candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                            [&](const MatchCandidate& c) { return key(c) != best; }),
                             candidates.end());
        }

        void keep_nearest(std::vector<MatchCandidate>& candidates, size_t point) {
            keep_best(candidates, [point](const MatchCandidate& c) {
                size_t distance = c.start_line >= point ? c.start_line - point : point - c.start_line;
                return std::numeric_limits<size_t>::max() - distance;
            });
        }

        std::string list_lines(const std::vector<MatchCandidate>& candidates) {
            std::string out;
            for (const auto& c : candidates) {
                if (!out.empty()) out += ", ";
                out += std::to_string(c.start_line + 1);
            }
            return out;
        }

        std::string strip_indent(const std::string& normalized) {
            size_t first = normalized.find_first_not_of(' ');
            return first == std::string::npos ? std::string() : normalized.substr(first);
        }

        std::string trim(const std::string& s) {
            size_t first = s.find_first_not_of(" \t\r");
            if (first == std::string::npos) return "";
            size_t last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }

    }

    ScopeDisambiguator::ScopeDisambiguator(const Normalizer& normalizer, size_t context_window)
        : m_normalizer(normalizer), m_context_window(context_window) {}

    MatchCandidate ScopeDisambiguator::resolve(std::vector<MatchCandidate> candidates,
                                               const Hunk& hunk,
                                               const std::vector<std::string>& file_lines,
                                               const std::vector<NormalizedLine>& normalized_file,
                                               Region region,
                                               std::optional<size_t> prior_end) const {
        if (candidates.empty()) {
            throw PatchError(ErrorKind::NoMatch, "No location matches the hunk");
        }

        keep_best(candidates, [](const MatchCandidate& c) { return c.score; });

        if (hunk.at_eof && candidates.size() > 1) {
            size_t eof = std::min(region.end, file_lines.size());
            while (eof > region.begin && normalized_file[eof - 1].text.empty()) --eof;

            std::vector<MatchCandidate> at_end;
            for (const auto& c : candidates) {
                if (c.end_line + hunk.after.size() >= eof) at_end.push_back(c);
            }
            if (!at_end.empty()) candidates = std::move(at_end);
        }

        if (candidates.size() > 1 && m_context_window > 0) {
            keep_best(candidates, [&](const MatchCandidate& c) {
                return context_score(c, hunk, file_lines, normalized_file, m_context_window);
            });
        }
        if (candidates.size() > 1) {
            keep_best(candidates, [&](const MatchCandidate& c) {
                return context_score(c, hunk, file_lines, normalized_file, std::numeric_limits<size_t>::max());
            });
        }

        // Byte-exact old lines only count once the surrounding context agrees.
        keep_best(candidates, [](const MatchCandidate& c) { return c.exact_overlap; });

        if (candidates.size() > 1 && prior_end) {
            keep_nearest(candidates, *prior_end);
        }

        if (candidates.size() > 1) {
            throw PatchError(ErrorKind::AmbiguousMatch,
                             "Ambiguous match: " + std::to_string(candidates.size()) +
                             " equally good locations at lines " + list_lines(candidates) +
                             "; add context that identifies the enclosing definition");
        }
        return candidates.front();
    }

    ScopeRegion ScopeDisambiguator::resolve_scope(const Hunk& hunk,
                                                  const std::vector<std::string>& file_lines,
                                                  const std::vector<NormalizedLine>& normalized_file,
                                                  std::optional<size_t> prior_end) const {
        const Region full{0, file_lines.size()};
        ScopeRegion result{full, full};

        for (const auto& scope_line : hunk.scope) {
            const std::string target = strip_indent(m_normalizer.normalize(scope_line).text);
            const std::string raw_target = trim(scope_line);

            auto search = [&](Region where, bool prefix) {
                std::vector<MatchCandidate> found;
                for (size_t i = where.begin; i < where.end; ++i) {
                    const std::string text = strip_indent(normalized_file[i].text);
                    bool hit = prefix ? (!text.empty() && text.rfind(target, 0) == 0) : text == target;
                    if (!hit) continue;
                    MatchCandidate c;
                    c.start_line = i;
                    c.end_line = i + 1;
                    c.score = 1.0;
                    c.exact_overlap = trim(file_lines[i]) == raw_target ? 1 : 0;
                    found.push_back(c);
                }
                return found;
            };

            std::vector<MatchCandidate> candidates = search(result.block, false);
            if (candidates.empty()) candidates = search(result.block, true);
            if (candidates.empty() && (result.tail.begin != result.block.begin || result.tail.end != result.block.end)) {
                candidates = search(result.tail, false);
                if (candidates.empty()) candidates = search(result.tail, true);
            }
            if (candidates.empty()) {
                throw PatchError(ErrorKind::NoMatch, "Scope line not found: " + scope_line);
            }

            keep_best(candidates, [](const MatchCandidate& c) { return c.exact_overlap; });
            if (candidates.size() > 1 && prior_end) keep_nearest(candidates, *prior_end);
            if (candidates.size() > 1) {
                throw PatchError(ErrorKind::AmbiguousMatch,
                                 "Scope line '" + scope_line + "' is ambiguous at lines " + list_lines(candidates));
            }

            const size_t line = candidates.front().start_line;
            const Region enclosing = line >= result.block.begin && line < result.block.end ? result.block : result.tail;
            result.block = block_of(line, file_lines, enclosing);
            result.tail = Region{line, enclosing.end};
        }
        return result;
    }

    Region ScopeDisambiguator::block_of(size_t line,
                                        const std::vector<std::string>& file_lines,
                                        Region within) const {
        const size_t indent = m_normalizer.indent_width(file_lines[line]);
        size_t end = line + 1;
        const size_t limit = std::min(within.end, file_lines.size());
        while (end < limit) {
            size_t width = m_normalizer.indent_width(file_lines[end]);
            if (width != std::string::npos && width <= indent) break;
            ++end;
        }
        return Region{line + 1, end};
    }

    std::pair<size_t, size_t> ScopeDisambiguator::context_score(const MatchCandidate& candidate,
                                                                const Hunk& hunk,
                                                                const std::vector<std::string>& file_lines,
                                                                const std::vector<NormalizedLine>& normalized_file,
                                                                size_t window) const {
        size_t fuzzy = 0;
        size_t exact = 0;

        const size_t above = std::min(window, hunk.before.size());
        for (size_t k = 1; k <= above && k <= candidate.start_line; ++k) {
            const size_t line = candidate.start_line - k;
            const std::string& wanted = hunk.before[hunk.before.size() - k];
            if (normalized_file[line] == m_normalizer.normalize(wanted)) {
                ++fuzzy;
                if (file_lines[line] == wanted) ++exact;
            }
        }

        const size_t below = std::min(window, hunk.after.size());
        for (size_t k = 0; k < below && candidate.end_line + k < file_lines.size(); ++k) {
            const size_t line = candidate.end_line + k;
            const std::string& wanted = hunk.after[k];
            if (normalized_file[line] == m_normalizer.normalize(wanted)) {
                ++fuzzy;
                if (file_lines[line] == wanted) ++exact;
            }
        }
        return {fuzzy, exact};
    }

}
