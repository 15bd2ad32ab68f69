#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace splice::engine {

    struct Hunk {
        std::vector<std::string> scope;     // "@@" header lines, outermost first
        std::vector<std::string> before;    // context above the edit
        std::vector<std::string> old_lines; // lines being replaced
        std::vector<std::string> new_lines; // replacement, written verbatim
        std::vector<std::string> after;     // context below the edit
        bool at_eof = false;

        std::vector<std::string> anchor_context() const {
            std::vector<std::string> lines = before;
            lines.insert(lines.end(), old_lines.begin(), old_lines.end());
            lines.insert(lines.end(), after.begin(), after.end());
            return lines;
        }
    };

    struct Operation {
        enum class Kind {
            Update,
            Add,
            Delete,
            Move
        };

        Kind kind = Kind::Update;
        std::string path;        // target
        std::string source_path; // Move only
        std::string content;     // Add only
        std::vector<Hunk> hunks; // Update only
        bool follows_update = false; // Move declared by "*** Move to:" after an Update
    };

    struct MatchCandidate {
        size_t start_line = 0;
        size_t end_line = 0; // half-open
        double score = 0.0;
        size_t exact_overlap = 0;
    };

}
