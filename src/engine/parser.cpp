#include "parser.hpp"
#include "errors.hpp"
#include <algorithm>

namespace splice::engine {

    namespace {

        const std::string kBeginPatch = "*** Begin Patch";
        const std::string kEndPatch = "*** End Patch";
        const std::string kAddFile = "*** Add File: ";
        const std::string kDeleteFile = "*** Delete File: ";
        const std::string kUpdateFile = "*** Update File: ";
        const std::string kMoveTo = "*** Move to: ";
        const std::string kEndOfFile = "*** End of File";

        bool starts_with(const std::string& s, const std::string& prefix) {
            return s.rfind(prefix, 0) == 0;
        }

        std::string trim(const std::string& s) {
            size_t first = s.find_first_not_of(" \t");
            if (first == std::string::npos) return "";
            size_t last = s.find_last_not_of(" \t");
            return s.substr(first, last - first + 1);
        }

        std::vector<std::string> split_patch_lines(const std::string& text) {
            std::vector<std::string> lines;
            size_t start = 0;
            while (true) {
                size_t nl = text.find('\n', start);
                std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                lines.push_back(line);
                if (nl == std::string::npos) break;
                start = nl + 1;
            }

            while (!lines.empty() && trim(lines.back()).empty()) lines.pop_back();
            size_t first = 0;
            while (first < lines.size() && trim(lines[first]).empty()) ++first;
            lines.erase(lines.begin(), lines.begin() + first);
            return lines;
        }

        bool is_block_header(const std::string& line) {
            return starts_with(line, kUpdateFile) || starts_with(line, kDeleteFile) ||
                   starts_with(line, kAddFile) || trim(line) == kEndPatch;
        }

        std::vector<std::string> collect_paths(const std::string& text, const std::vector<std::string>& prefixes) {
            std::vector<std::string> result;
            for (const auto& line : split_patch_lines(text)) {
                for (const auto& prefix : prefixes) {
                    if (!starts_with(line, prefix)) continue;
                    std::string path = trim(line.substr(prefix.size()));
                    if (!path.empty() && std::find(result.begin(), result.end(), path) == result.end()) {
                        result.push_back(path);
                    }
                }
            }
            return result;
        }

        // One "@@" section of an Update block: shared scope, its hunks, and the
        // context lines seen since the last run of +/- lines.
        struct Section {
            std::vector<std::string> scope;
            std::vector<Hunk> hunks;
            std::vector<std::string> context;
            bool in_run = false;
            bool has_body = false;
        };

        class Reader {
        public:
            explicit Reader(std::vector<std::string> lines)
                : m_lines(std::move(lines)), m_index(1), m_end(m_lines.size() - 1) {}

            std::vector<Operation> run() {
                while (m_index < m_end) {
                    const std::string line = m_lines[m_index];
                    if (trim(line).empty()) {
                        ++m_index;
                    } else if (starts_with(line, kUpdateFile)) {
                        ++m_index;
                        parse_update(read_path(line, kUpdateFile));
                    } else if (starts_with(line, kAddFile)) {
                        ++m_index;
                        parse_add(read_path(line, kAddFile));
                    } else if (starts_with(line, kDeleteFile)) {
                        ++m_index;
                        Operation op;
                        op.kind = Operation::Kind::Delete;
                        op.path = read_path(line, kDeleteFile);
                        m_ops.push_back(std::move(op));
                    } else {
                        fail("Unknown line " + std::to_string(m_index + 1) + ": " + line);
                    }
                }
                return std::move(m_ops);
            }

        private:
            std::vector<std::string> m_lines;
            size_t m_index;
            size_t m_end;
            std::vector<Operation> m_ops;

            void fail(const std::string& message) const {
                throw PatchError(ErrorKind::MalformedPatch, message);
            }

            std::string read_path(const std::string& line, const std::string& prefix) const {
                std::string path = trim(line.substr(prefix.size()));
                if (path.empty()) fail("Missing path: " + line);
                return path;
            }

            void parse_add(const std::string& path) {
                Operation op;
                op.kind = Operation::Kind::Add;
                op.path = path;

                std::vector<std::string> body;
                while (m_index < m_end && !is_block_header(m_lines[m_index])) {
                    const std::string& line = m_lines[m_index];
                    if (line.empty() || line[0] != '+') {
                        fail("Invalid Add File line for " + path + ": " + line);
                    }
                    body.push_back(line.substr(1));
                    ++m_index;
                }

                for (size_t i = 0; i < body.size(); ++i) {
                    if (i) op.content += '\n';
                    op.content += body[i];
                }
                m_ops.push_back(std::move(op));
            }

            void parse_update(const std::string& path) {
                std::string move_to;
                if (m_index < m_end && starts_with(m_lines[m_index], kMoveTo)) {
                    move_to = read_path(m_lines[m_index], kMoveTo);
                    ++m_index;
                    if (move_to == path) fail("Move to the same path: " + path);
                }

                Operation op;
                op.kind = Operation::Kind::Update;
                op.path = path;

                Section section;
                while (m_index < m_end && !is_block_header(m_lines[m_index])) {
                    const std::string& line = m_lines[m_index];
                    if (trim(line) == kEndOfFile) {
                        flush_section(section, op, true);
                    } else if (starts_with(line, "@@")) {
                        if (section.has_body) flush_section(section, op, false);
                        std::string header = trim(line.substr(2));
                        if (!header.empty()) section.scope.push_back(header);
                    } else if (starts_with(line, "***")) {
                        fail("Invalid line in update of " + path + ": " + line);
                    } else {
                        add_body_line(section, line);
                    }
                    ++m_index;
                }
                flush_section(section, op, false);

                if (op.hunks.empty() && move_to.empty()) {
                    fail("Update File Error: no hunks for " + path);
                }
                const bool updated = !op.hunks.empty();
                if (updated) m_ops.push_back(std::move(op));

                if (!move_to.empty()) {
                    Operation mv;
                    mv.kind = Operation::Kind::Move;
                    mv.source_path = path;
                    mv.path = move_to;
                    mv.follows_update = updated;
                    m_ops.push_back(std::move(mv));
                }
            }

            void add_body_line(Section& section, const std::string& line) {
                section.has_body = true;
                const char tag = line.empty() ? ' ' : line[0];

                if (tag == '+' || tag == '-') {
                    if (!section.in_run) {
                        if (!section.hunks.empty()) section.hunks.back().after = section.context;
                        Hunk hunk;
                        hunk.scope = section.scope;
                        hunk.before = section.context;
                        section.hunks.push_back(std::move(hunk));
                        section.context.clear();
                        section.in_run = true;
                    }
                    if (tag == '+') section.hunks.back().new_lines.push_back(line.substr(1));
                    else section.hunks.back().old_lines.push_back(line.substr(1));
                    return;
                }

                // Context; tolerate a missing leading space.
                section.in_run = false;
                if (line.empty()) section.context.push_back("");
                else section.context.push_back(tag == ' ' ? line.substr(1) : line);
            }

            void flush_section(Section& section, Operation& op, bool at_eof) {
                if (!section.hunks.empty()) {
                    section.hunks.back().after = section.context;
                    if (at_eof) section.hunks.back().at_eof = true;
                }

                for (auto& hunk : section.hunks) {
                    if (hunk.anchor_context().empty() && hunk.scope.empty() && !hunk.at_eof) {
                        fail("Hunk " + std::to_string(op.hunks.size() + 1) + " of " + op.path +
                             " has no anchor context");
                    }
                    op.hunks.push_back(std::move(hunk));
                }
                section = Section{};
            }
        };

    }

    std::vector<Operation> PatchParser::parse(const std::string& patch_text) {
        std::vector<std::string> lines = split_patch_lines(patch_text);

        if (lines.size() < 2) {
            throw PatchError(ErrorKind::MalformedPatch,
                             "Invalid patch text: Patch text must have at least two lines.");
        }
        if (!starts_with(lines.front(), kBeginPatch)) {
            throw PatchError(ErrorKind::MalformedPatch,
                             "Invalid patch text: Patch text must start with " + kBeginPatch);
        }
        if (trim(lines.back()) != kEndPatch) {
            throw PatchError(ErrorKind::MalformedPatch,
                             "Invalid patch text: Patch text must end with " + kEndPatch);
        }

        Reader reader(std::move(lines));
        return reader.run();
    }

    std::vector<std::string> PatchParser::files_needed(const std::string& patch_text) {
        return collect_paths(patch_text, {kUpdateFile, kDeleteFile});
    }

    std::vector<std::string> PatchParser::files_added(const std::string& patch_text) {
        return collect_paths(patch_text, {kAddFile});
    }

}
