#include "executor.hpp"
#include "errors.hpp"
#include "parser.hpp"
#include <iostream>
#include <set>
#include <stdexcept>

namespace splice::engine {

    namespace {

        const size_t kMaxQuotedLines = 5;

        std::string quote_anchor(const Hunk& hunk) {
            const std::vector<std::string> lines = hunk.old_lines.empty() ? hunk.anchor_context() : hunk.old_lines;
            std::string out;
            for (size_t i = 0; i < lines.size() && i < kMaxQuotedLines; ++i) {
                out += "\n    " + lines[i];
            }
            if (lines.size() > kMaxQuotedLines) out += "\n    ...";
            return out;
        }

    }

    TreeExecutor::TreeExecutor(Workspace& workspace, const Config& config)
        : m_workspace(workspace),
          m_config(config),
          m_normalizer(config.tab_width),
          m_matcher(m_normalizer, config.fuzzy_threshold, config.min_fuzzy_window),
          m_disambiguator(m_normalizer, config.context_window) {
        m_guard.add_defaults();
        for (const auto& pattern : config.protect) m_guard.add(pattern);
    }

    PatchReport TreeExecutor::run(const std::string& patch_text) {
        std::vector<Operation> operations;
        try {
            operations = PatchParser::parse(patch_text);
        } catch (const PatchError& e) {
            std::cerr << "[Parser] " << e.what() << "\n";
            PatchReport report;
            report.fatal = e;
            return report;
        }

        if (m_config.verbose) {
            std::cerr << "[Executor] Parsed " << operations.size() << " operation(s)\n";
        }
        return execute(operations);
    }

    PatchReport TreeExecutor::execute(const std::vector<Operation>& operations) {
        PatchReport report;
        std::set<std::string> failed_updates;

        for (const auto& op : operations) {
            OperationResult result;
            result.kind = op.kind;
            result.path = op.path;
            result.source_path = op.source_path;

            if (op.kind == Operation::Kind::Move && op.follows_update && failed_updates.count(op.source_path)) {
                result.outcome = OperationResult::Outcome::Skipped;
                result.message = "Update of " + op.source_path + " failed; move not attempted";
                report.results.push_back(std::move(result));
                continue;
            }

            try {
                switch (op.kind) {
                    case Operation::Kind::Add:    do_add(op); break;
                    case Operation::Kind::Delete: do_delete(op); break;
                    case Operation::Kind::Move:   do_move(op); break;
                    case Operation::Kind::Update: result.hunks_applied = do_update(op); break;
                }
                result.outcome = OperationResult::Outcome::Applied;
            } catch (const PatchError& e) {
                result.outcome = OperationResult::Outcome::Failed;
                result.error = e.kind();
                result.message = e.what();
            } catch (const std::logic_error& e) {
                result.outcome = OperationResult::Outcome::Failed;
                result.message = std::string("Internal error: ") + e.what();
            } catch (const std::exception& e) {
                result.outcome = OperationResult::Outcome::Failed;
                result.message = std::string("Unexpected error: ") + e.what();
            }

            if (result.outcome == OperationResult::Outcome::Failed) {
                if (op.kind == Operation::Kind::Update) failed_updates.insert(op.path);
                std::cerr << "[Executor] " << to_string(op.kind) << " " << op.path << " failed: "
                          << result.message << "\n";
            } else if (m_config.verbose) {
                std::cerr << "[Executor] " << to_string(op.kind) << " " << op.path << " applied\n";
            }
            report.results.push_back(std::move(result));
        }
        return report;
    }

    std::string TreeExecutor::checked_path(const std::string& path) const {
        std::string safe = PathGuard::validate(path);
        if (m_guard.check(safe)) {
            throw PatchError(ErrorKind::UnsafePath, "Protected path: " + path);
        }
        return safe;
    }

    void TreeExecutor::do_add(const Operation& op) {
        const std::string path = checked_path(op.path);
        if (m_workspace.exists(path)) {
            throw PatchError(ErrorKind::PathExists, "Cannot add file that already exists: " + path);
        }
        m_workspace.write_file(path, op.content);
    }

    void TreeExecutor::do_delete(const Operation& op) {
        const std::string path = checked_path(op.path);
        if (!m_workspace.exists(path)) {
            throw PatchError(ErrorKind::PathNotFound, "Cannot delete missing file: " + path);
        }
        if (!m_workspace.remove_file(path)) {
            throw PatchError(ErrorKind::PathNotFound, "Not a regular file: " + path);
        }
    }

    void TreeExecutor::do_move(const Operation& op) {
        const std::string source = checked_path(op.source_path);
        const std::string target = checked_path(op.path);
        if (source == target) {
            throw PatchError(ErrorKind::PathExists, "Move source and target are the same: " + source);
        }

        std::optional<std::string> content = m_workspace.read_file(source);
        if (!content) {
            throw PatchError(ErrorKind::PathNotFound, "Cannot move missing file: " + source);
        }
        if (m_workspace.exists(target)) {
            throw PatchError(ErrorKind::PathExists,
                             "Cannot move " + source + " to " + target + ": destination already exists");
        }

        m_workspace.write_file(target, *content);
        if (!m_workspace.remove_file(source)) {
            throw PatchError(ErrorKind::IoError, "Wrote " + target + " but could not remove " + source);
        }
    }

    size_t TreeExecutor::do_update(const Operation& op) {
        const std::string path = checked_path(op.path);
        std::optional<std::string> content = m_workspace.read_file(path);
        if (!content) {
            throw PatchError(ErrorKind::PathNotFound, "Cannot update missing file: " + path);
        }

        FileState state;
        state.path = path;
        if (!content->empty()) state.lines = split_lines(*content);
        state.tracker = OffsetTracker(state.lines.size());

        for (size_t i = 0; i < op.hunks.size(); ++i) {
            try {
                apply_hunk(state, op.hunks[i]);
            } catch (const PatchError& e) {
                throw PatchError(e.kind(), "Hunk " + std::to_string(i + 1) + " of " + path + ": " + e.what());
            }
        }

        state.tracker.verify(state.lines.size());
        m_workspace.write_file(path, join_lines(state.lines));
        return op.hunks.size();
    }

    void TreeExecutor::apply_hunk(FileState& state, const Hunk& hunk) const {
        const std::vector<NormalizedLine> normalized = m_normalizer.normalize_all(state.lines);
        const ScopeRegion scope = m_disambiguator.resolve_scope(hunk, state.lines, normalized, state.prior_end);

        Region region = scope.block;
        std::vector<MatchCandidate> candidates = m_matcher.find_hunk_candidates(state.lines, normalized, hunk, region);
        if (candidates.empty() && (scope.tail.begin != scope.block.begin || scope.tail.end != scope.block.end)) {
            region = scope.tail;
            candidates = m_matcher.find_hunk_candidates(state.lines, normalized, hunk, region);
        }
        if (candidates.empty()) {
            throw PatchError(ErrorKind::NoMatch, "Could not find a match for:" + quote_anchor(hunk));
        }

        MatchCandidate chosen = m_disambiguator.resolve(candidates, hunk, state.lines, normalized,
                                                        region, state.prior_end);
        if (m_config.verbose) {
            std::cerr << "[Executor] " << state.path << ": hunk at line " << chosen.start_line + 1
                      << " (score " << chosen.score << ", " << candidates.size() << " candidate(s))\n";
        }
        PatchApplier::apply(state, chosen, hunk.new_lines);
    }

    PatchReport apply_patch(const std::string& patch_text,
                            Workspace& workspace,
                            const Config& config,
                            bool dry_run) {
        if (!dry_run) {
            TreeExecutor executor(workspace, config);
            return executor.run(patch_text);
        }

        DryRunWorkspace preview(workspace);
        TreeExecutor executor(preview, config);
        PatchReport report = executor.run(patch_text);
        report.dry_run = true;
        return report;
    }

}
