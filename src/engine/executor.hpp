#pragma once

#include <string>
#include <vector>
#include "splice/types.hpp"
#include "applier.hpp"
#include "config.hpp"
#include "disambiguator.hpp"
#include "guard.hpp"
#include "matcher.hpp"
#include "normalizer.hpp"
#include "report.hpp"
#include "workspace.hpp"

namespace splice::engine {

    /**
     * @brief Applies parsed operations to a workspace, in declaration order.
     *
     * Failures are operation-scoped: a failed operation is reported and the
     * next one still runs. An Update either writes its file exactly once,
     * after every hunk resolved, or leaves it untouched.
     */
    class TreeExecutor {
    public:
        TreeExecutor(Workspace& workspace, const Config& config);

        TreeExecutor(const TreeExecutor&) = delete;
        TreeExecutor& operator=(const TreeExecutor&) = delete;

        /**
         * @brief Parses and executes a patch.
         * A malformed patch sets PatchReport::fatal and applies nothing.
         */
        PatchReport run(const std::string& patch_text);

        PatchReport execute(const std::vector<Operation>& operations);

        /**
         * @brief Protected path patterns; defaults and Config::protect are preloaded.
         */
        PathGuard& guard() { return m_guard; }

    private:
        Workspace& m_workspace;
        Config m_config;
        Normalizer m_normalizer;
        FuzzyMatcher m_matcher;
        ScopeDisambiguator m_disambiguator;
        PathGuard m_guard;

        void do_add(const Operation& op);
        void do_delete(const Operation& op);
        void do_move(const Operation& op);
        size_t do_update(const Operation& op);

        /**
         * @brief Locates one hunk in the current file state and applies it.
         * Throws PatchError(NoMatch) or PatchError(AmbiguousMatch).
         */
        void apply_hunk(FileState& state, const Hunk& hunk) const;

        std::string checked_path(const std::string& path) const;
    };

    /**
     * @brief Runs a whole patch against a workspace.
     * With dry_run set, mutations go to a DryRunWorkspace over it instead.
     */
    PatchReport apply_patch(const std::string& patch_text,
                            Workspace& workspace,
                            const Config& config,
                            bool dry_run = false);

}
