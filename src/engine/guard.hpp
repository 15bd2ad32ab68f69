#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace splice::engine {

    class PathGuard {
    public:
        /**
         * @brief Loads glob patterns from a .splice_protect file.
         * Blank lines and lines starting with '#' are skipped.
         * @param protect_file Path to the protect file; missing files are ignored.
         */
        void load(const std::filesystem::path& protect_file);

        void add(const std::string& pattern);

        /**
         * @brief Protects version control metadata (.git, .svn, .hg).
         */
        void add_defaults();

        /**
         * @brief Checks if a patch may not touch the path.
         * @param path Root-relative path as returned by validate().
         * @return true if the whole path or any of its components matches a pattern.
         */
        bool check(const std::string& path) const;

        /**
         * @brief Rejects paths that could reach outside the workspace root.
         * @return The lexically normalized, '/'-separated form of path.
         * @throws PatchError(UnsafePath) for empty, absolute, NUL-containing
         * or escaping paths.
         */
        static std::string validate(const std::string& path);

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
