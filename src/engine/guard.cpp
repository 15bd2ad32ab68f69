#include "guard.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>

namespace splice::engine {

    void PathGuard::load(const std::filesystem::path& protect_file) {
        if (!std::filesystem::exists(protect_file)) return;

        std::ifstream file(protect_file);
        std::string line;
        while (std::getline(file, line)) {
            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;

            add(line);
        }
    }

    void PathGuard::add(const std::string& pattern) {
        std::string p = pattern;
        while (p.size() > 1 && p.back() == '/') p.pop_back();
        if (p.empty()) return;

        try {
            m_patterns.push_back({std::regex(glob_to_regex(p)), p});
        } catch (const std::regex_error& e) {
            std::cerr << "[PathGuard] Skipping pattern '" << pattern << "': " << e.what() << "\n";
        }
    }

    void PathGuard::add_defaults() {
        std::vector<std::string> defaults = {".git", ".svn", ".hg"};
        for (const auto& p : defaults) add(p);
    }

    bool PathGuard::check(const std::string& path) const {
        for (const auto& p : m_patterns) {
            if (std::regex_match(path, p.regex)) return true;
        }

        // Any component, so ".git" also covers ".git/config"
        for (const auto& part : std::filesystem::path(path)) {
            std::string name = part.string();
            for (const auto& p : m_patterns) {
                if (std::regex_match(name, p.regex)) return true;
            }
        }
        return false;
    }

    std::string PathGuard::validate(const std::string& path) {
        if (path.find_first_not_of(" \t") == std::string::npos) {
            throw PatchError(ErrorKind::UnsafePath, "Empty path not allowed");
        }
        if (path.find('\0') != std::string::npos) {
            throw PatchError(ErrorKind::UnsafePath, "Null byte in path not allowed: " + path);
        }

        std::filesystem::path p(path);
        if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
            throw PatchError(ErrorKind::UnsafePath, "Absolute path not allowed: " + path);
        }

        std::filesystem::path normal = p.lexically_normal();
        if (normal.empty() || normal == ".") {
            throw PatchError(ErrorKind::UnsafePath, "Path does not name a file: " + path);
        }
        if (*normal.begin() == "..") {
            throw PatchError(ErrorKind::UnsafePath, "Path outside root directory: " + path);
        }

        std::string result = normal.generic_string();
        if (result.back() == '/') {
            throw PatchError(ErrorKind::UnsafePath, "Path does not name a file: " + path);
        }
        return result;
    }

    std::string PathGuard::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (char c : glob) {
            if (c == '*') {
                regex_str += ".*";
            } else if (c == '?') {
                regex_str += ".";
            } else if (c == '/') {
                regex_str += "[/\\\\]"; // Match both separators
            } else if (std::string(".+()[]{}^$|\\").find(c) != std::string::npos) {
                regex_str += '\\';
                regex_str += c;
            } else {
                regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
