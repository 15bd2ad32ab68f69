#include "workspace.hpp"
#include "errors.hpp"
#include "../platform.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace splice::engine {

    std::unique_ptr<Workspace> Workspace::create_disk(const std::filesystem::path& root) {
        return std::make_unique<DiskWorkspace>(root);
    }

    std::unique_ptr<Workspace> Workspace::create_dry_run(const Workspace& base) {
        return std::make_unique<DryRunWorkspace>(base);
    }

    // --- MemoryWorkspace ---

    MemoryWorkspace::MemoryWorkspace(std::map<std::string, std::string> files)
        : m_files(std::move(files)) {}

    std::optional<std::string> MemoryWorkspace::read_file(const std::string& path) const {
        auto it = m_files.find(path);
        if (it == m_files.end()) return std::nullopt;
        return it->second;
    }

    void MemoryWorkspace::write_file(const std::string& path, const std::string& content) {
        m_files[path] = content;
    }

    bool MemoryWorkspace::remove_file(const std::string& path) {
        return m_files.erase(path) > 0;
    }

    bool MemoryWorkspace::exists(const std::string& path) const {
        return m_files.count(path) > 0;
    }

    // --- DiskWorkspace ---

    DiskWorkspace::DiskWorkspace(std::filesystem::path root) : m_root(std::move(root)) {}

    std::optional<std::string> DiskWorkspace::read_file(const std::string& path) const {
        const std::filesystem::path full = m_root / path;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(full, ec)) return std::nullopt;

        std::ifstream f(full, std::ios::binary);
        if (!f) {
            throw PatchError(ErrorKind::IoError, "Cannot open " + path + ": " + std::strerror(errno));
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        if (f.bad()) {
            throw PatchError(ErrorKind::IoError, "Cannot read " + path);
        }
        return ss.str();
    }

    void DiskWorkspace::write_file(const std::string& path, const std::string& content) {
        const std::filesystem::path full = m_root / path;
        std::error_code ec;
        std::filesystem::create_directories(full.parent_path(), ec);
        if (ec) {
            throw PatchError(ErrorKind::IoError, "Cannot create directory for " + path + ": " + ec.message());
        }
        if (!platform::system::write_file_atomic(full, content)) {
            throw PatchError(ErrorKind::IoError, "Cannot write " + path + ": " + std::strerror(errno));
        }
    }

    bool DiskWorkspace::remove_file(const std::string& path) {
        const std::filesystem::path full = m_root / path;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(full, ec)) return false;

        bool removed = std::filesystem::remove(full, ec);
        if (ec) {
            throw PatchError(ErrorKind::IoError, "Cannot remove " + path + ": " + ec.message());
        }
        return removed;
    }

    bool DiskWorkspace::exists(const std::string& path) const {
        std::error_code ec;
        return std::filesystem::exists(m_root / path, ec);
    }

    // --- DryRunWorkspace ---

    DryRunWorkspace::DryRunWorkspace(const Workspace& base) : m_base(base) {}

    std::optional<std::string> DryRunWorkspace::read_file(const std::string& path) const {
        auto it = m_writes.find(path);
        if (it != m_writes.end()) return it->second;
        if (m_removed.count(path)) return std::nullopt;
        return m_base.read_file(path);
    }

    void DryRunWorkspace::write_file(const std::string& path, const std::string& content) {
        m_removed.erase(path);
        m_writes[path] = content;
    }

    bool DryRunWorkspace::remove_file(const std::string& path) {
        if (!exists(path)) return false;
        m_writes.erase(path);
        m_removed.insert(path);
        return true;
    }

    bool DryRunWorkspace::exists(const std::string& path) const {
        if (m_writes.count(path)) return true;
        if (m_removed.count(path)) return false;
        return m_base.exists(path);
    }

}
