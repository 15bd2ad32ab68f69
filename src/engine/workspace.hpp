#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace splice::engine {

    /**
     * @brief File tree the executor reads and mutates.
     * Paths are validated, root-relative, '/'-separated strings.
     * Implementations throw PatchError(IoError) when the medium fails.
     */
    class Workspace {
    public:
        virtual ~Workspace() = default;

        /**
         * @return The file's content, or nullopt if it does not exist.
         */
        virtual std::optional<std::string> read_file(const std::string& path) const = 0;

        /**
         * @brief Creates or replaces a file, creating parent directories.
         */
        virtual void write_file(const std::string& path, const std::string& content) = 0;

        /**
         * @return false if there was no such file.
         */
        virtual bool remove_file(const std::string& path) = 0;

        virtual bool exists(const std::string& path) const = 0;

        /**
         * @brief Workspace backed by the directory tree under root.
         */
        static std::unique_ptr<Workspace> create_disk(const std::filesystem::path& root);

        /**
         * @brief Reads through to base; writes and removals stay in memory.
         */
        static std::unique_ptr<Workspace> create_dry_run(const Workspace& base);
    };

    /**
     * @brief Purely in-memory tree, used by tests and the MCP server's previews.
     */
    class MemoryWorkspace : public Workspace {
    public:
        MemoryWorkspace() = default;
        explicit MemoryWorkspace(std::map<std::string, std::string> files);

        std::optional<std::string> read_file(const std::string& path) const override;
        void write_file(const std::string& path, const std::string& content) override;
        bool remove_file(const std::string& path) override;
        bool exists(const std::string& path) const override;

        const std::map<std::string, std::string>& files() const { return m_files; }

    private:
        std::map<std::string, std::string> m_files;
    };

    class DiskWorkspace : public Workspace {
    public:
        explicit DiskWorkspace(std::filesystem::path root);

        std::optional<std::string> read_file(const std::string& path) const override;
        void write_file(const std::string& path, const std::string& content) override;
        bool remove_file(const std::string& path) override;
        bool exists(const std::string& path) const override;

        const std::filesystem::path& root() const { return m_root; }

    private:
        std::filesystem::path m_root;
    };

    class DryRunWorkspace : public Workspace {
    public:
        explicit DryRunWorkspace(const Workspace& base);

        std::optional<std::string> read_file(const std::string& path) const override;
        void write_file(const std::string& path, const std::string& content) override;
        bool remove_file(const std::string& path) override;
        bool exists(const std::string& path) const override;

        /**
         * @brief Files that would be written, with their final content.
         */
        const std::map<std::string, std::string>& pending_writes() const { return m_writes; }

        /**
         * @brief Files that would be removed.
         */
        const std::set<std::string>& pending_removals() const { return m_removed; }

    private:
        const Workspace& m_base;
        std::map<std::string, std::string> m_writes;
        std::set<std::string> m_removed;
    };

}
