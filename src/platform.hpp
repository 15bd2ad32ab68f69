#pragma once

#include <string>
#include <filesystem>

namespace splice::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();

        /**
         * @brief Replaces a file's content in one step.
         *
         * Writes to a temporary file in the same directory and renames it over
         * the target, keeping the target's permission bits when it exists.
         * @return false on failure; errno describes the cause.
         */
        bool write_file_atomic(const std::filesystem::path& path, const std::string& content);
    }

}
