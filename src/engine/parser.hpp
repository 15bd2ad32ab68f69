#pragma once

#include <string>
#include <vector>
#include "splice/types.hpp"

namespace splice::engine {

    /**
     * @brief Turns "*** Begin Patch" ... "*** End Patch" text into operations.
     *
     * Pure function of its input; operations come back in declaration order.
     * Throws PatchError(MalformedPatch) on any structural problem.
     */
    class PatchParser {
    public:
        static std::vector<Operation> parse(const std::string& patch_text);

        /**
         * @brief Paths that must already exist (Update and Delete targets).
         */
        static std::vector<std::string> files_needed(const std::string& patch_text);

        /**
         * @brief Paths declared by Add blocks.
         */
        static std::vector<std::string> files_added(const std::string& patch_text);
    };

}
