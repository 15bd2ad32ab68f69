#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "splice/types.hpp"
#include "errors.hpp"

namespace splice::engine {

    struct OperationResult {
        enum class Outcome {
            Applied,
            Skipped,
            Failed
        };

        Operation::Kind kind = Operation::Kind::Update;
        std::string path;
        std::string source_path; // Move only
        Outcome outcome = Outcome::Applied;
        std::optional<ErrorKind> error;
        std::string message;
        size_t hunks_applied = 0;
    };

    /**
     * @brief Outcome of one patch run, one result per operation in declaration order.
     */
    struct PatchReport {
        std::vector<OperationResult> results;
        std::optional<PatchError> fatal; // set when the patch could not be parsed
        bool dry_run = false;

        bool ok() const;

        /**
         * @return 0 when every operation applied, 1 when any failed or was
         * skipped, 2 when the patch was malformed.
         */
        int exit_code() const;
    };

    class Reporter {
    public:
        /**
         * @brief One line per operation plus a summary, for terminals and MCP text content.
         */
        static std::string to_text(const PatchReport& report);

        static nlohmann::json to_json(const PatchReport& report);
    };

    const char* to_string(Operation::Kind kind);
    const char* to_string(OperationResult::Outcome outcome);

}
