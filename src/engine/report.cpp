#include "report.hpp"
#include <sstream>

namespace splice::engine {

    const char* to_string(Operation::Kind kind) {
        switch (kind) {
            case Operation::Kind::Update: return "update";
            case Operation::Kind::Add:    return "add";
            case Operation::Kind::Delete: return "delete";
            case Operation::Kind::Move:   return "move";
        }
        return "unknown";
    }

    const char* to_string(OperationResult::Outcome outcome) {
        switch (outcome) {
            case OperationResult::Outcome::Applied: return "applied";
            case OperationResult::Outcome::Skipped: return "skipped";
            case OperationResult::Outcome::Failed:  return "failed";
        }
        return "unknown";
    }

    namespace {

        char status_letter(Operation::Kind kind) {
            switch (kind) {
                case Operation::Kind::Update: return 'M';
                case Operation::Kind::Add:    return 'A';
                case Operation::Kind::Delete: return 'D';
                case Operation::Kind::Move:   return 'R';
            }
            return '?';
        }

        std::string describe_target(const OperationResult& r) {
            if (r.kind == Operation::Kind::Move) return r.source_path + " -> " + r.path;
            return r.path;
        }

    }

    bool PatchReport::ok() const {
        if (fatal) return false;
        for (const auto& r : results) {
            if (r.outcome != OperationResult::Outcome::Applied) return false;
        }
        return true;
    }

    int PatchReport::exit_code() const {
        if (fatal) return 2;
        return ok() ? 0 : 1;
    }

    std::string Reporter::to_text(const PatchReport& report) {
        std::ostringstream out;
        if (report.fatal) {
            out << "error: " << report.fatal->what() << "\n";
            out << "Nothing applied.\n";
            return out.str();
        }

        size_t applied = 0;
        for (const auto& r : report.results) {
            switch (r.outcome) {
                case OperationResult::Outcome::Applied:
                    ++applied;
                    out << status_letter(r.kind) << "  " << describe_target(r);
                    if (r.kind == Operation::Kind::Update) {
                        out << " (" << r.hunks_applied << (r.hunks_applied == 1 ? " hunk" : " hunks") << ")";
                    }
                    out << "\n";
                    break;
                case OperationResult::Outcome::Skipped:
                    out << "SKIPPED " << status_letter(r.kind) << "  " << describe_target(r)
                        << ": " << r.message << "\n";
                    break;
                case OperationResult::Outcome::Failed:
                    out << "FAILED  " << status_letter(r.kind) << "  " << describe_target(r) << ": ";
                    if (r.error) out << "[" << to_string(*r.error) << "] ";
                    out << r.message << "\n";
                    break;
            }
        }

        out << (report.dry_run ? "Check: " : "") << applied << " of " << report.results.size()
            << (report.dry_run ? " operations would apply.\n" : " operations applied.\n");
        return out.str();
    }

    nlohmann::json Reporter::to_json(const PatchReport& report) {
        nlohmann::json j;
        j["ok"] = report.ok();
        j["dry_run"] = report.dry_run;
        j["exit_code"] = report.exit_code();

        if (report.fatal) {
            j["error"] = {
                {"kind", to_string(report.fatal->kind())},
                {"message", report.fatal->what()}
            };
        }

        j["results"] = nlohmann::json::array();
        for (const auto& r : report.results) {
            nlohmann::json item = {
                {"kind", to_string(r.kind)},
                {"path", r.path},
                {"outcome", to_string(r.outcome)}
            };
            if (r.kind == Operation::Kind::Move) item["source_path"] = r.source_path;
            if (r.kind == Operation::Kind::Update) item["hunks_applied"] = r.hunks_applied;
            if (r.error) item["error"] = to_string(*r.error);
            if (!r.message.empty()) item["message"] = r.message;
            j["results"].push_back(item);
        }
        return j;
    }

}
