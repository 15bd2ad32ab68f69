#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../platform.hpp"
#include "../engine/config.hpp"
#include "../engine/executor.hpp"
#include "../engine/parser.hpp"
#include "../engine/report.hpp"
#include "../engine/workspace.hpp"

using json = nlohmann::json;

// Helper to send JSON-RPC response
void send_response(const json& id, const json& result) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
    std::cout << response.dump() << std::endl;
}

void send_error(const json& id, int code, const std::string& message) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
    std::cout << response.dump() << std::endl;
}

json text_content(const std::string& text, bool is_error) {
    return {
        {"content", {
            {
                {"type", "text"},
                {"text", text}
            }
        }},
        {"isError", is_error}
    };
}

json tool_list() {
    return {
        {"tools", {
            {
                {"name", "apply_patch"},
                {"description", "Apply a '*** Begin Patch' ... '*** End Patch' patch to files under the server's "
                                "working directory. Hunks are located by their context lines, tolerating "
                                "whitespace drift; add '@@ <enclosing line>' headers when code repeats."},
                {"inputSchema", {
                    {"type", "object"},
                    {"properties", {
                        {"patch", {{"type", "string"}, {"description", "The full patch text."}}},
                        {"dry_run", {{"type", "boolean"}, {"description", "Report what would happen without writing."}}}
                    }},
                    {"required", {"patch"}}
                }}
            },
            {
                {"name", "patch_files"},
                {"description", "List the files a patch reads and the files it adds, without applying it."},
                {"inputSchema", {
                    {"type", "object"},
                    {"properties", {
                        {"patch", {{"type", "string"}, {"description", "The full patch text."}}}
                    }},
                    {"required", {"patch"}}
                }}
            }
        }}
    };
}

int main() {
    auto config_dir = splice::platform::system::get_config_dir();
    auto config = config_dir.empty() ? splice::engine::Config{} : splice::engine::Config::load(config_dir / "config.json");
    const std::filesystem::path root = std::filesystem::current_path();
    std::cerr << "[SpliceMCP] Serving " << root << "\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        try {
            auto req = json::parse(line);
            auto id = req.value("id", json(nullptr));
            std::string method = req.value("method", "");

            // 1. Initialize
            if (method == "initialize") {
                json result = {
                    {"protocolVersion", "2024-11-05"},
                    {"capabilities", {
                        {"tools", json::object()}
                    }},
                    {"serverInfo", {
                        {"name", "splice-mcp"},
                        {"version", "0.1.0"}
                    }}
                };
                send_response(id, result);
                continue;
            }

            // 2. Initialized Notification
            if (method == "notifications/initialized") {
                continue; // No response needed
            }

            if (method == "ping") {
                send_response(id, json::object());
                continue;
            }

            // 3. List Tools
            if (method == "tools/list") {
                send_response(id, tool_list());
                continue;
            }

            // 4. Call Tool
            if (method == "tools/call") {
                auto params = req.value("params", json::object());
                std::string name = params.value("name", "");
                auto args = params.value("arguments", json::object());

                if (!args.contains("patch") || !args["patch"].is_string()) {
                    send_error(id, -32602, "Missing string argument 'patch'");
                    continue;
                }
                std::string patch = args["patch"].get<std::string>();

                if (name == "apply_patch") {
                    bool dry_run = args.value("dry_run", false);

                    splice::engine::DiskWorkspace disk(root);
                    splice::engine::DryRunWorkspace preview(disk);
                    splice::engine::Workspace& target = dry_run ? static_cast<splice::engine::Workspace&>(preview)
                                                                : static_cast<splice::engine::Workspace&>(disk);

                    splice::engine::TreeExecutor executor(target, config);
                    executor.guard().load(root / ".splice_protect");
                    auto report = executor.run(patch);
                    report.dry_run = dry_run;

                    send_response(id, text_content(splice::engine::Reporter::to_text(report), !report.ok()));
                } else if (name == "patch_files") {
                    json listing = {
                        {"reads", splice::engine::PatchParser::files_needed(patch)},
                        {"adds", splice::engine::PatchParser::files_added(patch)}
                    };
                    send_response(id, text_content(listing.dump(2), false));
                } else {
                    send_error(id, -32601, "Tool not found");
                }
                continue;
            }

            // Notifications get no reply.
            if (!req.contains("id")) continue;

            send_error(id, -32601, "Method not found");

        } catch (const json::exception& e) {
            // Log to stderr to avoid breaking Stdio transport
            std::cerr << "[SpliceMCP] Bad request: " << e.what() << "\n";
            send_error(nullptr, -32700, "Parse error");
        } catch (const std::exception& e) {
            std::cerr << "[SpliceMCP] Error: " << e.what() << "\n";
        }
    }

    return 0;
}
