#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/executor.hpp"
#include "engine/report.hpp"
#include "engine/workspace.hpp"

namespace {

    void print_usage() {
        std::cerr << "Usage: splice [options] [PATCH_FILE | -]\n";
        std::cerr << "Applies a '*** Begin Patch' patch to the files under the root directory.\n";
        std::cerr << "Reads the patch from standard input when no file (or '-') is given.\n\n";
        std::cerr << "Options:\n";
        std::cerr << "  --root DIR       Directory the patch paths are relative to (default: .)\n";
        std::cerr << "  --config FILE    Configuration file (default: ~/.config/splice/config.json)\n";
        std::cerr << "  --check          Match every hunk and report, but change nothing\n";
        std::cerr << "  --json           Print the report as JSON\n";
        std::cerr << "  --verbose        Log matching progress to stderr\n";
        std::cerr << "  --write-config   Save the effective configuration and exit\n";
        std::cerr << "  --help           Show this help\n";
    }

}

int main(int argc, char* argv[]) {
    std::filesystem::path root = std::filesystem::current_path();
    std::filesystem::path config_path;
    std::string patch_file = "-";
    bool check = false;
    bool json_output = false;
    bool verbose = false;
    bool write_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--root" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value.\n";
                return 2;
            }
            if (arg == "--root") root = argv[++i];
            else config_path = argv[++i];
        } else if (arg == "--check") {
            check = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--write-config") {
            write_config = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            print_usage();
            return 2;
        } else {
            patch_file = arg;
        }
    }

    // Setup Config
    if (config_path.empty()) {
        auto config_dir = splice::platform::system::get_config_dir();
        if (!config_dir.empty()) config_path = config_dir / "config.json";
    } else if (!write_config && !std::filesystem::exists(config_path)) {
        std::cerr << "Error: Config file not found: " << config_path << "\n";
        return 2;
    }

    auto config = config_path.empty() ? splice::engine::Config{} : splice::engine::Config::load(config_path);
    if (verbose) config.verbose = true;
    if (config.verbose) std::cerr << "[Splice] Config path: " << config_path << "\n";

    if (write_config) {
        if (config_path.empty()) {
            std::cerr << "Error: No config directory (HOME is not set).\n";
            return 2;
        }
        std::error_code ec;
        std::filesystem::create_directories(config_path.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << config_path.parent_path() << ": " << ec.message() << "\n";
            return 1;
        }
        config.save(config_path);
        std::cout << "Wrote " << config_path.string() << "\n";
        return 0;
    }

    if (!std::filesystem::is_directory(root)) {
        std::cerr << "Error: Root is not a directory: " << root << "\n";
        return 2;
    }

    // Read Patch
    std::stringstream buffer;
    if (patch_file == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(patch_file, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open patch file: " << patch_file << "\n";
            return 2;
        }
        buffer << file.rdbuf();
    }

    auto disk = splice::engine::Workspace::create_disk(root);
    std::unique_ptr<splice::engine::Workspace> preview;
    splice::engine::Workspace* target = disk.get();
    if (check) {
        preview = splice::engine::Workspace::create_dry_run(*disk);
        target = preview.get();
    }

    splice::engine::TreeExecutor executor(*target, config);
    executor.guard().load(root / ".splice_protect");
    if (config.verbose) {
        std::cerr << "[Splice] Root: " << root << " (" << executor.guard().size() << " protected patterns)\n";
    }

    auto report = executor.run(buffer.str());
    report.dry_run = check;

    if (json_output) {
        std::cout << splice::engine::Reporter::to_json(report).dump(2) << "\n";
    } else {
        std::cout << splice::engine::Reporter::to_text(report);
    }
    return report.exit_code();
}
