#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace splice::engine {

    struct Config {
        double fuzzy_threshold = 0.8; // Minimum window score for long windows
        size_t min_fuzzy_window = 3;  // Shorter windows must match fully
        size_t context_window = 3;    // Lines per side compared first when disambiguating
        size_t tab_width = 4;
        std::vector<std::string> protect; // Extra globs the patch may never touch
        bool verbose = false;

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("fuzzy_threshold")) cfg.fuzzy_threshold = j["fuzzy_threshold"];
                read_count(j, "min_fuzzy_window", cfg.min_fuzzy_window);
                read_count(j, "context_window", cfg.context_window);
                read_count(j, "tab_width", cfg.tab_width);
                if (j.contains("protect")) cfg.protect = j["protect"].get<std::vector<std::string>>();
                if (j.contains("verbose")) cfg.verbose = j["verbose"];
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                return Config{};
            }

            if (cfg.fuzzy_threshold <= 0.0 || cfg.fuzzy_threshold > 1.0) {
                std::cerr << "[Config] fuzzy_threshold out of range, using 0.8\n";
                cfg.fuzzy_threshold = 0.8;
            }
            if (cfg.tab_width == 0) cfg.tab_width = 4;
            return cfg;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["fuzzy_threshold"] = fuzzy_threshold;
            j["min_fuzzy_window"] = min_fuzzy_window;
            j["context_window"] = context_window;
            j["tab_width"] = tab_width;
            j["protect"] = protect;
            j["verbose"] = verbose;

            std::ofstream f(path);
            f << j.dump(4);
        }

    private:
        // Negative or non-integral counts keep the default.
        static void read_count(const nlohmann::json& j, const char* key, size_t& out) {
            if (!j.contains(key)) return;
            const nlohmann::json& v = j[key];
            if (!v.is_number_integer() || v.get<long long>() < 0) {
                std::cerr << "[Config] " << key << " must be a non-negative integer, using " << out << "\n";
                return;
            }
            out = v.get<size_t>();
        }
    };

}
