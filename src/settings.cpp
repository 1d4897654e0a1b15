#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>

namespace mkq {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Settings settings;
        settings.output_extension = j.value("output_extension", settings.output_extension);
        settings.output_dir = j.value("output_dir", settings.output_dir);
        settings.max_nesting_depth = j.value("max_nesting_depth", settings.max_nesting_depth);
        settings.verbose = j.value("verbose", settings.verbose);

        if (j.contains("input_patterns") && j["input_patterns"].is_array()) {
            for (const auto& pattern : j["input_patterns"]) {
                if (pattern.is_string()) {
                    settings.input_patterns.push_back(pattern.get<std::string>());
                }
            }
        }

        verbose_log("settings", "loaded " + path);
        return settings;
    } catch (const json::exception& e) {
        verbose_err("settings", path + ": " + e.what());
        return std::nullopt;
    }
}

bool save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["output_extension"] = settings.output_extension;
    j["output_dir"] = settings.output_dir;
    j["max_nesting_depth"] = settings.max_nesting_depth;
    j["input_patterns"] = settings.input_patterns;
    j["verbose"] = settings.verbose;

    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << j.dump(2) << std::endl;
    return static_cast<bool>(file);
}

} // namespace mkq
