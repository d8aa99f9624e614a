/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace treeshaper::infrastructure {

EditorSettings ConfigLoader::LoadEditorSettings(const std::string& projectRoot) {
    EditorSettings settings;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        settings.indentWidth = j.value("indent_width", settings.indentWidth);
        settings.showDropGaps = j.value("show_drop_gaps", settings.showDropGaps);
        settings.structureFile = j.value("structure_file", settings.structureFile);
        settings.autoSave = j.value("auto_save", settings.autoSave);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return EditorSettings{};
    }

    if (settings.indentWidth < 0) {
        settings.indentWidth = 0;
    }
    return settings;
}

bool ConfigLoader::SaveEditorSettings(const std::string& projectRoot, const EditorSettings& settings) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Keep keys written by other tools
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) {
                j = nlohmann::json::object();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["indent_width"] = settings.indentWidth;
    j["show_drop_gaps"] = settings.showDropGaps;
    j["structure_file"] = settings.structureFile;
    j["auto_save"] = settings.autoSave;

    try {
        std::filesystem::create_directories(projectRoot);
        std::ofstream f(configPath);
        f << j.dump(4);
        if (!f) {
            std::cerr << "[ConfigLoader] Error writing settings.json: " << configPath << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace treeshaper::infrastructure
