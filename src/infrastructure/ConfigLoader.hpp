/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving editor configuration (settings.json).
 *
 * Keeps JSON parsing of user preferences in one place instead of scattering
 * it through the console and the services.
 */

#pragma once

#include <string>

namespace treeshaper::infrastructure {

/**
 * @struct EditorSettings
 * @brief User preferences of the structure editor.
 */
struct EditorSettings {
    int indentWidth = 2;                          ///< Spaces per depth level when printing rows.
    bool showDropGaps = false;                    ///< Print drop gaps between rows.
    std::string structureFile = "structure.json"; ///< Relative to the project root unless absolute.
    bool autoSave = true;                         ///< Queue a save after every committed edit.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p projectRoot.
     * @return Defaults for a missing file, missing keys or unreadable JSON.
     */
    static EditorSettings LoadEditorSettings(const std::string& projectRoot);

    /**
     * @brief Writes the settings to settings.json, preserving unrelated keys if possible.
     * @return False if the file could not be written.
     */
    static bool SaveEditorSettings(const std::string& projectRoot, const EditorSettings& settings);
};

} // namespace treeshaper::infrastructure
