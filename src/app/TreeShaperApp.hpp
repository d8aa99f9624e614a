/**
 * @file TreeShaperApp.hpp
 * @brief Main application class for TreeShaper.
 */

#pragma once

#include <memory>
#include <string>
#include "application/StructureEditorService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StructureRepositoryFs.hpp"

namespace treeshaper::app {

/**
 * @struct LaunchOptions
 * @brief Values taken from the command line. Empty strings mean "use the default".
 */
struct LaunchOptions {
    std::string projectRoot;   ///< Directory holding settings.json.
    std::string structureFile; ///< Overrides EditorSettings::structureFile.
    std::string scriptFile;    ///< Commands to run instead of reading stdin.
};

/**
 * @class TreeShaperApp
 * @brief Orchestrates loading, the command session and the final save.
 */
class TreeShaperApp {
public:
    /**
     * @brief Runs one editing session.
     * @return Exit code (0 for success).
     */
    int Run(const LaunchOptions& options);

    /**
     * @brief Parses "[--project DIR] [--structure FILE] [SCRIPT]".
     * @return False on unknown flags or missing values.
     */
    static bool ParseArguments(int argc, char** argv, LaunchOptions& options);

private:
    bool Init(const LaunchOptions& options);
    void Shutdown();
    void OnStructureChanged(const application::DirectoryNode& structure);

    std::string m_projectRoot;
    std::string m_structurePath;
    infrastructure::EditorSettings m_settings;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::unique_ptr<infrastructure::StructureRepositoryFs> m_repository;
    std::unique_ptr<application::StructureEditorService> m_editor;
};

} // namespace treeshaper::app
