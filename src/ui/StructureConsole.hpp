/**
 * @file StructureConsole.hpp
 * @brief Line-oriented front end that drives a StructureEditorService.
 */

#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include "application/StructureEditorService.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace treeshaper::ui {

/**
 * @class StructureConsole
 * @brief Translates text commands into editor calls and prints projection rows.
 *
 * Commands:
 *   add <file|directory> <path>
 *   rename <file|directory> <path> <newName>
 *   delete <file|directory> <path>
 *   drag <file|directory> <path>
 *   drop <targetPath>
 *   cancel | show | files | save | help | quit
 * Arguments containing spaces can be double-quoted.
 */
class StructureConsole {
public:
    using SaveHandler = std::function<bool(const application::DirectoryNode&)>;

    StructureConsole(application::StructureEditorService& service,
                     const infrastructure::EditorSettings& settings,
                     std::ostream& out,
                     SaveHandler onSave = nullptr);

    /**
     * @brief Executes one command line.
     * @return False once the session should end (quit/exit).
     */
    bool execute(const std::string& line);

    /** @brief Executes lines from @p in until end of input or quit. */
    void runSession(std::istream& in);

    /** @brief Prints the projection of the current structure. */
    void renderStructure() const;

    /** @brief Prints every file path of the current structure. */
    void renderFilePaths() const;

    /** @brief Splits on whitespace, honoring double quotes. */
    static std::vector<std::string> Tokenize(const std::string& line);

private:
    application::StructureEditorService& m_service;
    infrastructure::EditorSettings m_settings;
    std::ostream& m_out;
    SaveHandler m_onSave;

    void printHelp() const;
    void report(bool committed, const std::string& action, const std::string& subject) const;
};

} // namespace treeshaper::ui
