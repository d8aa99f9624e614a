/**
 * @file TreeShaperApp.cpp
 * @brief Implementation of TreeShaperApp.
 */

#include "app/TreeShaperApp.hpp"
#include "infrastructure/PathUtils.hpp"
#include "ui/StructureConsole.hpp"
#include <fstream>
#include <iostream>

namespace treeshaper::app {

bool TreeShaperApp::ParseArguments(int argc, char** argv, LaunchOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--project" || arg == "--structure") {
            if (i + 1 >= argc) {
                std::cerr << "[TreeShaperApp] Missing value for " << arg << std::endl;
                return false;
            }
            (arg == "--project" ? options.projectRoot : options.structureFile) = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[TreeShaperApp] Unknown option: " << arg << std::endl;
            return false;
        } else {
            options.scriptFile = arg;
        }
    }
    return true;
}

bool TreeShaperApp::Init(const LaunchOptions& options) {
    m_projectRoot = options.projectRoot.empty()
        ? infrastructure::PathUtils::GetDefaultProjectRoot().string()
        : options.projectRoot;
    m_settings = infrastructure::ConfigLoader::LoadEditorSettings(m_projectRoot);

    const std::string& file = options.structureFile.empty() ? m_settings.structureFile : options.structureFile;
    m_structurePath = infrastructure::PathUtils::ResolveInProject(m_projectRoot, file).string();

    m_persistence = std::make_shared<infrastructure::PersistenceService>();
    m_repository = std::make_unique<infrastructure::StructureRepositoryFs>(m_persistence);
    m_editor = std::make_unique<application::StructureEditorService>(
        [this](const application::DirectoryNode& structure) { OnStructureChanged(structure); });

    if (auto structure = m_repository->load(m_structurePath)) {
        m_editor->setStructure(*structure);
        std::cout << "[TreeShaperApp] Loaded " << m_structurePath << " (" << structure->countFiles() << " files)" << std::endl;
    } else {
        std::cout << "[TreeShaperApp] Starting with an empty structure: " << m_structurePath << std::endl;
    }
    return true;
}

void TreeShaperApp::OnStructureChanged(const application::DirectoryNode& structure) {
    std::cout << "[TreeShaperApp] Structure changed (" << structure.countFiles() << " files)" << std::endl;
    if (m_settings.autoSave) {
        m_repository->save(m_structurePath, structure);
    }
}

void TreeShaperApp::Shutdown() {
    if (m_repository && m_editor) {
        if (!m_repository->saveNow(m_structurePath, m_editor->getStructure())) {
            std::cerr << "[TreeShaperApp] Final save failed: " << m_structurePath << std::endl;
        }
    }
    if (m_persistence) {
        m_persistence->stop();
    }
}

int TreeShaperApp::Run(const LaunchOptions& options) {
    if (!Init(options)) {
        return 1;
    }

    ui::StructureConsole console(*m_editor, m_settings, std::cout,
        [this](const application::DirectoryNode& structure) {
            return m_repository->saveNow(m_structurePath, structure);
        });

    int exitCode = 0;
    if (!options.scriptFile.empty()) {
        std::ifstream script(options.scriptFile);
        if (!script) {
            std::cerr << "[TreeShaperApp] Cannot open script: " << options.scriptFile << std::endl;
            exitCode = 1;
        } else {
            console.runSession(script);
        }
    } else {
        console.runSession(std::cin);
    }

    Shutdown();
    return exitCode;
}

} // namespace treeshaper::app
