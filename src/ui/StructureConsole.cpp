#include "ui/StructureConsole.hpp"
#include "domain/structure/FileCategory.hpp"
#include "domain/structure/StructureProjection.hpp"
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace treeshaper::ui {

using domain::structure::EntryKind;
using domain::structure::EntryKindFromString;
using domain::structure::EntryKindToString;
using domain::structure::FileCategoryToString;
using domain::structure::ProjectionRow;
using domain::structure::RowRole;
using domain::structure::StructureProjection;

StructureConsole::StructureConsole(application::StructureEditorService& service,
                                   const infrastructure::EditorSettings& settings,
                                   std::ostream& out,
                                   SaveHandler onSave)
    : m_service(service), m_settings(settings), m_out(out), m_onSave(std::move(onSave)) {}

std::vector<std::string> StructureConsole::Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream ss(line);
    std::string token;
    while (ss >> std::quoted(token)) {
        tokens.push_back(token);
    }
    return tokens;
}

void StructureConsole::report(bool committed, const std::string& action, const std::string& subject) const {
    if (committed) {
        m_out << "[ok] " << action << " " << subject << "\n";
    } else {
        m_out << "[no-op] " << action << " " << subject << "\n";
    }
}

bool StructureConsole::execute(const std::string& line) {
    auto tokens = Tokenize(line);
    if (tokens.empty() || tokens[0].rfind("#", 0) == 0) {
        return true;
    }

    const std::string& command = tokens[0];
    try {
        if (command == "quit" || command == "exit") {
            return false;
        }
        if (command == "help") {
            printHelp();
        } else if (command == "show") {
            renderStructure();
        } else if (command == "files") {
            renderFilePaths();
        } else if (command == "cancel") {
            m_service.cancelDrag();
            m_out << "[ok] drag cancelled\n";
        } else if (command == "save") {
            bool saved = m_onSave && m_onSave(m_service.getStructure());
            m_out << (saved ? "[ok] saved\n" : "[error] save failed\n");
        } else if (command == "drop" && tokens.size() == 2) {
            report(m_service.dropOnGap(tokens[1]), "drop before", tokens[1]);
        } else if (command == "add" && tokens.size() == 3) {
            EntryKind kind = EntryKindFromString(tokens[1]);
            report(m_service.addPath(tokens[2], kind), "add " + EntryKindToString(kind), tokens[2]);
        } else if (command == "rename" && tokens.size() == 4) {
            EntryKind kind = EntryKindFromString(tokens[1]);
            report(m_service.renamePath(tokens[2], tokens[3], kind),
                   "rename " + EntryKindToString(kind), tokens[2] + " -> " + tokens[3]);
        } else if (command == "delete" && tokens.size() == 3) {
            EntryKind kind = EntryKindFromString(tokens[1]);
            report(m_service.deletePath(tokens[2], kind), "delete " + EntryKindToString(kind), tokens[2]);
        } else if (command == "drag" && tokens.size() == 3) {
            EntryKind kind = EntryKindFromString(tokens[1]);
            report(m_service.beginDrag(tokens[2], kind), "drag " + EntryKindToString(kind), tokens[2]);
        } else {
            m_out << "[error] unknown or malformed command: " << line << "\n";
        }
    } catch (const std::invalid_argument& e) {
        m_out << "[error] " << e.what() << "\n";
    }
    return true;
}

void StructureConsole::runSession(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!execute(line)) break;
    }
}

void StructureConsole::renderStructure() const {
    auto rows = m_service.project();
    if (rows.empty()) {
        m_out << "(empty structure)\n";
        return;
    }

    for (const ProjectionRow& row : rows) {
        std::string indent(static_cast<size_t>(row.depth * m_settings.indentWidth), ' ');
        if (row.role == RowRole::DropGap) {
            if (m_settings.showDropGaps) {
                m_out << indent << "--- drop before " << row.path << "\n";
            }
            continue;
        }
        m_out << indent << "[" << FileCategoryToString(row.category) << "] " << row.name
              << (row.kind == EntryKind::Directory ? "/" : "") << "\n";
    }
}

void StructureConsole::renderFilePaths() const {
    for (const auto& path : StructureProjection::ExtractFilePaths(m_service.getStructure())) {
        m_out << path << "\n";
    }
}

void StructureConsole::printHelp() const {
    m_out << "Commands:\n"
          << "  add <file|directory> <path>\n"
          << "  rename <file|directory> <path> <newName>\n"
          << "  delete <file|directory> <path>\n"
          << "  drag <file|directory> <path>\n"
          << "  drop <targetPath>\n"
          << "  cancel | show | files | save | help | quit\n";
}

} // namespace treeshaper::ui
