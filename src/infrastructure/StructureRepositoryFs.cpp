/**
 * @file StructureRepositoryFs.cpp
 * @brief Implementation of StructureRepositoryFs.
 */

#include "infrastructure/StructureRepositoryFs.hpp"
#include "infrastructure/StructureJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace treeshaper::infrastructure {

namespace fs = std::filesystem;
using domain::structure::DirectoryNode;

StructureRepositoryFs::StructureRepositoryFs(std::shared_ptr<PersistenceService> persistence)
    : m_persistence(std::move(persistence)) {}

std::optional<DirectoryNode> StructureRepositoryFs::load(const std::string& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        return std::nullopt;
    }

    std::ifstream inFile(filename);
    if (!inFile) {
        std::cerr << "[StructureRepositoryFs] Failed to open: " << filename << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << inFile.rdbuf();

    auto structure = StructureJson::ParseStructure(buffer.str());
    if (!structure) {
        std::cerr << "[StructureRepositoryFs] Ignoring invalid structure file: " << filename << std::endl;
    }
    return structure;
}

void StructureRepositoryFs::save(const std::string& filename, const DirectoryNode& structure) {
    m_persistence->saveTextAsync(filename, StructureJson::Serialize(structure));
}

bool StructureRepositoryFs::saveNow(const std::string& filename, const DirectoryNode& structure) {
    return m_persistence->saveText(filename, StructureJson::Serialize(structure));
}

} // namespace treeshaper::infrastructure
