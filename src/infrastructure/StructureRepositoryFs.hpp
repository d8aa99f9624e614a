/**
 * @file StructureRepositoryFs.hpp
 * @brief Loads and stores project structures as JSON files.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/structure/DirectoryNode.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace treeshaper::infrastructure {

class StructureRepositoryFs {
public:
    explicit StructureRepositoryFs(std::shared_ptr<PersistenceService> persistence);

    /** @brief Reads and decodes @p filename. @return std::nullopt if missing or invalid. */
    std::optional<domain::structure::DirectoryNode> load(const std::string& filename) const;

    /** @brief Queues an atomic write of the structure. */
    void save(const std::string& filename, const domain::structure::DirectoryNode& structure);

    /** @brief Writes the structure before returning. @return True on success. */
    bool saveNow(const std::string& filename, const domain::structure::DirectoryNode& structure);

private:
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace treeshaper::infrastructure
