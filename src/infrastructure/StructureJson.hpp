/**
 * @file StructureJson.hpp
 * @brief JSON wire format of a project structure: { "name"?, "folders": [...], "files": [...] }.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/structure/DirectoryNode.hpp"

namespace treeshaper::infrastructure {

class StructureJson {
public:
    /** @brief Encodes a tree. The root is written without a "name" key. */
    static nlohmann::json ToJson(const domain::structure::DirectoryNode& root);

    /** @brief ToJson(root).dump(indent). */
    static std::string Serialize(const domain::structure::DirectoryNode& root, int indent = 2);

    /**
     * @brief Decodes a tree.
     *
     * Missing "folders"/"files" are read as empty and unknown keys are ignored.
     * Nested folders without a string "name" are skipped.
     * @return std::nullopt if the document has the wrong shape.
     */
    static std::optional<domain::structure::DirectoryNode> FromJson(const nlohmann::json& j);

    /** @brief Parses text and decodes it. @return std::nullopt on syntax or shape errors. */
    static std::optional<domain::structure::DirectoryNode> ParseStructure(const std::string& text);
};

} // namespace treeshaper::infrastructure
