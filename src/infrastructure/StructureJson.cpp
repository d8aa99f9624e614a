/**
 * @file StructureJson.cpp
 * @brief Implementation of StructureJson.
 */

#include "infrastructure/StructureJson.hpp"
#include <iostream>
#include <stdexcept>

namespace treeshaper::infrastructure {

using json = nlohmann::json;
using domain::structure::DirectoryNode;

namespace {

    json NodeToJson(const DirectoryNode& node, bool includeName) {
        json j = json::object();
        if (includeName) {
            j["name"] = node.name;
        }
        j["folders"] = json::array();
        for (const auto& folder : node.folders) {
            j["folders"].push_back(NodeToJson(folder, true));
        }
        j["files"] = node.files;
        return j;
    }

    // Throws std::invalid_argument or json::exception on malformed input.
    DirectoryNode NodeFromJson(const json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("structure node must be an object");
        }

        DirectoryNode node;
        if (j.contains("name") && j["name"].is_string()) {
            node.name = j["name"].get<std::string>();
        }

        if (j.contains("files") && !j["files"].is_null()) {
            node.files = j["files"].get<std::vector<std::string>>();
        }

        if (j.contains("folders") && !j["folders"].is_null()) {
            const json& folders = j["folders"];
            if (!folders.is_array()) {
                throw std::invalid_argument("\"folders\" must be an array");
            }
            for (const auto& folderJson : folders) {
                DirectoryNode folder = NodeFromJson(folderJson);
                if (folder.name.empty()) {
                    std::cerr << "[StructureJson] Skipping folder without a name." << std::endl;
                    continue;
                }
                node.folders.push_back(std::move(folder));
            }
        }
        return node;
    }

} // namespace

json StructureJson::ToJson(const DirectoryNode& root) {
    return NodeToJson(root, false);
}

std::string StructureJson::Serialize(const DirectoryNode& root, int indent) {
    return ToJson(root).dump(indent);
}

std::optional<DirectoryNode> StructureJson::FromJson(const json& j) {
    try {
        DirectoryNode root = NodeFromJson(j);
        root.name.clear();
        return root;
    } catch (const json::exception& e) {
        std::cerr << "[StructureJson] Invalid structure: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[StructureJson] Invalid structure: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<DirectoryNode> StructureJson::ParseStructure(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[StructureJson] JSON Parse Error: " << e.what() << std::endl;
        return std::nullopt;
    }
    return FromJson(j);
}

} // namespace treeshaper::infrastructure
