/**
 * @file DirectoryNode.hpp
 * @brief Entity representing one folder of a project structure.
 */

#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace treeshaper::domain::structure {

/**
 * @struct DirectoryNode
 * @brief A folder: a name plus its child folders and file names.
 *
 * Children are stored in insertion order. Display order is computed by
 * StructureProjection and never written back here.
 * Each node exclusively owns its child folders; there are no parent links.
 */
struct DirectoryNode {
    std::string name;                     ///< Segment name. Unused on the root.
    std::vector<DirectoryNode> folders;   ///< Child directories.
    std::vector<std::string> files;       ///< Child file names.

    /** @brief Returns the child folder with the exact name, or nullptr. */
    DirectoryNode* findFolder(const std::string& folderName) {
        auto it = std::find_if(folders.begin(), folders.end(),
            [&](const DirectoryNode& f) { return f.name == folderName; });
        return it != folders.end() ? &*it : nullptr;
    }

    const DirectoryNode* findFolder(const std::string& folderName) const {
        auto it = std::find_if(folders.begin(), folders.end(),
            [&](const DirectoryNode& f) { return f.name == folderName; });
        return it != folders.end() ? &*it : nullptr;
    }

    bool hasFile(const std::string& fileName) const {
        return std::find(files.begin(), files.end(), fileName) != files.end();
    }

    bool isEmpty() const {
        return folders.empty() && files.empty();
    }

    /** @brief Number of files in this subtree. */
    size_t countFiles() const {
        size_t total = files.size();
        for (const auto& folder : folders) {
            total += folder.countFiles();
        }
        return total;
    }
};

// Deep structural equality, order of folders and files included.
inline bool operator==(const DirectoryNode& lhs, const DirectoryNode& rhs) {
    return lhs.name == rhs.name && lhs.files == rhs.files && lhs.folders == rhs.folders;
}

inline bool operator!=(const DirectoryNode& lhs, const DirectoryNode& rhs) {
    return !(lhs == rhs);
}

} // namespace treeshaper::domain::structure
