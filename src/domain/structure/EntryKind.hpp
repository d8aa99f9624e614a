/**
 * @file EntryKind.hpp
 * @brief Value Object distinguishing file entries from directory entries.
 */

#pragma once

#include <string>
#include <stdexcept>

namespace treeshaper::domain::structure {

/**
 * @enum EntryKind
 * @brief Which child collection of a DirectoryNode an operation touches.
 */
enum class EntryKind {
    File,       ///< An entry of DirectoryNode::files.
    Directory   ///< An entry of DirectoryNode::folders.
};

inline std::string EntryKindToString(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "directory";
        default: return "unknown";
    }
}

/**
 * @brief Parses the wire tag ("file", "directory"; "dir" and "folder" are accepted too).
 * @throws std::invalid_argument for any other tag.
 */
inline EntryKind EntryKindFromString(const std::string& tag) {
    if (tag == "file") return EntryKind::File;
    if (tag == "directory" || tag == "dir" || tag == "folder") return EntryKind::Directory;
    throw std::invalid_argument("Unknown entry kind: " + tag);
}

} // namespace treeshaper::domain::structure
