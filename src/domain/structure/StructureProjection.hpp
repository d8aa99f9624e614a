/**
 * @file StructureProjection.hpp
 * @brief Computes the display-ordered row list of a project structure.
 */

#pragma once

#include "domain/structure/DirectoryNode.hpp"
#include "domain/structure/EntryKind.hpp"
#include "domain/structure/FileCategory.hpp"
#include <string>
#include <vector>

namespace treeshaper::domain::structure {

/**
 * @enum RowRole
 * @brief Whether a row is a visible entry or the drop target placed before one.
 */
enum class RowRole {
    DropGap,
    Entry
};

/**
 * @struct ProjectionRow
 * @brief One renderable line. Gap rows share path, name, kind and depth with the entry that follows them.
 */
struct ProjectionRow {
    RowRole role = RowRole::Entry;
    std::string path;   ///< Canonical path from the root.
    std::string name;   ///< Last segment of path.
    EntryKind kind = EntryKind::File;
    int depth = 0;      ///< 0 for children of the root.
    FileCategory category = FileCategory::Generic;
};

bool operator==(const ProjectionRow& lhs, const ProjectionRow& rhs);
inline bool operator!=(const ProjectionRow& lhs, const ProjectionRow& rhs) { return !(lhs == rhs); }

/**
 * @brief Stateless projection of a DirectoryNode into display rows.
 *
 * Within each directory, folders come first, sorted case-insensitively,
 * followed by files in plain byte order. A folder's subtree follows its row.
 */
class StructureProjection {
public:
    /** @brief Rows for the whole tree, each entry preceded by its drop gap. */
    static std::vector<ProjectionRow> Project(const DirectoryNode& root);

    /** @brief Drops the gap rows. */
    static std::vector<ProjectionRow> EntryRows(const std::vector<ProjectionRow>& rows);

    /** @brief Every file path in the tree: a node's files first, then its folders, in stored order. */
    static std::vector<std::string> ExtractFilePaths(const DirectoryNode& root);

    /** @brief Case-insensitive "less than" used for folder ordering. */
    static bool FolderNameLess(const std::string& lhs, const std::string& rhs);
};

} // namespace treeshaper::domain::structure
