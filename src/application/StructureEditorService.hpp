/**
 * @file StructureEditorService.hpp
 * @brief Application Service owning a project structure and applying path-addressed edits.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/structure/DirectoryNode.hpp"
#include "domain/structure/EntryKind.hpp"
#include "domain/structure/StructureProjection.hpp"

namespace treeshaper::application {

using domain::structure::DirectoryNode;
using domain::structure::EntryKind;
using domain::structure::ProjectionRow;

/**
 * @struct DragSession
 * @brief An in-progress drag started on an existing entry.
 */
struct DragSession {
    std::string path; ///< Canonical path of the dragged entry.
    EntryKind kind;
};

/**
 * @class StructureEditorService
 * @brief Single writer of a project structure.
 *
 * Every mutating call either commits (returns true, the change callback fires
 * once with the updated tree) or is a no-op (returns false, nothing changes).
 * The callback runs after the tree is consistent, so it may issue further edits.
 */
class StructureEditorService {
public:
    using ChangeCallback = std::function<void(const DirectoryNode&)>;

    explicit StructureEditorService(ChangeCallback onStructureChange = nullptr);

    /**
     * @brief Replaces the structure with a deep copy of @p structure.
     * Does not notify. Any active drag is discarded.
     */
    void setStructure(const DirectoryNode& structure);

    /** @brief Read-only view of the live structure. */
    const DirectoryNode& getStructure() const { return m_structure; }

    /**
     * @brief Inserts a file or an empty directory, creating missing parent directories.
     * @return False for an empty path or when the leaf already exists.
     */
    bool addPath(const std::string& path, EntryKind kind);

    /**
     * @brief Renames the entry at @p oldPath to @p newName, keeping its position.
     * @return False if the entry is missing, the name is empty, contains '/',
     *         is unchanged, or collides with a sibling of the same kind.
     */
    bool renamePath(const std::string& oldPath, const std::string& newName, EntryKind kind);

    /** @brief Removes a file, or a directory with its whole subtree. */
    bool deletePath(const std::string& path, EntryKind kind);

    /**
     * @brief Moves an entry so it sits just before @p targetPath in the target's parent.
     *
     * The entry keeps its name and kind. When the target's parent holds no entry
     * of the same kind named like the target, the moved entry is appended.
     * @return False when the paths are equal, either side does not resolve,
     *         a directory would land inside itself, or the destination already
     *         holds another entry with the same kind and name.
     */
    bool relocatePath(const std::string& draggedPath, EntryKind kind, const std::string& targetPath);

    // --- Drag and drop ---

    /** @brief Starts a drag on an existing entry. Replaces any previous session. */
    bool beginDrag(const std::string& path, EntryKind kind);

    const std::optional<DragSession>& activeDrag() const { return m_drag; }

    void cancelDrag() { m_drag.reset(); }

    /** @brief Ends the active drag over the gap in front of @p targetPath. */
    bool dropOnGap(const std::string& targetPath);

    // --- Queries ---

    bool exists(const std::string& path, EntryKind kind) const;

    /** @brief Display rows of the current structure. */
    std::vector<ProjectionRow> project() const;

private:
    DirectoryNode m_structure;
    ChangeCallback m_onStructureChange;
    std::optional<DragSession> m_drag;

    /**
     * @brief Walks every segment except the last and returns the directory reached.
     * With @p createMissing, absent directories are created on the way.
     */
    DirectoryNode* resolveParent(const std::vector<std::string>& segments, bool createMissing);
    const DirectoryNode* resolveParent(const std::vector<std::string>& segments) const;

    void notifyChange();
};

} // namespace treeshaper::application
