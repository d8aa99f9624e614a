/**
 * @file StructureEditorService.cpp
 * @brief Implementation of StructureEditorService.
 */

#include "application/StructureEditorService.hpp"
#include "domain/structure/StructurePath.hpp"
#include <algorithm>
#include <iterator>

namespace treeshaper::application {

using domain::structure::StructurePath;
using domain::structure::StructureProjection;

namespace {

    std::vector<std::string> ParentSegments(const std::vector<std::string>& segments) {
        if (segments.empty()) return {};
        return std::vector<std::string>(segments.begin(), segments.end() - 1);
    }

    std::vector<DirectoryNode>::iterator FindFolder(DirectoryNode& parent, const std::string& name) {
        return std::find_if(parent.folders.begin(), parent.folders.end(),
            [&](const DirectoryNode& f) { return f.name == name; });
    }

    std::vector<std::string>::iterator FindFile(DirectoryNode& parent, const std::string& name) {
        return std::find(parent.files.begin(), parent.files.end(), name);
    }

    bool HasEntry(const DirectoryNode& parent, const std::string& name, EntryKind kind) {
        return kind == EntryKind::File ? parent.hasFile(name) : parent.findFolder(name) != nullptr;
    }

} // namespace

StructureEditorService::StructureEditorService(ChangeCallback onStructureChange)
    : m_onStructureChange(std::move(onStructureChange)) {}

void StructureEditorService::setStructure(const DirectoryNode& structure) {
    m_structure = structure;
    m_drag.reset();
}

DirectoryNode* StructureEditorService::resolveParent(const std::vector<std::string>& segments, bool createMissing) {
    DirectoryNode* node = &m_structure;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        DirectoryNode* next = node->findFolder(segments[i]);
        if (!next) {
            if (!createMissing) return nullptr;
            DirectoryNode created;
            created.name = segments[i];
            node->folders.push_back(std::move(created));
            next = &node->folders.back();
        }
        node = next;
    }
    return node;
}

const DirectoryNode* StructureEditorService::resolveParent(const std::vector<std::string>& segments) const {
    const DirectoryNode* node = &m_structure;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        node = node->findFolder(segments[i]);
        if (!node) return nullptr;
    }
    return node;
}

void StructureEditorService::notifyChange() {
    if (m_onStructureChange) {
        m_onStructureChange(m_structure);
    }
}

bool StructureEditorService::addPath(const std::string& path, EntryKind kind) {
    auto segments = StructurePath::Split(path);
    if (segments.empty()) return false;

    // A missing intermediate means the leaf cannot exist yet, so creating
    // intermediates never precedes a rejected insert.
    DirectoryNode* parent = resolveParent(segments, true);
    const std::string& leaf = segments.back();
    if (HasEntry(*parent, leaf, kind)) return false;

    if (kind == EntryKind::File) {
        parent->files.push_back(leaf);
    } else {
        DirectoryNode folder;
        folder.name = leaf;
        parent->folders.push_back(std::move(folder));
    }

    notifyChange();
    return true;
}

bool StructureEditorService::renamePath(const std::string& oldPath, const std::string& newName, EntryKind kind) {
    auto segments = StructurePath::Split(oldPath);
    if (segments.empty()) return false;
    if (newName.empty() || newName.find('/') != std::string::npos) return false;

    DirectoryNode* parent = resolveParent(segments, false);
    if (!parent) return false;

    const std::string& oldName = segments.back();
    if (kind == EntryKind::File) {
        auto it = FindFile(*parent, oldName);
        if (it == parent->files.end()) return false;
        if (newName == oldName || parent->hasFile(newName)) return false;
        *it = newName;
    } else {
        auto it = FindFolder(*parent, oldName);
        if (it == parent->folders.end()) return false;
        if (newName == oldName || parent->findFolder(newName)) return false;
        it->name = newName;
    }

    notifyChange();
    return true;
}

bool StructureEditorService::deletePath(const std::string& path, EntryKind kind) {
    auto segments = StructurePath::Split(path);
    if (segments.empty()) return false;

    DirectoryNode* parent = resolveParent(segments, false);
    if (!parent) return false;

    if (kind == EntryKind::File) {
        auto it = FindFile(*parent, segments.back());
        if (it == parent->files.end()) return false;
        parent->files.erase(it);
    } else {
        auto it = FindFolder(*parent, segments.back());
        if (it == parent->folders.end()) return false;
        parent->folders.erase(it);
    }

    notifyChange();
    return true;
}

bool StructureEditorService::relocatePath(const std::string& draggedPath, EntryKind kind, const std::string& targetPath) {
    auto source = StructurePath::Split(draggedPath);
    auto target = StructurePath::Split(targetPath);
    if (source.empty() || target.empty() || source == target) return false;

    auto sourceParentPath = ParentSegments(source);
    auto targetParentPath = ParentSegments(target);
    if (kind == EntryKind::Directory && StructurePath::IsSameOrDescendant(source, targetParentPath)) {
        return false;
    }

    DirectoryNode* sourceParent = resolveParent(source, false);
    if (!sourceParent || !HasEntry(*sourceParent, source.back(), kind)) return false;

    const DirectoryNode* destination = resolveParent(target, false);
    if (!destination) return false;

    bool sameParent = sourceParentPath == targetParentPath;
    if (!sameParent && HasEntry(*destination, source.back(), kind)) return false;

    const std::string& anchor = target.back();
    if (kind == EntryKind::File) {
        std::string fileName = source.back();
        sourceParent->files.erase(FindFile(*sourceParent, fileName));

        DirectoryNode* dest = resolveParent(target, false);
        dest->files.insert(FindFile(*dest, anchor), std::move(fileName));
    } else {
        auto it = FindFolder(*sourceParent, source.back());
        auto originalIndex = std::distance(sourceParent->folders.begin(), it);
        DirectoryNode moved = std::move(*it);
        sourceParent->folders.erase(it);

        // Erasing shifts sibling subtrees, so the destination is looked up again.
        DirectoryNode* dest = resolveParent(target, false);
        if (!dest) {
            sourceParent->folders.insert(sourceParent->folders.begin() + originalIndex, std::move(moved));
            return false;
        }
        dest->folders.insert(FindFolder(*dest, anchor), std::move(moved));
    }

    notifyChange();
    return true;
}

bool StructureEditorService::beginDrag(const std::string& path, EntryKind kind) {
    if (!exists(path, kind)) return false;
    m_drag = DragSession{StructurePath::Canonicalize(path), kind};
    return true;
}

bool StructureEditorService::dropOnGap(const std::string& targetPath) {
    if (!m_drag) return false;
    DragSession session = *m_drag;
    m_drag.reset();
    return relocatePath(session.path, session.kind, targetPath);
}

bool StructureEditorService::exists(const std::string& path, EntryKind kind) const {
    auto segments = StructurePath::Split(path);
    if (segments.empty()) return false;
    const DirectoryNode* parent = resolveParent(segments);
    return parent && HasEntry(*parent, segments.back(), kind);
}

std::vector<ProjectionRow> StructureEditorService::project() const {
    return StructureProjection::Project(m_structure);
}

} // namespace treeshaper::application
