#include "domain/structure/StructureProjection.hpp"
#include "domain/structure/StructurePath.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace treeshaper::domain::structure {

namespace {

    void AppendRow(std::vector<ProjectionRow>& rows, const std::string& path, const std::string& name,
                   EntryKind kind, int depth) {
        ProjectionRow row;
        row.path = path;
        row.name = name;
        row.kind = kind;
        row.depth = depth;
        row.category = kind == EntryKind::Directory ? FileCategory::Folder : ClassifyFileName(name);

        ProjectionRow gap = row;
        gap.role = RowRole::DropGap;
        rows.push_back(gap);

        row.role = RowRole::Entry;
        rows.push_back(row);
    }

    void ProjectNode(const DirectoryNode& node, const std::string& currentPath, int depth,
                     std::vector<ProjectionRow>& rows) {
        std::vector<const DirectoryNode*> folders;
        folders.reserve(node.folders.size());
        for (const auto& folder : node.folders) {
            folders.push_back(&folder);
        }
        std::sort(folders.begin(), folders.end(), [](const DirectoryNode* a, const DirectoryNode* b) {
            return StructureProjection::FolderNameLess(a->name, b->name);
        });

        std::vector<std::string> files = node.files;
        std::sort(files.begin(), files.end());

        for (const DirectoryNode* folder : folders) {
            std::string fullPath = StructurePath::Child(currentPath, folder->name);
            AppendRow(rows, fullPath, folder->name, EntryKind::Directory, depth);
            ProjectNode(*folder, fullPath, depth + 1, rows);
        }

        for (const auto& fileName : files) {
            AppendRow(rows, StructurePath::Child(currentPath, fileName), fileName, EntryKind::File, depth);
        }
    }

    void CollectFiles(const DirectoryNode& node, const std::string& currentPath, std::vector<std::string>& out) {
        for (const auto& fileName : node.files) {
            out.push_back(StructurePath::Child(currentPath, fileName));
        }
        for (const auto& folder : node.folders) {
            if (folder.name.empty()) continue;
            CollectFiles(folder, StructurePath::Child(currentPath, folder.name), out);
        }
    }

} // namespace

bool operator==(const ProjectionRow& lhs, const ProjectionRow& rhs) {
    return lhs.role == rhs.role && lhs.path == rhs.path && lhs.name == rhs.name &&
           lhs.kind == rhs.kind && lhs.depth == rhs.depth && lhs.category == rhs.category;
}

bool StructureProjection::FolderNameLess(const std::string& lhs, const std::string& rhs) {
    bool lessIgnoringCase = std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
    if (lessIgnoringCase) return true;

    bool greaterIgnoringCase = std::lexicographical_compare(
        rhs.begin(), rhs.end(), lhs.begin(), lhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
    if (greaterIgnoringCase) return false;

    // "Src" and "src": equal ignoring case, fall back to byte order
    return lhs < rhs;
}

std::vector<ProjectionRow> StructureProjection::Project(const DirectoryNode& root) {
    std::vector<ProjectionRow> rows;
    ProjectNode(root, "", 0, rows);
    return rows;
}

std::vector<ProjectionRow> StructureProjection::EntryRows(const std::vector<ProjectionRow>& rows) {
    std::vector<ProjectionRow> entries;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(entries),
        [](const ProjectionRow& row) { return row.role == RowRole::Entry; });
    return entries;
}

std::vector<std::string> StructureProjection::ExtractFilePaths(const DirectoryNode& root) {
    std::vector<std::string> paths;
    CollectFiles(root, "", paths);
    return paths;
}

} // namespace treeshaper::domain::structure
