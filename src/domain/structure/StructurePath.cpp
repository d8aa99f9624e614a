#include "domain/structure/StructurePath.hpp"
#include <sstream>

namespace treeshaper::domain::structure {

std::vector<std::string> StructurePath::Split(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

std::string StructurePath::Join(const std::vector<std::string>& segments) {
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) joined += '/';
        joined += segment;
    }
    return joined;
}

std::string StructurePath::Canonicalize(const std::string& path) {
    return Join(Split(path));
}

std::string StructurePath::Child(const std::string& parentPath, const std::string& name) {
    return parentPath.empty() ? name : parentPath + "/" + name;
}

bool StructurePath::IsSameOrDescendant(const std::vector<std::string>& ancestor,
                                       const std::vector<std::string>& candidate) {
    if (candidate.size() < ancestor.size()) return false;
    for (size_t i = 0; i < ancestor.size(); ++i) {
        if (ancestor[i] != candidate[i]) return false;
    }
    return true;
}

} // namespace treeshaper::domain::structure
