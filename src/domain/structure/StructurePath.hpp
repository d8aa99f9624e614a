/**
 * @file StructurePath.hpp
 * @brief Helpers for canonical '/'-delimited structure paths.
 */

#pragma once

#include <string>
#include <vector>

namespace treeshaper::domain::structure {

class StructurePath {
public:
    /**
     * @brief Splits a path into its non-empty segments.
     * Leading, trailing and repeated separators are dropped: "a//b/" -> {"a", "b"}.
     */
    static std::vector<std::string> Split(const std::string& path);

    /** @brief Joins segments with '/'. */
    static std::string Join(const std::vector<std::string>& segments);

    /** @brief Split followed by Join. */
    static std::string Canonicalize(const std::string& path);

    /** @brief Appends a child name to a canonical parent path ("" is the root). */
    static std::string Child(const std::string& parentPath, const std::string& name);

    /** @brief True if @p candidate equals @p ancestor or lies below it. Both are segment lists. */
    static bool IsSameOrDescendant(const std::vector<std::string>& ancestor,
                                   const std::vector<std::string>& candidate);
};

} // namespace treeshaper::domain::structure
