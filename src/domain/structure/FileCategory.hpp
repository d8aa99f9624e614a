/**
 * @file FileCategory.hpp
 * @brief Classification of structure entries used for row icons.
 */

#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace treeshaper::domain::structure {

/**
 * @enum FileCategory
 * @brief Coarse file type derived from the extension.
 */
enum class FileCategory {
    Folder,     ///< Directory rows.
    WebPage,    ///< .html
    Stylesheet, ///< .css
    Script,     ///< .js
    Python,     ///< .py
    Data,       ///< .json
    Document,   ///< .md
    Text,       ///< .txt
    Config,     ///< .yml .yaml .toml .cfg .ini
    Generic     ///< Anything else.
};

inline std::string FileCategoryToString(FileCategory category) {
    switch (category) {
        case FileCategory::Folder: return "dir";
        case FileCategory::WebPage: return "web";
        case FileCategory::Stylesheet: return "style";
        case FileCategory::Script: return "script";
        case FileCategory::Python: return "python";
        case FileCategory::Data: return "data";
        case FileCategory::Document: return "doc";
        case FileCategory::Text: return "text";
        case FileCategory::Config: return "config";
        case FileCategory::Generic: return "file";
        default: return "file";
    }
}

/**
 * @brief Classifies a file name by the text after its last '.', case-insensitive.
 * A name without a dot is matched as a whole ("ini" is a Config file).
 */
inline FileCategory ClassifyFileName(const std::string& fileName) {
    size_t dot = fileName.find_last_of('.');
    std::string ext = dot == std::string::npos ? fileName : fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

    if (ext == "html") return FileCategory::WebPage;
    if (ext == "css") return FileCategory::Stylesheet;
    if (ext == "js") return FileCategory::Script;
    if (ext == "py") return FileCategory::Python;
    if (ext == "json") return FileCategory::Data;
    if (ext == "md") return FileCategory::Document;
    if (ext == "txt") return FileCategory::Text;
    if (ext == "yml" || ext == "yaml" || ext == "toml" || ext == "cfg" || ext == "ini") return FileCategory::Config;
    return FileCategory::Generic;
}

} // namespace treeshaper::domain::structure
