//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <filesystem>
#include <string>
#include <vector>

namespace qr {

    class Parser {
    public:
        // Parses a YAML sequence of package definitions. Invalid entries are
        // logged and skipped; an unreadable or malformed document is an error.
        static Result<std::vector<PackageInfo>> parse_repository_index(const std::filesystem::path& file_path);

        static Result<std::vector<PackageInfo>> parse_index_from_string(const std::string& content);

        // "cat/name" or "cat/name <version-spec>"
        static Result<Dependency> parse_dependency_string(const std::string& text);
    };

} // namespace qr
