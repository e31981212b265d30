//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <filesystem>
#include <string>

namespace qr {
    // SHA-256 of the file contents as lowercase hex.
    Result<std::string> hash_file(const std::filesystem::path& file_path);

    bool verify_file_checksum(const std::filesystem::path& file_path, const std::string& expected_checksum);
}
