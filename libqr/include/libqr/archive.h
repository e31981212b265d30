//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <filesystem>
#include <vector>

namespace qr {

    // Unpacks a build artifact into `destination_path`, keeping permissions and
    // timestamps. Returns the entry paths relative to the destination.
    // Entries escaping the destination fail with ExtractionFailed.
    Result<std::vector<std::filesystem::path>> extract(
            const std::filesystem::path& archive_path,
            const std::filesystem::path& destination_path
    );

    // Whether libarchive recognises the file as an archive it can read.
    bool is_archive(const std::filesystem::path& path);

} // namespace qr
