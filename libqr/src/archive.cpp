//
// Created by cv2 on 10/19/26.
//

#include "libqr/archive.h"
#include "libqr/logging.h"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <string>

namespace qr {
    // Helper to ensure archive structs are always freed
    struct ArchiveReadGuard {
        archive* a;
        explicit ArchiveReadGuard(archive* arch) : a(arch) {}
        ~ArchiveReadGuard() {
            if (a) {
                archive_read_free(a);
            }
        }
    };

    static bool escapes(const std::filesystem::path& destination, const std::filesystem::path& full_path) {
        auto [root, rest] = std::mismatch(destination.begin(), destination.end(), full_path.begin(), full_path.end());
        return root != destination.end();
    }

    Result<std::vector<std::filesystem::path>> extract(
        const std::filesystem::path& archive_path,
        const std::filesystem::path& destination_path)
    {
        archive* a = archive_read_new();
        ArchiveReadGuard guard(a);
        archive_read_support_filter_all(a);
        archive_read_support_format_all(a);

        if (archive_read_open_filename(a, archive_path.c_str(), 10240) != ARCHIVE_OK) {
            const std::string why = archive_error_string(a) ? archive_error_string(a) : "unknown error";
            log::error("libarchive could not open file: " + why);
            return make_error(ErrorCode::ExtractionFailed, "Cannot open artifact " + archive_path.string() + ": " + why);
        }

        std::error_code ec;
        std::filesystem::create_directories(destination_path, ec);
        if (ec) {
            return make_error(ErrorCode::FileSystemError, "Cannot create " + destination_path.string() + ": " + ec.message());
        }
        const auto destination = destination_path.lexically_normal();

        const int flags = ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_TIME |
                          ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS;

        std::vector<std::filesystem::path> extracted;
        archive_entry* entry;
        int status;
        while ((status = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
            const std::filesystem::path current_file = std::filesystem::path(archive_entry_pathname(entry)).lexically_normal();
            if (current_file.empty() || current_file == ".") {
                continue;
            }

            // Reject entries that would land outside the staging directory.
            const auto full_dest_path = (destination / current_file).lexically_normal();
            if (current_file.is_absolute() || escapes(destination, full_dest_path)) {
                log::error("Archive contains malicious path: " + current_file.string());
                return make_error(ErrorCode::ExtractionFailed, "Archive entry escapes the staging directory: " + current_file.string());
            }

            archive_entry_set_pathname(entry, full_dest_path.c_str());
            // Hardlink targets are archive-relative too.
            if (const char* link = archive_entry_hardlink(entry)) {
                const auto full_link = (destination / std::filesystem::path(link).lexically_normal()).lexically_normal();
                if (escapes(destination, full_link)) {
                    return make_error(ErrorCode::ExtractionFailed, "Hardlink escapes the staging directory: " + std::string(link));
                }
                archive_entry_set_hardlink(entry, full_link.c_str());
            }

            if (archive_read_extract(a, entry, flags) != ARCHIVE_OK) {
                const std::string why = archive_error_string(a) ? archive_error_string(a) : "unknown error";
                log::error("libarchive failed to extract: " + why);
                return make_error(ErrorCode::ExtractionFailed, "Failed to extract " + current_file.string() + ": " + why);
            }
            extracted.push_back(current_file);
        }

        if (status != ARCHIVE_EOF) {
            const std::string why = archive_error_string(a) ? archive_error_string(a) : "unknown error";
            log::error("libarchive read error: " + why);
            return make_error(ErrorCode::ExtractionFailed, "Corrupt artifact " + archive_path.string() + ": " + why);
        }

        return extracted;
    }

    bool is_archive(const std::filesystem::path& path) {
        archive* a = archive_read_new();
        ArchiveReadGuard guard(a);
        archive_read_support_filter_all(a);
        archive_read_support_format_all(a);
        if (archive_read_open_filename(a, path.c_str(), 10240) != ARCHIVE_OK) {
            return false;
        }
        archive_entry* entry;
        return archive_read_next_header(a, &entry) == ARCHIVE_OK;
    }
}
