//
// Created by cv2 on 10/19/26.
//
#include "libqr/crypto.h"
#include "libqr/logging.h"

#include <picosha2.h>
#include <fstream>
#include <iterator>

namespace qr {

    Result<std::string> hash_file(const std::filesystem::path& file_path) {
        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            return make_error(ErrorCode::FileSystemError, "Cannot open " + file_path.string() + " for hashing");
        }

        // istreambuf iterators, not the stream itself, so picosha2 picks the iterator overload
        return picosha2::hash256_hex_string(
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        );
    }

    bool verify_file_checksum(const std::filesystem::path& file_path, const std::string& expected_checksum) {
        auto computed_hash = hash_file(file_path);
        if (!computed_hash) {
            log::error("Cannot verify checksum: " + computed_hash.error().message);
            return false;
        }

        if (*computed_hash != expected_checksum) {
            log::debug("Checksum mismatch for: " + file_path.string());
            log::debug("  Expected: " + expected_checksum);
            log::debug("  Computed: " + *computed_hash);
            return false;
        }
        return true;
    }

} // namespace qr
