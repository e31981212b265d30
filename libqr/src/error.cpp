//
// Created by cv2 on 10/19/26.
//

#include "libqr/error.h"

namespace qr {

    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::ResolutionFailed: return "ResolutionFailed";
            case ErrorCode::CircularDependency: return "CircularDependency";
            case ErrorCode::SlotConflict: return "SlotConflict";
            case ErrorCode::VersionConflict: return "VersionConflict";
            case ErrorCode::InvalidBlocker: return "InvalidBlocker";
            case ErrorCode::PackageNotFound: return "PackageNotFound";
            case ErrorCode::PackageNotInstalled: return "PackageNotInstalled";
            case ErrorCode::AmbiguousPackage: return "AmbiguousPackage";
            case ErrorCode::HasDependents: return "HasDependents";
            case ErrorCode::InvalidVersion: return "InvalidVersion";
            case ErrorCode::InvalidAtom: return "InvalidAtom";
            case ErrorCode::ParseError: return "ParseError";
            case ErrorCode::ConfigError: return "ConfigError";
            case ErrorCode::BuildFailed: return "BuildFailed";
            case ErrorCode::FileCollision: return "FileCollision";
            case ErrorCode::ExtractionFailed: return "ExtractionFailed";
            case ErrorCode::TransactionFailed: return "TransactionFailed";
            case ErrorCode::TransactionRolledBack: return "TransactionRolledBack";
            case ErrorCode::DatabaseError: return "DatabaseError";
            case ErrorCode::FileSystemError: return "FileSystemError";
        }
        return "Unknown";
    }

} // namespace qr
