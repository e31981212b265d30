//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qr {

    enum class ErrorCode {
        // Resolution
        ResolutionFailed,
        CircularDependency,
        SlotConflict,
        VersionConflict,
        InvalidBlocker,
        PackageNotFound,
        PackageNotInstalled,
        AmbiguousPackage,
        HasDependents,
        // Input
        InvalidVersion,
        InvalidAtom,
        ParseError,
        ConfigError,
        // Execution
        BuildFailed,
        FileCollision,
        ExtractionFailed,
        TransactionFailed,
        TransactionRolledBack,
        DatabaseError,
        FileSystemError
    };

    const char* to_string(ErrorCode code);

    struct Error {
        ErrorCode code;
        std::string message;
        // Cycle members for CircularDependency, dependents for HasDependents.
        std::vector<std::string> packages;
        // Set on TransactionRolledBack: what made the transaction fail.
        std::optional<ErrorCode> cause;

        Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
        Error(ErrorCode c, std::string msg, std::vector<std::string> pkgs)
            : code(c), message(std::move(msg)), packages(std::move(pkgs)) {}
    };

    template<typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
        return std::unexpected(Error(code, std::move(message)));
    }

    // Raised inside the transaction engine and caught at its boundary,
    // where it triggers the rollback.
    class TransactionException : public std::runtime_error {
    public:
        TransactionException(ErrorCode error, const std::string& what_arg)
            : std::runtime_error(what_arg), m_error(error) {}

        ErrorCode get_error() const {
            return m_error;
        }

    private:
        ErrorCode m_error;
    };

} // namespace qr
