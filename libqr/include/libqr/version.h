//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qr {

    // Semantic version. Build metadata is kept for display but ignored for precedence.
    struct Version {
        uint64_t major = 0;
        uint64_t minor = 0;
        uint64_t patch = 0;
        std::string pre;
        std::string build;

        // Strict MAJOR.MINOR.PATCH[-pre][+build].
        static Result<Version> parse(std::string_view text);

        // Accepts "2", "2.39" and pads the missing components with zero.
        static Result<Version> parse_lenient(std::string_view text);

        std::string to_string() const;

        std::strong_ordering operator<=>(const Version& other) const;
        bool operator==(const Version& other) const;
    };

    // A predicate over versions.
    struct VersionSpec {
        enum class Kind {
            Any,
            Exact,
            GreaterThan,
            GreaterThanOrEqual,
            LessThan,
            LessThanOrEqual,
            Range
        };

        Kind kind = Kind::Any;
        Version version;               // operand for the single-bound kinds
        std::optional<Version> min;    // Range, inclusive
        std::optional<Version> max;    // Range, inclusive

        static VersionSpec any();
        static VersionSpec exact(Version v);
        static VersionSpec greater_than(Version v);
        static VersionSpec greater_or_equal(Version v);
        static VersionSpec less_than(Version v);
        static VersionSpec less_or_equal(Version v);
        static VersionSpec range(std::optional<Version> lo, std::optional<Version> hi);

        // "", "*", "V", "=V", ">V", ">=V", "<V", "<=V", ">=A, <=B"
        static Result<VersionSpec> parse(std::string_view text);

        bool matches(const Version& v) const;
        bool is_any() const;
        std::string to_string() const;

        bool operator==(const VersionSpec& other) const = default;
    };

} // namespace qr
