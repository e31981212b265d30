//
// Created by cv2 on 10/19/26.
//

#include "libqr/version.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace qr {

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    static std::optional<uint64_t> parse_number(std::string_view s) {
        if (s.empty() || (s.size() > 1 && s[0] == '0')) {
            return std::nullopt;
        }
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    static bool valid_identifiers(std::string_view s) {
        if (s.empty()) return false;
        size_t start = 0;
        while (true) {
            size_t dot = s.find('.', start);
            auto ident = s.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
            if (ident.empty()) return false;
            for (char c : ident) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
            }
            if (dot == std::string_view::npos) return true;
            start = dot + 1;
        }
    }

    static std::vector<std::string_view> split_dots(std::string_view s) {
        std::vector<std::string_view> parts;
        size_t start = 0;
        while (true) {
            size_t dot = s.find('.', start);
            if (dot == std::string_view::npos) {
                parts.push_back(s.substr(start));
                return parts;
            }
            parts.push_back(s.substr(start, dot - start));
            start = dot + 1;
        }
    }

    Result<Version> Version::parse(std::string_view text) {
        text = trim(text);
        if (!text.empty() && text.front() == 'v') {
            text.remove_prefix(1);
        }

        Version v;
        auto plus = text.find('+');
        if (plus != std::string_view::npos) {
            auto build = text.substr(plus + 1);
            if (!valid_identifiers(build)) {
                return make_error(ErrorCode::InvalidVersion, "Invalid build metadata in version '" + std::string(text) + "'");
            }
            v.build = std::string(build);
            text = text.substr(0, plus);
        }
        auto dash = text.find('-');
        if (dash != std::string_view::npos) {
            auto pre = text.substr(dash + 1);
            if (!valid_identifiers(pre)) {
                return make_error(ErrorCode::InvalidVersion, "Invalid pre-release in version '" + std::string(text) + "'");
            }
            v.pre = std::string(pre);
            text = text.substr(0, dash);
        }

        auto core = split_dots(text);
        if (core.size() != 3) {
            return make_error(ErrorCode::InvalidVersion, "Version '" + std::string(text) + "' is not MAJOR.MINOR.PATCH");
        }
        auto major = parse_number(core[0]);
        auto minor = parse_number(core[1]);
        auto patch = parse_number(core[2]);
        if (!major || !minor || !patch) {
            return make_error(ErrorCode::InvalidVersion, "Invalid numeric component in version '" + std::string(text) + "'");
        }
        v.major = *major;
        v.minor = *minor;
        v.patch = *patch;
        return v;
    }

    Result<Version> Version::parse_lenient(std::string_view text) {
        text = trim(text);
        std::string_view core = text;
        std::string_view suffix;
        auto cut = text.find_first_of("-+");
        if (cut != std::string_view::npos) {
            core = text.substr(0, cut);
            suffix = text.substr(cut);
        }
        auto dots = std::count(core.begin(), core.end(), '.');
        std::string padded(core);
        for (auto i = dots; i < 2; ++i) {
            padded += ".0";
        }
        padded += suffix;
        return parse(padded);
    }

    std::string Version::to_string() const {
        std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
        if (!pre.empty()) out += "-" + pre;
        if (!build.empty()) out += "+" + build;
        return out;
    }

    // Pre-release precedence: numeric identifiers compare numerically and sort
    // below alphanumeric ones; a shorter identifier list sorts first.
    static std::strong_ordering compare_prerelease(const std::string& a, const std::string& b) {
        if (a == b) return std::strong_ordering::equal;
        if (a.empty()) return std::strong_ordering::greater;
        if (b.empty()) return std::strong_ordering::less;

        auto left = split_dots(a);
        auto right = split_dots(b);
        for (size_t i = 0; i < std::min(left.size(), right.size()); ++i) {
            auto ln = parse_number(left[i]);
            auto rn = parse_number(right[i]);
            if (ln && rn) {
                if (*ln != *rn) return *ln <=> *rn;
            } else if (ln) {
                return std::strong_ordering::less;
            } else if (rn) {
                return std::strong_ordering::greater;
            } else if (auto c = left[i].compare(right[i]); c != 0) {
                return c < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
        }
        return left.size() <=> right.size();
    }

    std::strong_ordering Version::operator<=>(const Version& other) const {
        if (auto c = major <=> other.major; c != 0) return c;
        if (auto c = minor <=> other.minor; c != 0) return c;
        if (auto c = patch <=> other.patch; c != 0) return c;
        return compare_prerelease(pre, other.pre);
    }

    bool Version::operator==(const Version& other) const {
        return (*this <=> other) == 0;
    }

    // --- VersionSpec ---

    VersionSpec VersionSpec::any() { return {}; }

    VersionSpec VersionSpec::exact(Version v) {
        VersionSpec s;
        s.kind = Kind::Exact;
        s.version = std::move(v);
        return s;
    }

    VersionSpec VersionSpec::greater_than(Version v) {
        VersionSpec s;
        s.kind = Kind::GreaterThan;
        s.version = std::move(v);
        return s;
    }

    VersionSpec VersionSpec::greater_or_equal(Version v) {
        VersionSpec s;
        s.kind = Kind::GreaterThanOrEqual;
        s.version = std::move(v);
        return s;
    }

    VersionSpec VersionSpec::less_than(Version v) {
        VersionSpec s;
        s.kind = Kind::LessThan;
        s.version = std::move(v);
        return s;
    }

    VersionSpec VersionSpec::less_or_equal(Version v) {
        VersionSpec s;
        s.kind = Kind::LessThanOrEqual;
        s.version = std::move(v);
        return s;
    }

    VersionSpec VersionSpec::range(std::optional<Version> lo, std::optional<Version> hi) {
        VersionSpec s;
        s.kind = Kind::Range;
        s.min = std::move(lo);
        s.max = std::move(hi);
        return s;
    }

    bool VersionSpec::matches(const Version& v) const {
        switch (kind) {
            case Kind::Any: return true;
            case Kind::Exact: return v == version;
            case Kind::GreaterThan: return v > version;
            case Kind::GreaterThanOrEqual: return v >= version;
            case Kind::LessThan: return v < version;
            case Kind::LessThanOrEqual: return v <= version;
            case Kind::Range:
                if (min && v < *min) return false;
                if (max && v > *max) return false;
                return true;
        }
        return false;
    }

    bool VersionSpec::is_any() const {
        return kind == Kind::Any || (kind == Kind::Range && !min && !max);
    }

    std::string VersionSpec::to_string() const {
        switch (kind) {
            case Kind::Any: return "*";
            case Kind::Exact: return "=" + version.to_string();
            case Kind::GreaterThan: return ">" + version.to_string();
            case Kind::GreaterThanOrEqual: return ">=" + version.to_string();
            case Kind::LessThan: return "<" + version.to_string();
            case Kind::LessThanOrEqual: return "<=" + version.to_string();
            case Kind::Range:
                if (min && max) return ">=" + min->to_string() + ", <=" + max->to_string();
                if (min) return ">=" + min->to_string();
                if (max) return "<=" + max->to_string();
                return "*";
        }
        return "*";
    }

    static Result<VersionSpec> parse_single_bound(std::string_view text) {
        text = trim(text);
        if (text.empty() || text == "*") {
            return VersionSpec::any();
        }

        struct OpEntry { std::string_view op; VersionSpec::Kind kind; };
        static constexpr OpEntry ops[] = {
            {">=", VersionSpec::Kind::GreaterThanOrEqual},
            {"<=", VersionSpec::Kind::LessThanOrEqual},
            {">", VersionSpec::Kind::GreaterThan},
            {"<", VersionSpec::Kind::LessThan},
            {"=", VersionSpec::Kind::Exact},
        };

        VersionSpec spec;
        spec.kind = VersionSpec::Kind::Exact;
        for (const auto& entry : ops) {
            if (text.starts_with(entry.op)) {
                spec.kind = entry.kind;
                text.remove_prefix(entry.op.size());
                break;
            }
        }

        auto version = Version::parse_lenient(text);
        if (!version) {
            return std::unexpected(version.error());
        }
        spec.version = *version;
        return spec;
    }

    Result<VersionSpec> VersionSpec::parse(std::string_view text) {
        auto comma = text.find(',');
        if (comma == std::string_view::npos) {
            return parse_single_bound(text);
        }

        auto lower = parse_single_bound(text.substr(0, comma));
        if (!lower) return lower;
        auto upper = parse_single_bound(text.substr(comma + 1));
        if (!upper) return upper;

        if (lower->kind != Kind::GreaterThanOrEqual || upper->kind != Kind::LessThanOrEqual) {
            return make_error(ErrorCode::InvalidVersion,
                              "Version range '" + std::string(text) + "' must be of the form '>=A, <=B'");
        }
        return range(lower->version, upper->version);
    }

} // namespace qr
