//
// Created by cv2 on 10/19/26.
//

#include "libqr/package_index.h"
#include "libqr/parser.h"
#include "libqr/logging.h"

#include <algorithm>

namespace qr {

    void PackageIndex::add(PackageInfo pkg) {
        auto& versions = m_packages[pkg.id];
        // A later definition of the same version replaces the earlier one in place.
        auto it = std::find_if(versions.begin(), versions.end(),
                               [&](const PackageInfo& p) { return p.version == pkg.version && p.slot == pkg.slot; });
        if (it != versions.end()) {
            *it = std::move(pkg);
        } else {
            versions.push_back(std::move(pkg));
        }
    }

    const std::vector<PackageInfo>* PackageIndex::find(const PackageId& id) const {
        auto it = m_packages.find(id);
        return it == m_packages.end() ? nullptr : &it->second;
    }

    std::optional<PackageInfo> PackageIndex::find_version(const PackageId& id, const Version& version) const {
        if (const auto* versions = find(id)) {
            for (const auto& pkg : *versions) {
                if (pkg.version == version) return pkg;
            }
        }
        return std::nullopt;
    }

    std::optional<PackageInfo> PackageIndex::latest(const PackageId& id) const {
        const auto* versions = find(id);
        if (!versions || versions->empty()) {
            return std::nullopt;
        }
        // max_element keeps the first of equal versions, so load order breaks ties.
        return *std::max_element(versions->begin(), versions->end(),
                                 [](const PackageInfo& a, const PackageInfo& b) { return a.version < b.version; });
    }

    std::optional<PackageInfo> PackageIndex::latest_in_slot(const PackageId& id, const std::string& slot) const {
        std::optional<PackageInfo> best;
        if (const auto* versions = find(id)) {
            for (const auto& pkg : *versions) {
                if (pkg.slot == slot && (!best || pkg.version > best->version)) {
                    best = pkg;
                }
            }
        }
        return best;
    }

    std::vector<PackageId> PackageIndex::find_by_name(const std::string& name) const {
        std::vector<PackageId> matches;
        for (const auto& [id, versions] : m_packages) {
            if (id.name == name) matches.push_back(id);
        }
        return matches;
    }

    std::vector<PackageId> PackageIndex::ids() const {
        std::vector<PackageId> out;
        out.reserve(m_packages.size());
        for (const auto& [id, versions] : m_packages) {
            out.push_back(id);
        }
        return out;
    }

    size_t PackageIndex::size() const {
        size_t total = 0;
        for (const auto& [id, versions] : m_packages) {
            total += versions.size();
        }
        return total;
    }

    Result<PackageIndex> PackageIndex::load(const std::vector<std::filesystem::path>& files) {
        PackageIndex index;
        for (const auto& file : files) {
            auto packages = Parser::parse_repository_index(file);
            if (!packages) {
                return std::unexpected(packages.error());
            }
            for (auto& pkg : *packages) {
                index.add(std::move(pkg));
            }
            log::debug("Loaded " + std::to_string(packages->size()) + " package versions from " + file.string());
        }
        return index;
    }

} // namespace qr
