//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace qr {

    // The available-package index: every published version of every package,
    // kept in load order per PackageId.
    class PackageIndex {
    public:
        void add(PackageInfo pkg);

        const std::vector<PackageInfo>* find(const PackageId& id) const;
        std::optional<PackageInfo> find_version(const PackageId& id, const Version& version) const;
        std::optional<PackageInfo> latest(const PackageId& id) const;
        std::optional<PackageInfo> latest_in_slot(const PackageId& id, const std::string& slot) const;

        // All ids whose name part equals `name`, e.g. "glibc" -> sys-libs/glibc.
        std::vector<PackageId> find_by_name(const std::string& name) const;

        std::vector<PackageId> ids() const;
        size_t size() const;
        bool empty() const { return m_packages.empty(); }

        // Loads and merges several repository index files.
        static Result<PackageIndex> load(const std::vector<std::filesystem::path>& files);

    private:
        std::map<PackageId, std::vector<PackageInfo>> m_packages;
    };

} // namespace qr
