//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qr {

    struct CycleEdge {
        PackageId from;   // the dependency
        PackageId to;     // the dependent
        bool conditional = false;
        bool build_only = false;
        std::optional<std::string> use_flag;   // set when the edge exists only with this flag enabled
    };

    struct CycleBreakStrategy {
        enum class Kind { DisableUseFlag, MultiPassBuild, UseBootstrap, ManualIntervention };

        Kind kind = Kind::ManualIntervention;
        PackageId package;                    // DisableUseFlag, UseBootstrap
        std::string flag;                     // DisableUseFlag
        std::vector<PackageId> first_pass;    // MultiPassBuild
        std::vector<PackageId> second_pass;   // MultiPassBuild
        std::string reason;                   // ManualIntervention

        std::string describe() const;
    };

    struct CircularDependency {
        std::vector<PackageId> packages;   // sorted
        std::vector<CycleEdge> edges;      // edges between members
        bool breakable = false;
        CycleBreakStrategy strategy;

        std::string describe() const;
    };

    bool is_bootstrap_package(const PackageId& id);

    // Dependency graph over a package set. Nodes are stored in an arena and
    // edges refer to them by index; an edge runs from a dependency to its dependent.
    class CircularDetector {
    public:
        // Edges come from `dependencies` and `build_dependencies`; dependencies on
        // packages outside the set are ignored.
        void build_graph(const std::vector<PackageInfo>& packages);

        // As above, skipping edges that are inactive under the package's USE flags.
        // Packages without an entry keep all their edges.
        void build_graph(const std::vector<PackageInfo>& packages,
                         const std::map<PackageId, UseFlagSet>& use_flags);

        // Forces `before` ahead of `after` in the build order.
        void add_ordering_constraint(const PackageId& before, const PackageId& after);

        std::vector<CircularDependency> detect_cycles() const;
        bool has_cycles() const;
        std::vector<std::vector<PackageId>> get_sccs() const;

        // Removes the edges each cycle's strategy severs and returns a
        // topological order with bootstrap packages first.
        Result<std::vector<PackageId>> break_cycles_and_order(const std::vector<CircularDependency>& cycles) const;

        const std::vector<PackageId>& nodes() const { return m_nodes; }
        size_t edge_count() const { return m_edges.size(); }

        static std::vector<CircularDependency> find_cycles(const std::vector<PackageInfo>& packages);

    private:
        struct Edge {
            size_t from;
            size_t to;
            bool conditional;
            bool build_only;
            std::optional<std::string> use_flag;
        };

        void clear();
        void add_edges(size_t dependent, const std::vector<Dependency>& deps, bool force_build_only,
                       const UseFlagSet* enabled);
        std::optional<size_t> index_of(const PackageId& id) const;
        std::vector<std::vector<size_t>> strongly_connected() const;
        CircularDependency analyze(const std::vector<size_t>& members) const;
        std::vector<size_t> topo_order(const std::vector<bool>& in_set, const std::vector<bool>& removed) const;

        std::vector<PackageId> m_nodes;
        std::map<PackageId, size_t> m_index;
        std::vector<Edge> m_edges;
        std::vector<std::vector<size_t>> m_out;   // node -> outgoing edge indices
    };

} // namespace qr
