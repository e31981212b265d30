//
// Created by cv2 on 10/19/26.
//

#include "libqr/circular.h"
#include "libqr/logging.h"

#include <algorithm>
#include <limits>
#include <set>

namespace qr {

    static std::string join_ids(const std::vector<PackageId>& ids, const std::string& sep) {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) out += sep;
            out += id.full_name();
        }
        return out;
    }

    bool is_bootstrap_package(const PackageId& id) {
        static const std::set<PackageId> bootstrap{
            {"sys-libs", "glibc"},
            {"sys-devel", "gcc"},
            {"sys-devel", "binutils"},
            {"dev-lang", "python"},
            {"dev-lang", "perl"},
            {"dev-lang", "rust"},
            {"dev-lang", "go"},
        };
        return bootstrap.contains(id);
    }

    std::string CycleBreakStrategy::describe() const {
        switch (kind) {
            case Kind::DisableUseFlag:
                return "disable USE flag '" + flag + "' on " + package.full_name();
            case Kind::MultiPassBuild:
                return "build in two passes: first " + join_ids(first_pass, ", ") + ", then " +
                       join_ids(second_pass, ", ");
            case Kind::UseBootstrap:
                return "build a bootstrap variant of " + package.full_name() + " first";
            case Kind::ManualIntervention:
                return reason;
        }
        return "";
    }

    std::string CircularDependency::describe() const {
        return "Circular dependency between " + join_ids(packages, ", ") +
               (breakable ? " (break: " : " (") + strategy.describe() + ")";
    }

    void CircularDetector::clear() {
        m_nodes.clear();
        m_index.clear();
        m_edges.clear();
        m_out.clear();
    }

    std::optional<size_t> CircularDetector::index_of(const PackageId& id) const {
        auto it = m_index.find(id);
        if (it == m_index.end()) return std::nullopt;
        return it->second;
    }

    void CircularDetector::add_edges(size_t dependent, const std::vector<Dependency>& deps, bool force_build_only,
                                     const UseFlagSet* enabled) {
        for (const auto& dep : deps) {
            auto from = index_of(dep.package);
            if (!from || *from == dependent) continue;
            if (enabled && !dep.is_active(*enabled)) continue;

            Edge edge{*from, dependent, dep.use_condition.is_conditional(),
                      force_build_only || (dep.build_time && !dep.run_time), std::nullopt};
            if (dep.use_condition.kind == UseCondition::Kind::IfEnabled) {
                edge.use_flag = dep.use_condition.flag;
            }
            m_out[*from].push_back(m_edges.size());
            m_edges.push_back(std::move(edge));
        }
    }

    void CircularDetector::build_graph(const std::vector<PackageInfo>& packages) {
        build_graph(packages, {});
    }

    void CircularDetector::build_graph(const std::vector<PackageInfo>& packages,
                                       const std::map<PackageId, UseFlagSet>& use_flags) {
        clear();
        for (const auto& pkg : packages) {
            if (m_index.contains(pkg.id)) continue;
            m_index.emplace(pkg.id, m_nodes.size());
            m_nodes.push_back(pkg.id);
        }
        m_out.resize(m_nodes.size());

        for (const auto& pkg : packages) {
            const size_t node = m_index.at(pkg.id);
            auto flags = use_flags.find(pkg.id);
            const UseFlagSet* enabled = flags == use_flags.end() ? nullptr : &flags->second;
            add_edges(node, pkg.dependencies, false, enabled);
            add_edges(node, pkg.build_dependencies, true, enabled);
        }
        log::debug("Dependency graph: " + std::to_string(m_nodes.size()) + " nodes, " +
                   std::to_string(m_edges.size()) + " edges");
    }

    void CircularDetector::add_ordering_constraint(const PackageId& before, const PackageId& after) {
        auto from = index_of(before);
        auto to = index_of(after);
        if (!from || !to || *from == *to) return;
        m_out[*from].push_back(m_edges.size());
        m_edges.push_back(Edge{*from, *to, false, false, std::nullopt});
    }

    // Iterative Tarjan; components come out in reverse topological order.
    std::vector<std::vector<size_t>> CircularDetector::strongly_connected() const {
        constexpr size_t unvisited = std::numeric_limits<size_t>::max();
        const size_t n = m_nodes.size();

        std::vector<size_t> index(n, unvisited);
        std::vector<size_t> lowlink(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<size_t> stack;
        std::vector<std::vector<size_t>> components;
        size_t counter = 0;

        struct Frame {
            size_t node;
            size_t next_edge;
        };

        for (size_t root = 0; root < n; ++root) {
            if (index[root] != unvisited) continue;

            std::vector<Frame> calls{{root, 0}};
            index[root] = lowlink[root] = counter++;
            stack.push_back(root);
            on_stack[root] = true;

            while (!calls.empty()) {
                const size_t v = calls.back().node;
                const auto& out = m_out[v];

                if (calls.back().next_edge < out.size()) {
                    const size_t w = m_edges[out[calls.back().next_edge++]].to;
                    if (index[w] == unvisited) {
                        index[w] = lowlink[w] = counter++;
                        stack.push_back(w);
                        on_stack[w] = true;
                        calls.push_back({w, 0});
                    } else if (on_stack[w]) {
                        lowlink[v] = std::min(lowlink[v], index[w]);
                    }
                    continue;
                }

                if (lowlink[v] == index[v]) {
                    std::vector<size_t> component;
                    size_t w;
                    do {
                        w = stack.back();
                        stack.pop_back();
                        on_stack[w] = false;
                        component.push_back(w);
                    } while (w != v);
                    components.push_back(std::move(component));
                }

                calls.pop_back();
                if (!calls.empty()) {
                    const size_t parent = calls.back().node;
                    lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
                }
            }
        }
        return components;
    }

    // Kahn's algorithm restricted to the nodes in `in_set`, ignoring removed
    // edges. The lowest ready index is taken first so the order is stable.
    std::vector<size_t> CircularDetector::topo_order(const std::vector<bool>& in_set,
                                                     const std::vector<bool>& removed) const {
        std::vector<size_t> indegree(m_nodes.size(), 0);
        for (size_t e = 0; e < m_edges.size(); ++e) {
            const auto& edge = m_edges[e];
            if (!removed[e] && in_set[edge.from] && in_set[edge.to]) {
                ++indegree[edge.to];
            }
        }

        std::set<size_t> ready;
        for (size_t v = 0; v < m_nodes.size(); ++v) {
            if (in_set[v] && indegree[v] == 0) ready.insert(v);
        }

        std::vector<size_t> order;
        while (!ready.empty()) {
            const size_t v = *ready.begin();
            ready.erase(ready.begin());
            order.push_back(v);
            for (size_t e : m_out[v]) {
                const auto& edge = m_edges[e];
                if (removed[e] || !in_set[edge.to]) continue;
                if (--indegree[edge.to] == 0) ready.insert(edge.to);
            }
        }
        return order;
    }

    CircularDependency CircularDetector::analyze(const std::vector<size_t>& members) const {
        std::vector<bool> in_cycle(m_nodes.size(), false);
        for (size_t v : members) in_cycle[v] = true;

        CircularDependency cycle;
        for (size_t v : members) cycle.packages.push_back(m_nodes[v]);
        std::sort(cycle.packages.begin(), cycle.packages.end());

        std::vector<size_t> cycle_edges;
        for (size_t e = 0; e < m_edges.size(); ++e) {
            const auto& edge = m_edges[e];
            if (in_cycle[edge.from] && in_cycle[edge.to]) {
                cycle_edges.push_back(e);
                cycle.edges.push_back({m_nodes[edge.from], m_nodes[edge.to], edge.conditional, edge.build_only,
                                       edge.use_flag});
            }
        }

        // (a) disabling one flag on one dependent severs all of its edges gated by
        // that flag; it only counts if the component is acyclic afterwards
        for (size_t e : cycle_edges) {
            const auto& edge = m_edges[e];
            if (!edge.conditional || !edge.use_flag) continue;

            std::vector<bool> removed(m_edges.size(), false);
            for (size_t other : cycle_edges) {
                if (m_edges[other].to == edge.to && m_edges[other].use_flag == edge.use_flag) removed[other] = true;
            }
            if (topo_order(in_cycle, removed).size() == members.size()) {
                cycle.breakable = true;
                cycle.strategy.kind = CycleBreakStrategy::Kind::DisableUseFlag;
                cycle.strategy.package = m_nodes[edge.to];
                cycle.strategy.flag = *edge.use_flag;
                return cycle;
            }
        }

        // (b) build-only edges can be satisfied by a second pass, provided the
        // remaining run-time edges are acyclic on their own
        const bool has_build_only = std::any_of(cycle_edges.begin(), cycle_edges.end(),
                                                [&](size_t e) { return m_edges[e].build_only; });
        if (has_build_only) {
            std::vector<bool> removed(m_edges.size(), false);
            for (size_t e : cycle_edges) {
                if (m_edges[e].build_only) removed[e] = true;
            }

            // First pass: packages built before their build-only dependency in the cycle exists.
            std::vector<bool> deferred(m_nodes.size(), false);
            for (size_t e : cycle_edges) {
                if (m_edges[e].build_only) deferred[m_edges[e].to] = true;
            }
            std::vector<PackageId> first_pass;
            std::vector<PackageId> second_pass;
            for (size_t v : members) {
                (deferred[v] ? first_pass : second_pass).push_back(m_nodes[v]);
            }

            if (topo_order(in_cycle, removed).size() == members.size()) {
                // Every member was built early: all of them are rebuilt.
                if (second_pass.empty()) second_pass = first_pass;
                std::sort(first_pass.begin(), first_pass.end());
                std::sort(second_pass.begin(), second_pass.end());
                cycle.breakable = true;
                cycle.strategy.kind = CycleBreakStrategy::Kind::MultiPassBuild;
                cycle.strategy.first_pass = std::move(first_pass);
                cycle.strategy.second_pass = std::move(second_pass);
                return cycle;
            }
        }

        // (c) a toolchain or core runtime can be bootstrapped ahead of the cycle
        for (const auto& id : cycle.packages) {
            if (is_bootstrap_package(id)) {
                cycle.breakable = true;
                cycle.strategy.kind = CycleBreakStrategy::Kind::UseBootstrap;
                cycle.strategy.package = id;
                return cycle;
            }
        }

        cycle.breakable = false;
        cycle.strategy.kind = CycleBreakStrategy::Kind::ManualIntervention;
        cycle.strategy.reason = "circular dependency between " + std::to_string(members.size()) +
                                " packages requires manual intervention";
        return cycle;
    }

    std::vector<CircularDependency> CircularDetector::detect_cycles() const {
        std::vector<CircularDependency> cycles;
        for (const auto& component : strongly_connected()) {
            if (component.size() > 1) {
                cycles.push_back(analyze(component));
                log::debug(cycles.back().describe());
            }
        }
        std::sort(cycles.begin(), cycles.end(), [](const CircularDependency& a, const CircularDependency& b) {
            return a.packages < b.packages;
        });
        return cycles;
    }

    bool CircularDetector::has_cycles() const {
        const auto components = strongly_connected();
        return std::any_of(components.begin(), components.end(), [](const auto& c) { return c.size() > 1; });
    }

    std::vector<std::vector<PackageId>> CircularDetector::get_sccs() const {
        std::vector<std::vector<PackageId>> out;
        for (const auto& component : strongly_connected()) {
            std::vector<PackageId> ids;
            for (size_t v : component) ids.push_back(m_nodes[v]);
            std::sort(ids.begin(), ids.end());
            out.push_back(std::move(ids));
        }
        return out;
    }

    Result<std::vector<PackageId>>
    CircularDetector::break_cycles_and_order(const std::vector<CircularDependency>& cycles) const {
        std::vector<bool> removed(m_edges.size(), false);
        std::set<PackageId> bootstrap;

        for (const auto& cycle : cycles) {
            if (!cycle.breakable) {
                log::error("Unbreakable circular dependency: " + join_ids(cycle.packages, " <-> "));
                std::vector<std::string> names;
                for (const auto& id : cycle.packages) names.push_back(id.full_name());
                return std::unexpected(Error(ErrorCode::CircularDependency,
                                             "Unbreakable circular dependency between " +
                                             join_ids(cycle.packages, ", "), std::move(names)));
            }

            std::set<size_t> members;
            for (const auto& id : cycle.packages) {
                if (auto v = index_of(id)) members.insert(*v);
            }

            const auto& strategy = cycle.strategy;
            for (size_t e = 0; e < m_edges.size(); ++e) {
                const auto& edge = m_edges[e];
                const bool internal = members.contains(edge.from) && members.contains(edge.to);
                switch (strategy.kind) {
                    case CycleBreakStrategy::Kind::DisableUseFlag:
                        if (m_nodes[edge.to] == strategy.package && edge.use_flag == strategy.flag) removed[e] = true;
                        break;
                    case CycleBreakStrategy::Kind::MultiPassBuild:
                        if (internal && edge.build_only) removed[e] = true;
                        break;
                    case CycleBreakStrategy::Kind::UseBootstrap:
                        if (internal && m_nodes[edge.to] == strategy.package) removed[e] = true;
                        break;
                    case CycleBreakStrategy::Kind::ManualIntervention:
                        break;
                }
            }
            if (strategy.kind == CycleBreakStrategy::Kind::UseBootstrap) {
                bootstrap.insert(strategy.package);
            }
        }

        const std::vector<bool> all(m_nodes.size(), true);
        const auto order = topo_order(all, removed);
        if (order.size() != m_nodes.size()) {
            std::vector<bool> placed(m_nodes.size(), false);
            for (size_t v : order) placed[v] = true;
            std::vector<std::string> leftover;
            for (size_t v = 0; v < m_nodes.size(); ++v) {
                if (!placed[v]) leftover.push_back(m_nodes[v].full_name());
            }
            return std::unexpected(Error(ErrorCode::CircularDependency, "Could not break all cycles",
                                         std::move(leftover)));
        }

        std::vector<PackageId> result;
        result.reserve(order.size());
        for (size_t v : order) result.push_back(m_nodes[v]);
        std::stable_partition(result.begin(), result.end(),
                              [&](const PackageId& id) { return bootstrap.contains(id); });
        return result;
    }

    std::vector<CircularDependency> CircularDetector::find_cycles(const std::vector<PackageInfo>& packages) {
        CircularDetector detector;
        detector.build_graph(packages);
        return detector.detect_cycles();
    }

} // namespace qr
