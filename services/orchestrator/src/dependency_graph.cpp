#include "../include/dependency_graph.hpp"
#include <algorithm>
#include <deque>

DependencyGraph::DependencyGraph(std::vector<RoleNode> nodes) : nodes_(std::move(nodes)) {
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const auto& role = nodes_[i].role;
        if (role.empty()) throw ConfigurationError("role name must not be empty");
        if (!index_.emplace(role, i).second) throw ConfigurationError("duplicate role: " + role);
        roles_.push_back(role);
    }

    dependents_.assign(nodes_.size(), {});
    std::vector<int> in_degree(nodes_.size(), 0);
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        std::set<std::string> seen;
        for (const auto& p : nodes_[i].prerequisites) {
            auto it = index_.find(p.role);
            if (it == index_.end()) {
                throw ConfigurationError("role " + nodes_[i].role + " depends on unknown role " + p.role);
            }
            if (it->second == i) throw ConfigurationError("role " + p.role + " depends on itself");
            if (!seen.insert(p.role).second) {
                throw ConfigurationError("role " + nodes_[i].role + " lists prerequisite " + p.role + " twice");
            }
            dependents_[it->second].push_back(i);
            ++in_degree[i];
        }
    }

    // Kahn, seeded in declaration order so the result is deterministic.
    std::deque<std::size_t> q;
    for (std::size_t i = 0; i < nodes_.size(); ++i) if (in_degree[i] == 0) q.push_back(i);
    while (!q.empty()) {
        std::size_t n = q.front();
        q.pop_front();
        topo_.push_back(n);
        for (std::size_t d : dependents_[n]) {
            if (--in_degree[d] == 0) q.push_back(d);
        }
    }
    if (topo_.size() != nodes_.size()) {
        std::string cyclic;
        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            if (in_degree[i] > 0) cyclic += (cyclic.empty() ? "" : ", ") + nodes_[i].role;
        }
        throw ConfigurationError("dependency cycle among roles: " + cyclic);
    }
}

bool DependencyGraph::contains(const std::string& role) const {
    return index_.count(role) > 0;
}

std::size_t DependencyGraph::index_of(const std::string& role) const {
    auto it = index_.find(role);
    if (it == index_.end()) throw ConfigurationError("unknown role: " + role);
    return it->second;
}

const std::vector<Prerequisite>& DependencyGraph::prerequisites(const std::string& role) const {
    return nodes_[index_of(role)].prerequisites;
}

std::vector<std::string> DependencyGraph::dependents(const std::string& role) const {
    std::vector<std::string> out;
    for (std::size_t d : dependents_[index_of(role)]) out.push_back(roles_[d]);
    return out;
}

TaskState DependencyGraph::state_of(const StateMap& states, const std::string& role) {
    auto it = states.find(role);
    return it == states.end() ? TaskState::Waiting : it->second;
}

std::vector<std::string> DependencyGraph::ready_set(const StateMap& states) const {
    std::vector<std::string> out;
    for (const auto& node : nodes_) {
        if (state_of(states, node.role) != TaskState::Waiting) continue;
        bool all_terminal = std::all_of(node.prerequisites.begin(), node.prerequisites.end(),
                                        [&](const Prerequisite& p){ return is_terminal(state_of(states, p.role)); });
        if (all_terminal) out.push_back(node.role);
    }
    return out;
}

std::vector<std::string> DependencyGraph::unmet_mandatory(const std::string& role, const StateMap& states) const {
    std::vector<std::string> out;
    for (const auto& p : prerequisites(role)) {
        if (p.optional) continue;
        TaskState s = state_of(states, p.role);
        if (s == TaskState::Failed || s == TaskState::Skipped) out.push_back(p.role);
    }
    return out;
}

std::vector<OmittedInput> DependencyGraph::omitted_optional(const std::string& role, const StateMap& states) const {
    std::vector<OmittedInput> out;
    for (const auto& p : prerequisites(role)) {
        if (!p.optional) continue;
        TaskState s = state_of(states, p.role);
        if (s == TaskState::Failed || s == TaskState::Skipped) {
            out.push_back({p.role, s, std::string("optional prerequisite ") + to_string(s)});
        }
    }
    return out;
}

int DependencyGraph::pending_dependents(const std::string& role, const StateMap& states) const {
    int n = 0;
    for (std::size_t d : dependents_[index_of(role)]) {
        if (state_of(states, roles_[d]) == TaskState::Waiting) ++n;
    }
    return n;
}

std::vector<std::string> DependencyGraph::closure(const std::set<std::string>& selected) const {
    std::vector<bool> keep(nodes_.size(), false);
    std::vector<std::size_t> stack;
    for (const auto& r : selected) stack.push_back(index_of(r));
    while (!stack.empty()) {
        std::size_t i = stack.back();
        stack.pop_back();
        if (keep[i]) continue;
        keep[i] = true;
        for (const auto& p : nodes_[i].prerequisites) stack.push_back(index_.at(p.role));
    }
    std::vector<std::string> out;
    for (std::size_t i = 0; i < nodes_.size(); ++i) if (keep[i]) out.push_back(roles_[i]);
    return out;
}

DependencyGraph DependencyGraph::subgraph(const std::vector<std::string>& roles) const {
    std::set<std::string> wanted(roles.begin(), roles.end());
    std::vector<RoleNode> nodes;
    for (const auto& node : nodes_) {
        if (wanted.count(node.role)) nodes.push_back(node);
    }
    return DependencyGraph(std::move(nodes));
}

std::vector<std::string> DependencyGraph::topological_order() const {
    std::vector<std::string> out;
    out.reserve(topo_.size());
    for (std::size_t i : topo_) out.push_back(roles_[i]);
    return out;
}
