#pragma once
#include "run_types.hpp"
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

struct RoleNode {
    std::string role;
    std::vector<Prerequisite> prerequisites;
};

// Roles missing from the map count as waiting.
using StateMap = std::unordered_map<std::string, TaskState>;

// Static role -> prerequisites declaration. Validated on construction:
// names unique and non-empty, prerequisites known, no cycles.
class DependencyGraph {
public:
    explicit DependencyGraph(std::vector<RoleNode> nodes);

    std::size_t size() const { return nodes_.size(); }
    const std::vector<std::string>& roles() const { return roles_; } // declaration order
    bool contains(const std::string& role) const;
    std::size_t index_of(const std::string& role) const;
    const std::vector<Prerequisite>& prerequisites(const std::string& role) const;
    std::vector<std::string> dependents(const std::string& role) const;

    // Waiting roles whose prerequisites are all terminal, in declaration order.
    std::vector<std::string> ready_set(const StateMap& states) const;

    // Mandatory prerequisites that ended failed or skipped.
    std::vector<std::string> unmet_mandatory(const std::string& role, const StateMap& states) const;

    // Optional prerequisites that ended failed or skipped.
    std::vector<OmittedInput> omitted_optional(const std::string& role, const StateMap& states) const;

    // Direct dependents still waiting.
    int pending_dependents(const std::string& role, const StateMap& states) const;

    // selected plus every transitive prerequisite, in declaration order.
    std::vector<std::string> closure(const std::set<std::string>& selected) const;

    // Induced graph over roles (which must be closed under prerequisites).
    DependencyGraph subgraph(const std::vector<std::string>& roles) const;

    std::vector<std::string> topological_order() const;

private:
    static TaskState state_of(const StateMap& states, const std::string& role);

    std::vector<RoleNode> nodes_;
    std::vector<std::string> roles_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<std::size_t>> dependents_;
    std::vector<std::size_t> topo_;
};
