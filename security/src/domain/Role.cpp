#include "domain/Role.hpp"

#include <map>

namespace orion::security::domain {

namespace {

const std::map<Role, std::set<Role>>& implicationTable() {
    static const std::map<Role, std::set<Role>> table = {
        {Role::TRADER,   {}},
        {Role::SALES,    {Role::TRADER}},
        {Role::RISK,     {}},
        {Role::ANALYST,  {}},
        {Role::ADMIN,    {Role::TRADER, Role::SALES, Role::RISK, Role::ANALYST}},
        {Role::PLATFORM, {}}
    };
    return table;
}

} // namespace

std::string toString(Role role) {
    switch (role) {
        case Role::TRADER:   return "ROLE_TRADER";
        case Role::SALES:    return "ROLE_SALES";
        case Role::RISK:     return "ROLE_RISK";
        case Role::ANALYST:  return "ROLE_ANALYST";
        case Role::ADMIN:    return "ROLE_ADMIN";
        case Role::PLATFORM: return "ROLE_PLATFORM";
        default: return "UNKNOWN";
    }
}

std::optional<Role> roleFromString(const std::string& value) {
    for (Role role : allRoles()) {
        if (toString(role) == value) {
            return role;
        }
    }
    return std::nullopt;
}

bool isKnownRole(const std::string& value) {
    return roleFromString(value).has_value();
}

const std::set<Role>& impliedRoles(Role role) {
    static const std::set<Role> none;
    const auto& table = implicationTable();
    auto it = table.find(role);
    return it != table.end() ? it->second : none;
}

bool implies(Role held, Role required) {
    return held == required || impliedRoles(held).count(required) > 0;
}

const std::vector<Role>& allRoles() {
    static const std::vector<Role> roles = {
        Role::TRADER, Role::SALES, Role::RISK, Role::ANALYST, Role::ADMIN, Role::PLATFORM
    };
    return roles;
}

} // namespace orion::security::domain
