#include "core/adapters/StaticRoleAuthorizer.h"
#include "common/Logger.h"

namespace stratvault {
namespace core {

namespace {
bool roleFromName(const std::string& name, Role& out) {
    for (auto role : {Role::STRATEGY_MANAGER, Role::OPERATOR, Role::ADMIN}) {
        if (name == toString(role)) {
            out = role;
            return true;
        }
    }
    return false;
}
}

StaticRoleAuthorizer::StaticRoleAuthorizer(const std::map<std::string, std::vector<std::string>>& roles) {
    for (const auto& item : roles) {
        Role role;
        if (!roleFromName(item.first, role)) {
            LOG_WARN("[Authorizer] unknown role '{}' ignored", item.first);
            continue;
        }
        members_[role].insert(item.second.begin(), item.second.end());
    }
}

bool StaticRoleAuthorizer::hasRole(const std::string& caller, Role role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(caller) > 0;
}

void StaticRoleAuthorizer::grant(const std::string& caller, Role role) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_[role].insert(caller);
}

void StaticRoleAuthorizer::revoke(const std::string& caller, Role role) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(role);
    if (it != members_.end()) {
        it->second.erase(caller);
    }
}

} // namespace core
} // namespace stratvault
