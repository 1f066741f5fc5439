#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/contracts/IAuthorizer.h"

namespace stratvault {
namespace core {

// Role table loaded from configuration ("roles" section).
class StaticRoleAuthorizer : public IAuthorizer {
public:
    StaticRoleAuthorizer() = default;
    explicit StaticRoleAuthorizer(const std::map<std::string, std::vector<std::string>>& roles);

    bool hasRole(const std::string& caller, Role role) const override;

    void grant(const std::string& caller, Role role);
    void revoke(const std::string& caller, Role role);

private:
    mutable std::mutex mutex_;
    std::map<Role, std::set<std::string>> members_;
};

} // namespace core
} // namespace stratvault
