#pragma once

#include <string>

#include "common/Types.h"

namespace stratvault {
namespace core {

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    virtual bool hasRole(const std::string& caller, Role role) const = 0;
};

} // namespace core
} // namespace stratvault
