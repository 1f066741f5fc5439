#pragma once

#include <string>

#include "common/Types.h"

namespace stratvault {
namespace core {

struct TransferResult {
    bool success = false;
    std::string tx_ref;
    std::string error;
};

// Custody boundary. Invoked only after the ledger mutation has committed.
class ISettlement {
public:
    virtual ~ISettlement() = default;

    virtual TransferResult transfer(
        const std::string& asset,
        const std::string& from,
        const std::string& to,
        Amount amount
    ) = 0;
};

} // namespace core
} // namespace stratvault
