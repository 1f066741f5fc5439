#pragma once

#include <mutex>
#include <vector>

#include "core/contracts/ISettlement.h"

namespace stratvault {
namespace core {

struct TransferRecord {
    std::string asset;
    std::string from;
    std::string to;
    Amount amount = 0;
    std::string tx_ref;
};

// Records transfers instead of moving funds. setFailNext() makes the next
// transfers fail so the reconciliation path can be exercised.
class PaperSettlement : public ISettlement {
public:
    TransferResult transfer(
        const std::string& asset,
        const std::string& from,
        const std::string& to,
        Amount amount
    ) override;

    void setFailNext(int count);
    std::vector<TransferRecord> transfers() const;
    Amount totalTo(const std::string& account) const;

private:
    mutable std::mutex mutex_;
    std::vector<TransferRecord> transfers_;
    int fail_next_ = 0;
    std::uint64_t next_ref_ = 1;
};

} // namespace core
} // namespace stratvault
