#include "core/adapters/PaperSettlement.h"

namespace stratvault {
namespace core {

TransferResult PaperSettlement::transfer(
    const std::string& asset,
    const std::string& from,
    const std::string& to,
    Amount amount
) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferResult result;
    if (fail_next_ > 0) {
        fail_next_--;
        result.error = "paper settlement: injected failure";
        return result;
    }
    if (amount < 0) {
        result.error = "paper settlement: negative amount";
        return result;
    }

    TransferRecord record;
    record.asset = asset;
    record.from = from;
    record.to = to;
    record.amount = amount;
    record.tx_ref = "paper-" + std::to_string(next_ref_++);
    transfers_.push_back(record);

    result.success = true;
    result.tx_ref = record.tx_ref;
    return result;
}

void PaperSettlement::setFailNext(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = count;
}

std::vector<TransferRecord> PaperSettlement::transfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_;
}

Amount PaperSettlement::totalTo(const std::string& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& t : transfers_) {
        if (t.to == account) {
            total += t.amount;
        }
    }
    return total;
}

} // namespace core
} // namespace stratvault
