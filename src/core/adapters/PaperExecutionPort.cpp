#include "core/adapters/PaperExecutionPort.h"

namespace stratvault {
namespace core {

TradeResult PaperExecutionPort::executeTrade(const TradeRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);

    TradeResult result;
    if (reject_next_ > 0) {
        reject_next_--;
        result.reason = "paper execution: rejected";
        return result;
    }

    result.success = true;
    result.executed_price = request.reference_price;
    result.executed_amount = request.amount;
    if (!scripted_pnl_.empty()) {
        result.realized_pnl = scripted_pnl_.front();
        scripted_pnl_.pop_front();
    }
    result.reason = "paper fill";
    return result;
}

void PaperExecutionPort::queuePnl(Amount pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_pnl_.push_back(pnl);
}

void PaperExecutionPort::rejectNext(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_next_ = count;
}

std::vector<TradeRequest> PaperExecutionPort::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t PaperExecutionPort::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

} // namespace core
} // namespace stratvault
