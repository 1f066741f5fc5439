#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "core/contracts/IExecutionPort.h"

namespace stratvault {
namespace core {

// Fills every request at its reference price. Scripted P&L values and
// rejections are consumed in order, one per request.
class PaperExecutionPort : public IExecutionPort {
public:
    TradeResult executeTrade(const TradeRequest& request) override;

    void queuePnl(Amount pnl);
    void rejectNext(int count);
    std::vector<TradeRequest> requests() const;
    std::size_t requestCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<TradeRequest> requests_;
    std::deque<Amount> scripted_pnl_;
    int reject_next_ = 0;
};

} // namespace core
} // namespace stratvault
