#pragma once

#include "common/Clock.h"
#include "common/Errors.h"
#include "ledger/StrategyBook.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stratvault {
namespace ledger {

struct CreateStrategyRequest {
    StrategyType type = StrategyType::GRID_TRADING;
    std::string base_asset;
    std::string quote_asset;
    Amount min_investment = 0;
    Amount max_investment = 0;
    int performance_fee_bps = 0;
    int management_fee_bps_per_year = 0;
    StrategyParams params;
    std::string creator;
};

struct InvestReceipt {
    Shares shares_minted = 0;
    Amount amount = 0;
    Shares position_shares = 0;
};

// Describes the transfers the caller must settle after commit.
struct WithdrawReceipt {
    std::string asset;
    Shares shares_burned = 0;
    Amount gross_amount = 0;
    Amount management_fee = 0;
    Amount payout = 0;
    bool position_closed = false;
};

enum class LockMode {
    BOUNDED_WAIT,   // wait up to the configured timeout, then Busy
    TRY_ONCE        // Busy immediately if the section is held
};

// Authoritative store of strategies, investor positions, grid orders and
// arbitrage opportunities.
//
// Every strategy has its own exclusive section. A mutation runs on a copy of
// the strategy's book and is published only when it succeeds, so readers
// (which load the published snapshot without locking) never see a
// half-applied change.
class LedgerStore {
public:
    using Mutation = std::function<OpResult(StrategyBook&)>;

    LedgerStore(std::shared_ptr<const IClock> clock, std::chrono::milliseconds lock_timeout);

    ValueResult<StrategyId> createStrategy(const CreateStrategyRequest& request);

    // INACTIVE -> ACTIVE; on_activate runs in the same section (grid seeding)
    OpResult activate(StrategyId id, const Mutation& on_activate = nullptr);

    ValueResult<InvestReceipt> invest(StrategyId id, const std::string& investor, Amount amount,
                                      const Mutation& after = nullptr);
    ValueResult<WithdrawReceipt> withdraw(StrategyId id, const std::string& investor, Shares shares,
                                          const Mutation& after = nullptr);

    OpResult pause(StrategyId id);
    OpResult resume(StrategyId id);
    OpResult emergencyStop(StrategyId id);
    OpResult updateParams(StrategyId id, const StrategyParams& params);

    // Removes and returns the accrued performance fee.
    ValueResult<Amount> drainPerformanceFees(StrategyId id);

    OpResult mutate(StrategyId id, const Mutation& fn, LockMode mode = LockMode::BOUNDED_WAIT);

    // Queries: lock-free snapshot reads
    std::shared_ptr<const StrategyBook> snapshot(StrategyId id) const;
    std::optional<Strategy> getStrategy(StrategyId id) const;
    std::optional<StrategyMetrics> getMetrics(StrategyId id) const;
    std::vector<InvestorPosition> getPositions(StrategyId id) const;
    std::optional<InvestorPosition> getPosition(StrategyId id, const std::string& investor) const;
    std::vector<GridOrder> getGridOrders(StrategyId id, bool active_only = false) const;
    std::vector<Strategy> listStrategies() const;
    std::vector<Strategy> listActiveStrategies() const;

    // Arbitrage opportunities, keyed by opaque id
    bool addOpportunity(const ArbitrageOpportunity& opportunity);
    std::optional<ArbitrageOpportunity> takeOpportunity(const std::string& id);
    bool hasOpportunity(const std::string& id) const;
    std::size_t opportunityCount() const;

    static OpResult validateParams(StrategyType type, const StrategyParams& params);

    EpochSeconds now() const { return clock_->now(); }

private:
    struct Slot {
        std::timed_mutex mutex;
        std::shared_ptr<const StrategyBook> published;
        std::atomic<bool> emergency_stop{false};
    };

    Slot* findSlot(StrategyId id) const;
    // Caller holds slot.mutex.
    static void publishStopped(Slot& slot);

    std::shared_ptr<const IClock> clock_;
    std::chrono::milliseconds lock_timeout_;

    mutable std::shared_mutex registry_mutex_;
    std::map<StrategyId, std::unique_ptr<Slot>> slots_;
    std::atomic<StrategyId> next_id_{1};

    mutable std::mutex opportunity_mutex_;
    std::map<std::string, ArbitrageOpportunity> opportunities_;
};

} // namespace ledger
} // namespace stratvault
