#pragma once

#include "common/Clock.h"
#include "common/Errors.h"
#include "core/contracts/IAuthorizer.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionPort.h"
#include "core/contracts/IPriceFeed.h"
#include "core/contracts/ISettlement.h"
#include "engine/VaultConfig.h"
#include "ledger/LedgerStore.h"
#include "strategy/ArbitrageExecutor.h"
#include "strategy/GridEngine.h"
#include "strategy/PeriodicEngine.h"
#include "strategy/RebalanceReport.h"
#include "strategy/TrendEngine.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stratvault {
namespace engine {

// A transfer that failed after its ledger mutation committed. Stays queued
// until an admin resolves it.
struct ReconciliationItem {
    std::uint64_t id = 0;
    StrategyId strategy_id = 0;
    std::string asset;
    std::string from;
    std::string to;
    Amount amount = 0;
    std::string reason;         // "withdraw_payout", "withdraw_fee", "performance_fee"
    std::string error;
    EpochSeconds created_at = 0;
    int attempts = 1;
};

// Entry point of the vault: authorizes the caller, routes to the ledger and
// the strategy engines, settles after commit and journals what happened.
class StrategyController {
public:
    StrategyController(
        const VaultConfig& config,
        std::shared_ptr<core::IPriceFeed> price_feed,
        std::shared_ptr<core::ISettlement> settlement,
        std::shared_ptr<core::IAuthorizer> authorizer,
        std::shared_ptr<core::IExecutionPort> execution,
        std::shared_ptr<core::IEventJournal> journal = nullptr,
        std::shared_ptr<const IClock> clock = nullptr
    );

    // ===== Lifecycle (STRATEGY_MANAGER) =====

    ValueResult<StrategyId> createStrategy(const std::string& caller, ledger::CreateStrategyRequest request);
    OpResult activate(const std::string& caller, StrategyId id);
    OpResult pause(const std::string& caller, StrategyId id);
    OpResult resume(const std::string& caller, StrategyId id);
    OpResult updateParams(const std::string& caller, StrategyId id, const StrategyParams& params);

    // ADMIN; always takes effect on an existing strategy
    OpResult emergencyStop(const std::string& caller, StrategyId id);

    // ===== Capital (caller is the investor) =====

    ValueResult<ledger::InvestReceipt> invest(const std::string& investor, StrategyId id, Amount amount);
    ValueResult<ledger::WithdrawReceipt> withdraw(const std::string& investor, StrategyId id, Shares shares);

    // ===== Rebalancing (OPERATOR) =====

    // Never waits on a held section: returns Busy with report.skipped set.
    ValueResult<strategy::RebalanceReport> rebalance(const std::string& caller, StrategyId id);
    ValueResult<strategy::RebalanceReport> executeArbitrage(const std::string& caller, StrategyId id,
                                                            const std::string& opportunity_id);
    OpResult registerOpportunity(const std::string& caller, ArbitrageOpportunity opportunity);
    OpResult recordExternalMetrics(const std::string& caller, StrategyId id,
                                   double sharpe_ratio, double volatility);

    // ===== Fees and reconciliation (ADMIN) =====

    ValueResult<Amount> collectFees(const std::string& caller, StrategyId id);
    std::vector<ReconciliationItem> pendingReconciliations() const;
    OpResult resolveReconciliation(const std::string& caller, std::uint64_t item_id);

    // ===== Queries =====

    std::optional<Strategy> getStrategy(StrategyId id) const { return ledger_.getStrategy(id); }
    std::optional<StrategyMetrics> getMetrics(StrategyId id) const { return ledger_.getMetrics(id); }
    std::vector<InvestorPosition> getPositions(StrategyId id) const { return ledger_.getPositions(id); }
    std::optional<InvestorPosition> getPosition(StrategyId id, const std::string& investor) const {
        return ledger_.getPosition(id, investor);
    }
    std::vector<GridOrder> getGridOrders(StrategyId id, bool active_only = false) const {
        return ledger_.getGridOrders(id, active_only);
    }
    std::vector<Strategy> listStrategies() const { return ledger_.listStrategies(); }
    std::vector<Strategy> listActiveStrategies() const { return ledger_.listActiveStrategies(); }

    ledger::LedgerStore& ledger() { return ledger_; }
    const VaultConfig& config() const { return config_; }

private:
    OpResult authorize(const std::string& caller, Role role, const char* action) const;
    OpResult transition(const std::string& caller, StrategyId id, const char* action,
                        StrategyStatus from, StrategyStatus to);

    OpResult dispatch(ledger::StrategyBook& book, EpochSeconds now, strategy::RebalanceReport& report) const;

    // transfer + settlement log; a failure is queued for reconciliation
    bool settle(StrategyId id, const std::string& asset, const std::string& to,
                Amount amount, const char* reason);

    void publish(core::VaultEventType type, StrategyId id, const std::string& entity, nlohmann::json payload);
    void publish(const std::vector<core::JournalEvent>& events);

    VaultConfig config_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<core::IPriceFeed> price_feed_;
    std::shared_ptr<core::ISettlement> settlement_;
    std::shared_ptr<core::IAuthorizer> authorizer_;
    std::shared_ptr<core::IExecutionPort> execution_;
    std::shared_ptr<core::IEventJournal> journal_;

    ledger::LedgerStore ledger_;
    strategy::GridEngine grid_;
    strategy::TrendEngine trend_;
    strategy::PeriodicEngine periodic_;
    strategy::ArbitrageExecutor arbitrage_;

    mutable std::mutex reconciliation_mutex_;
    std::vector<ReconciliationItem> reconciliations_;
    std::uint64_t next_reconciliation_id_ = 1;
};

} // namespace engine
} // namespace stratvault
