#include "engine/StrategyController.h"
#include "ledger/PerformanceTracker.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace stratvault {
namespace engine {

namespace {
std::shared_ptr<const IClock> orSystemClock(std::shared_ptr<const IClock> clock) {
    if (clock) {
        return clock;
    }
    return std::make_shared<SystemClock>();
}

bool hasEngine(StrategyType type) {
    switch (type) {
        case StrategyType::LIQUIDITY_PROVIDING:
        case StrategyType::DELTA_NEUTRAL:
        case StrategyType::YIELD_FARMING:
            return false;
        default:
            return true;
    }
}
}

StrategyController::StrategyController(
    const VaultConfig& config,
    std::shared_ptr<core::IPriceFeed> price_feed,
    std::shared_ptr<core::ISettlement> settlement,
    std::shared_ptr<core::IAuthorizer> authorizer,
    std::shared_ptr<core::IExecutionPort> execution,
    std::shared_ptr<core::IEventJournal> journal,
    std::shared_ptr<const IClock> clock
)
    : config_(config)
    , clock_(orSystemClock(std::move(clock)))
    , price_feed_(std::move(price_feed))
    , settlement_(std::move(settlement))
    , authorizer_(std::move(authorizer))
    , execution_(std::move(execution))
    , journal_(std::move(journal))
    , ledger_(clock_, std::chrono::milliseconds(config.lock_timeout_ms))
    , grid_(price_feed_, execution_, config.grid_twap_window_sec)
    , trend_(price_feed_, execution_, config.momentum_twap_window_sec, config.mean_reversion_twap_window_sec)
    , periodic_(price_feed_, execution_)
    , arbitrage_(ledger_, execution_, config.arbitrage_window_sec)
{
    if (!price_feed_ || !settlement_ || !authorizer_ || !execution_) {
        throw std::invalid_argument("StrategyController requires price feed, settlement, authorizer and execution port");
    }
    LOG_INFO("StrategyController ready (lock_timeout={}ms, arbitrage_window={}s, vault={}, fee_recipient={})",
             config_.lock_timeout_ms, config_.arbitrage_window_sec,
             config_.vault_account, config_.fee_recipient);
}

// ===== Lifecycle =====

ValueResult<StrategyId> StrategyController::createStrategy(const std::string& caller,
                                                           ledger::CreateStrategyRequest request) {
    auto auth = authorize(caller, Role::STRATEGY_MANAGER, "createStrategy");
    if (!auth.ok()) {
        return auth;
    }
    request.creator = caller;

    auto created = ledger_.createStrategy(request);
    if (!created.ok()) {
        LOG_WARN("createStrategy by {} rejected: {} {}", caller, toString(created.error), created.message);
        return created;
    }

    publish(core::VaultEventType::STRATEGY_CREATED, created.value, std::to_string(created.value), {
        {"type", toString(request.type)},
        {"base_asset", request.base_asset},
        {"quote_asset", request.quote_asset},
        {"creator", caller},
        {"performance_fee_bps", request.performance_fee_bps},
        {"management_fee_bps_per_year", request.management_fee_bps_per_year}
    });
    return created;
}

OpResult StrategyController::activate(const std::string& caller, StrategyId id) {
    auto auth = authorize(caller, Role::STRATEGY_MANAGER, "activate");
    if (!auth.ok()) {
        return auth;
    }

    const EpochSeconds now = clock_->now();
    auto result = ledger_.activate(id, [&](ledger::StrategyBook& book) -> OpResult {
        if (book.strategy.type == StrategyType::GRID_TRADING) {
            return grid_.seedLadder(book, now);
        }
        return OpResult::success();
    });
    if (!result.ok()) {
        LOG_WARN("activate strategy {} failed: {} {}", id, toString(result.error), result.message);
        return result;
    }

    publish(core::VaultEventType::STATUS_CHANGED, id, std::to_string(id), {
        {"from", toString(StrategyStatus::INACTIVE)},
        {"to", toString(StrategyStatus::ACTIVE)},
        {"by", caller}
    });
    return result;
}

OpResult StrategyController::pause(const std::string& caller, StrategyId id) {
    return transition(caller, id, "pause", StrategyStatus::ACTIVE, StrategyStatus::PAUSED);
}

OpResult StrategyController::resume(const std::string& caller, StrategyId id) {
    return transition(caller, id, "resume", StrategyStatus::PAUSED, StrategyStatus::ACTIVE);
}

OpResult StrategyController::transition(const std::string& caller, StrategyId id, const char* action,
                                        StrategyStatus from, StrategyStatus to) {
    auto auth = authorize(caller, Role::STRATEGY_MANAGER, action);
    if (!auth.ok()) {
        return auth;
    }

    auto result = (to == StrategyStatus::PAUSED) ? ledger_.pause(id) : ledger_.resume(id);
    if (!result.ok()) {
        return result;
    }

    LOG_INFO("strategy {} {} -> {} by {}", id, toString(from), toString(to), caller);
    publish(core::VaultEventType::STATUS_CHANGED, id, std::to_string(id), {
        {"from", toString(from)},
        {"to", toString(to)},
        {"by", caller}
    });
    return result;
}

OpResult StrategyController::updateParams(const std::string& caller, StrategyId id, const StrategyParams& params) {
    auto auth = authorize(caller, Role::STRATEGY_MANAGER, "updateParams");
    if (!auth.ok()) {
        return auth;
    }
    auto result = ledger_.updateParams(id, params);
    if (result.ok()) {
        LOG_INFO("strategy {} params updated by {}", id, caller);
    }
    return result;
}

OpResult StrategyController::emergencyStop(const std::string& caller, StrategyId id) {
    auto auth = authorize(caller, Role::ADMIN, "emergencyStop");
    if (!auth.ok()) {
        return auth;
    }

    const auto before = ledger_.getStrategy(id);
    auto result = ledger_.emergencyStop(id);
    if (!result.ok()) {
        return result;
    }

    LOG_WARN("strategy {} EMERGENCY STOP by {}", id, caller);
    publish(core::VaultEventType::EMERGENCY_STOPPED, id, std::to_string(id), {
        {"from", before ? toString(before->status) : "UNKNOWN"},
        {"by", caller}
    });
    return result;
}

// ===== Capital =====

ValueResult<ledger::InvestReceipt> StrategyController::invest(const std::string& investor, StrategyId id,
                                                              Amount amount) {
    auto result = ledger_.invest(id, investor, amount, [&](ledger::StrategyBook& book) -> OpResult {
        if (book.strategy.type == StrategyType::GRID_TRADING && book.activeGridOrderCount() > 0) {
            grid_.resizeLadder(book);
        }
        return OpResult::success();
    });
    if (!result.ok()) {
        LOG_WARN("invest {} into strategy {} by {} rejected: {} {}",
                 amount, id, investor, toString(result.error), result.message);
        return result;
    }

    LOG_INFO("strategy {} invest: {} deposited {} -> {} shares", id, investor, amount, result.value.shares_minted);
    publish(core::VaultEventType::INVESTED, id, investor, {
        {"investor", investor},
        {"amount", amount},
        {"shares", result.value.shares_minted},
        {"position_shares", result.value.position_shares}
    });
    return result;
}

ValueResult<ledger::WithdrawReceipt> StrategyController::withdraw(const std::string& investor, StrategyId id,
                                                                  Shares shares) {
    auto result = ledger_.withdraw(id, investor, shares, [&](ledger::StrategyBook& book) -> OpResult {
        if (book.strategy.type == StrategyType::GRID_TRADING && book.activeGridOrderCount() > 0) {
            grid_.resizeLadder(book);
        }
        return OpResult::success();
    });
    if (!result.ok()) {
        LOG_WARN("withdraw {} shares from strategy {} by {} rejected: {} {}",
                 shares, id, investor, toString(result.error), result.message);
        return result;
    }

    const ledger::WithdrawReceipt& receipt = result.value;
    publish(core::VaultEventType::WITHDRAWN, id, investor, {
        {"investor", investor},
        {"shares", receipt.shares_burned},
        {"gross_amount", receipt.gross_amount},
        {"management_fee", receipt.management_fee},
        {"payout", receipt.payout},
        {"position_closed", receipt.position_closed}
    });

    // The ledger has committed; from here on failures are reconciled, not rolled back.
    bool settled = true;
    if (receipt.payout > 0) {
        settled = settle(id, receipt.asset, investor, receipt.payout, "withdraw_payout") && settled;
    }
    if (receipt.management_fee > 0) {
        settled = settle(id, receipt.asset, config_.fee_recipient, receipt.management_fee, "withdraw_fee") && settled;
    }

    LOG_INFO("strategy {} withdraw: {} burned {} shares, payout={} fee={}",
             id, investor, receipt.shares_burned, receipt.payout, receipt.management_fee);

    if (!settled) {
        ValueResult<ledger::WithdrawReceipt> failed(
            OpResult::failure(ErrorCode::SETTLEMENT_FAILED, "withdrawal committed, transfer queued for reconciliation"));
        failed.value = receipt;
        return failed;
    }
    return result;
}

// ===== Rebalancing =====

OpResult StrategyController::dispatch(ledger::StrategyBook& book, EpochSeconds now,
                                      strategy::RebalanceReport& report) const {
    switch (book.strategy.type) {
        case StrategyType::GRID_TRADING:
            return grid_.rebalance(book, now, report);
        case StrategyType::DCA:
            return periodic_.tick(book, now, report);
        case StrategyType::MOMENTUM:
            return trend_.momentum(book, now, report);
        case StrategyType::MEAN_REVERSION:
            return trend_.meanReversion(book, now, report);
        case StrategyType::ARBITRAGE:
            // driven by executeArbitrage when an opportunity is registered
            report.action = "awaiting_opportunity";
            return OpResult::success();
        default:
            return OpResult::failure(ErrorCode::UNSUPPORTED_STRATEGY_TYPE,
                                     std::string("no engine for ") + toString(book.strategy.type));
    }
}

ValueResult<strategy::RebalanceReport> StrategyController::rebalance(const std::string& caller, StrategyId id) {
    auto auth = authorize(caller, Role::OPERATOR, "rebalance");
    if (!auth.ok()) {
        return auth;
    }

    const auto current = ledger_.getStrategy(id);
    if (!current) {
        return OpResult::failure(ErrorCode::STRATEGY_NOT_FOUND, "strategy " + std::to_string(id));
    }
    if (!hasEngine(current->type)) {
        return OpResult::failure(ErrorCode::UNSUPPORTED_STRATEGY_TYPE,
                                 std::string("no engine for ") + toString(current->type));
    }

    const EpochSeconds now = clock_->now();
    strategy::RebalanceReport report;
    auto result = ledger_.mutate(id, [&](ledger::StrategyBook& book) -> OpResult {
        report = strategy::RebalanceReport();
        report.strategy_id = id;
        report.type = book.strategy.type;
        if (book.strategy.status != StrategyStatus::ACTIVE) {
            return OpResult::failure(ErrorCode::NOT_ACTIVE,
                                     std::string("strategy is ") + toString(book.strategy.status));
        }

        auto engine_result = dispatch(book, now, report);
        if (!engine_result.ok()) {
            return engine_result;
        }

        if (book.strategy.status == StrategyStatus::ACTIVE &&
            ledger::PerformanceTracker::drawdownLimitBreached(book.strategy)) {
            book.strategy.status = StrategyStatus::PAUSED;
            report.status_changed = true;
            report.action += "+drawdown_pause";
            LOG_WARN("strategy {} drawdown {:.1f}bps reached limit {}bps, pausing",
                     id, book.strategy.metrics.max_drawdown_bps, book.strategy.params.max_drawdown_bps);
        }
        report.status_after = book.strategy.status;
        return OpResult::success();
    }, ledger::LockMode::TRY_ONCE);

    if (result.error == ErrorCode::BUSY) {
        ValueResult<strategy::RebalanceReport> skipped(result);
        skipped.value.strategy_id = id;
        skipped.value.type = current->type;
        skipped.value.skipped = true;
        skipped.value.action = "skipped_busy";
        return skipped;
    }
    if (!result.ok()) {
        LOG_WARN("rebalance strategy {} failed: {} {}", id, toString(result.error), result.message);
        return result;
    }

    publish(report.events);
    publish(core::VaultEventType::REBALANCED, id, std::to_string(id), {
        {"type", toString(report.type)},
        {"action", report.action},
        {"trades", report.trades},
        {"fills", report.fills},
        {"execution_failures", report.execution_failures},
        {"volume", report.volume},
        {"realized_pnl", report.realized_pnl},
        {"price", report.reference_price}
    });
    if (report.status_changed) {
        publish(core::VaultEventType::STATUS_CHANGED, id, std::to_string(id), {
            {"from", toString(StrategyStatus::ACTIVE)},
            {"to", toString(report.status_after)},
            {"by", report.action}
        });
    }
    return ValueResult<strategy::RebalanceReport>::of(report);
}

ValueResult<strategy::RebalanceReport> StrategyController::executeArbitrage(const std::string& caller, StrategyId id,
                                                                            const std::string& opportunity_id) {
    auto auth = authorize(caller, Role::OPERATOR, "executeArbitrage");
    if (!auth.ok()) {
        return auth;
    }

    const auto current = ledger_.getStrategy(id);
    if (!current) {
        return OpResult::failure(ErrorCode::STRATEGY_NOT_FOUND, "strategy " + std::to_string(id));
    }
    if (current->type != StrategyType::ARBITRAGE) {
        return OpResult::failure(ErrorCode::UNSUPPORTED_STRATEGY_TYPE,
                                 std::string("arbitrage execution on ") + toString(current->type) + " strategy");
    }

    const EpochSeconds now = clock_->now();
    strategy::RebalanceReport report;
    auto result = ledger_.mutate(id, [&](ledger::StrategyBook& book) -> OpResult {
        report = strategy::RebalanceReport();
        report.strategy_id = id;
        report.type = book.strategy.type;
        if (book.strategy.status != StrategyStatus::ACTIVE) {
            return OpResult::failure(ErrorCode::NOT_ACTIVE,
                                     std::string("strategy is ") + toString(book.strategy.status));
        }
        auto executed = arbitrage_.execute(opportunity_id, book, now, report);
        report.status_after = book.strategy.status;
        return executed;
    });
    if (!result.ok()) {
        LOG_WARN("arbitrage {} on strategy {} failed: {} {}",
                 opportunity_id, id, toString(result.error), result.message);
        return result;
    }

    publish(report.events);
    return ValueResult<strategy::RebalanceReport>::of(report);
}

OpResult StrategyController::registerOpportunity(const std::string& caller, ArbitrageOpportunity opportunity) {
    auto auth = authorize(caller, Role::OPERATOR, "registerOpportunity");
    if (!auth.ok()) {
        return auth;
    }
    if (opportunity.id.empty() || opportunity.token_a.empty() || opportunity.token_b.empty() ||
        opportunity.price_a <= 0.0 || opportunity.price_b <= 0.0) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "opportunity needs id, tokens and positive prices");
    }
    if (opportunity.timestamp == 0) {
        opportunity.timestamp = clock_->now();
    }
    if (!ledger_.addOpportunity(opportunity)) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "opportunity " + opportunity.id + " already registered");
    }
    LOG_INFO("opportunity {} registered: {}/{} {}@{:.6f} vs {}@{:.6f}",
             opportunity.id, opportunity.token_a, opportunity.token_b,
             opportunity.venue_a, opportunity.price_a, opportunity.venue_b, opportunity.price_b);
    return OpResult::success();
}

OpResult StrategyController::recordExternalMetrics(const std::string& caller, StrategyId id,
                                                   double sharpe_ratio, double volatility) {
    auto auth = authorize(caller, Role::OPERATOR, "recordExternalMetrics");
    if (!auth.ok()) {
        return auth;
    }
    const EpochSeconds now = clock_->now();
    return ledger_.mutate(id, [&](ledger::StrategyBook& book) -> OpResult {
        ledger::PerformanceTracker::recordExternal(book.strategy.metrics, sharpe_ratio, volatility, now);
        return OpResult::success();
    });
}

// ===== Fees and reconciliation =====

ValueResult<Amount> StrategyController::collectFees(const std::string& caller, StrategyId id) {
    auto auth = authorize(caller, Role::ADMIN, "collectFees");
    if (!auth.ok()) {
        return auth;
    }
    const auto current = ledger_.getStrategy(id);
    if (!current) {
        return OpResult::failure(ErrorCode::STRATEGY_NOT_FOUND, "strategy " + std::to_string(id));
    }

    auto drained = ledger_.drainPerformanceFees(id);
    if (!drained.ok() || drained.value <= 0) {
        return drained;
    }

    if (!settle(id, current->quote_asset, config_.fee_recipient, drained.value, "performance_fee")) {
        ValueResult<Amount> failed(
            OpResult::failure(ErrorCode::SETTLEMENT_FAILED, "fee drained, transfer queued for reconciliation"));
        failed.value = drained.value;
        return failed;
    }
    LOG_INFO("strategy {} performance fee {} collected to {}", id, drained.value, config_.fee_recipient);
    return drained;
}

std::vector<ReconciliationItem> StrategyController::pendingReconciliations() const {
    std::lock_guard<std::mutex> lock(reconciliation_mutex_);
    return reconciliations_;
}

OpResult StrategyController::resolveReconciliation(const std::string& caller, std::uint64_t item_id) {
    auto auth = authorize(caller, Role::ADMIN, "resolveReconciliation");
    if (!auth.ok()) {
        return auth;
    }

    ReconciliationItem item;
    {
        std::lock_guard<std::mutex> lock(reconciliation_mutex_);
        auto it = std::find_if(reconciliations_.begin(), reconciliations_.end(),
                               [item_id](const ReconciliationItem& r) { return r.id == item_id; });
        if (it == reconciliations_.end()) {
            return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                     "no pending reconciliation " + std::to_string(item_id));
        }
        item = *it;
    }

    const core::TransferResult transfer = settlement_->transfer(item.asset, item.from, item.to, item.amount);
    Logger::getInstance().logSettlement(item.asset, item.from, item.to, item.amount,
                                        transfer.success, transfer.success ? transfer.tx_ref : transfer.error);

    std::lock_guard<std::mutex> lock(reconciliation_mutex_);
    auto it = std::find_if(reconciliations_.begin(), reconciliations_.end(),
                           [item_id](const ReconciliationItem& r) { return r.id == item_id; });
    if (!transfer.success) {
        if (it != reconciliations_.end()) {
            it->attempts++;
            it->error = transfer.error;
        }
        LOG_ERROR("reconciliation {} retry failed: {}", item_id, transfer.error);
        return OpResult::failure(ErrorCode::SETTLEMENT_FAILED, transfer.error);
    }
    if (it != reconciliations_.end()) {
        reconciliations_.erase(it);
    }
    LOG_INFO("reconciliation {} resolved by {} (tx={})", item_id, caller, transfer.tx_ref);
    return OpResult::success();
}

// ===== Helpers =====

OpResult StrategyController::authorize(const std::string& caller, Role role, const char* action) const {
    if (caller.empty() || !authorizer_->hasRole(caller, role)) {
        LOG_WARN("{} denied for '{}': requires {}", action, caller, toString(role));
        return OpResult::failure(ErrorCode::UNAUTHORIZED,
                                 std::string(action) + " requires " + toString(role));
    }
    return OpResult::success();
}

bool StrategyController::settle(StrategyId id, const std::string& asset, const std::string& to,
                                Amount amount, const char* reason) {
    const core::TransferResult transfer = settlement_->transfer(asset, config_.vault_account, to, amount);
    Logger::getInstance().logSettlement(asset, config_.vault_account, to, amount,
                                        transfer.success, transfer.success ? transfer.tx_ref : transfer.error);
    if (transfer.success) {
        return true;
    }

    ReconciliationItem item;
    item.strategy_id = id;
    item.asset = asset;
    item.from = config_.vault_account;
    item.to = to;
    item.amount = amount;
    item.reason = reason;
    item.error = transfer.error;
    item.created_at = clock_->now();
    {
        std::lock_guard<std::mutex> lock(reconciliation_mutex_);
        item.id = next_reconciliation_id_++;
        reconciliations_.push_back(item);
    }

    LOG_ERROR("strategy {} settlement failed ({} {} {} -> {}): {}; queued as reconciliation {}",
              id, reason, amount, asset, to, transfer.error, item.id);
    publish(core::VaultEventType::SETTLEMENT_FAILED, id, std::to_string(item.id), {
        {"reconciliation_id", item.id},
        {"reason", item.reason},
        {"asset", asset},
        {"to", to},
        {"amount", amount},
        {"error", transfer.error}
    });
    return false;
}

void StrategyController::publish(core::VaultEventType type, StrategyId id, const std::string& entity,
                                 nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts = clock_->now();
    event.type = type;
    event.strategy_id = id;
    event.entity_id = entity;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {} on strategy {}", core::toString(type), id);
    }
}

void StrategyController::publish(const std::vector<core::JournalEvent>& events) {
    if (!journal_) {
        return;
    }
    for (const auto& event : events) {
        if (!journal_->append(event)) {
            LOG_WARN("journal append failed for {} on strategy {}", core::toString(event.type), event.strategy_id);
        }
    }
}

} // namespace engine
} // namespace stratvault
