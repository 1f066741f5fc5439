#include "ledger/LedgerStore.h"
#include "ledger/FeeCalculator.h"
#include "common/FixedPoint.h"
#include "common/Logger.h"

#include <algorithm>
#include <limits>

namespace stratvault {
namespace ledger {

LedgerStore::LedgerStore(std::shared_ptr<const IClock> clock, std::chrono::milliseconds lock_timeout)
    : clock_(std::move(clock))
    , lock_timeout_(lock_timeout)
{
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
}

// ===== Lifecycle =====

ValueResult<StrategyId> LedgerStore::createStrategy(const CreateStrategyRequest& request) {
    if (request.base_asset.empty() || request.quote_asset.empty() ||
        request.base_asset == request.quote_asset) {
        return OpResult::failure(ErrorCode::INVALID_ASSET_PAIR,
                                 "base and quote asset must be distinct and non-empty");
    }
    if (!FeeCalculator::isPerformanceFeeValid(request.performance_fee_bps)) {
        return OpResult::failure(ErrorCode::FEE_TOO_HIGH,
                                 "performance fee above " + std::to_string(kMaxPerformanceFeeBps) + " bps");
    }
    if (!FeeCalculator::isManagementFeeValid(request.management_fee_bps_per_year)) {
        return OpResult::failure(ErrorCode::FEE_TOO_HIGH,
                                 "management fee above " + std::to_string(kMaxManagementFeeBpsPerYear) + " bps/year");
    }
    if (request.min_investment < 0 || request.max_investment < 0 ||
        (request.max_investment > 0 && request.max_investment < request.min_investment)) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "invalid investment bounds");
    }
    auto params_check = validateParams(request.type, request.params);
    if (!params_check.ok()) {
        return params_check;
    }

    auto book = std::make_shared<StrategyBook>();
    Strategy& s = book->strategy;
    s.id = next_id_.fetch_add(1);
    s.type = request.type;
    s.status = StrategyStatus::INACTIVE;
    s.creator = request.creator;
    s.base_asset = request.base_asset;
    s.quote_asset = request.quote_asset;
    s.min_investment = request.min_investment;
    s.max_investment = request.max_investment;
    s.performance_fee_bps = request.performance_fee_bps;
    s.management_fee_bps_per_year = request.management_fee_bps_per_year;
    s.created_at = clock_->now();
    s.params = request.params;

    auto slot = std::make_unique<Slot>();
    slot->published = book;

    const StrategyId id = s.id;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        slots_.emplace(id, std::move(slot));
    }

    LOG_INFO("[Ledger] strategy {} created: {} {}/{}", id, toString(request.type),
             request.base_asset, request.quote_asset);
    return ValueResult<StrategyId>::of(id);
}

OpResult LedgerStore::activate(StrategyId id, const Mutation& on_activate) {
    return mutate(id, [&](StrategyBook& book) -> OpResult {
        if (book.strategy.status != StrategyStatus::INACTIVE) {
            return OpResult::failure(ErrorCode::ALREADY_ACTIVE,
                                     std::string("strategy is ") + toString(book.strategy.status));
        }
        book.strategy.status = StrategyStatus::ACTIVE;
        if (on_activate) {
            return on_activate(book);
        }
        return OpResult::success();
    });
}

ValueResult<InvestReceipt> LedgerStore::invest(StrategyId id, const std::string& investor, Amount amount,
                                               const Mutation& after) {
    if (investor.empty()) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "investor id required");
    }
    if (amount <= 0) {
        return OpResult::failure(ErrorCode::INVALID_AMOUNT, "investment must be positive");
    }

    InvestReceipt receipt;
    const EpochSeconds now = clock_->now();
    auto status = mutate(id, [&](StrategyBook& book) -> OpResult {
        Strategy& s = book.strategy;
        if (s.status != StrategyStatus::ACTIVE) {
            return OpResult::failure(ErrorCode::NOT_ACTIVE, std::string("strategy is ") + toString(s.status));
        }
        if (amount < s.min_investment) {
            return OpResult::failure(ErrorCode::BELOW_MINIMUM,
                                     "minimum investment is " + std::to_string(s.min_investment));
        }
        if (s.max_investment > 0 && amount > s.max_investment) {
            return OpResult::failure(ErrorCode::ABOVE_MAXIMUM,
                                     "maximum investment is " + std::to_string(s.max_investment));
        }
        if (s.total_capital > std::numeric_limits<Amount>::max() - amount) {
            return OpResult::failure(ErrorCode::ABOVE_MAXIMUM, "capital would overflow");
        }

        const Shares minted = (s.total_shares == 0 || s.total_capital == 0)
            ? amount
            : fixed::mulDiv(amount, s.total_shares, s.total_capital);
        if (minted <= 0) {
            return OpResult::failure(ErrorCode::INVALID_AMOUNT, "deposit too small to mint a share");
        }

        auto it = book.positions.find(investor);
        if (it == book.positions.end()) {
            InvestorPosition fresh;
            fresh.strategy_id = s.id;
            fresh.investor_id = investor;
            fresh.entry_time = now;
            it = book.positions.emplace(investor, fresh).first;
        }
        it->second.shares += minted;
        it->second.capital_contributed += amount;

        s.total_capital += amount;
        s.active_capital += amount;
        s.total_shares += minted;

        receipt.shares_minted = minted;
        receipt.amount = amount;
        receipt.position_shares = it->second.shares;

        if (after) {
            return after(book);
        }
        return OpResult::success();
    });

    if (!status.ok()) {
        return status;
    }
    return ValueResult<InvestReceipt>::of(receipt);
}

ValueResult<WithdrawReceipt> LedgerStore::withdraw(StrategyId id, const std::string& investor, Shares shares,
                                                   const Mutation& after) {
    if (shares <= 0) {
        return OpResult::failure(ErrorCode::INVALID_AMOUNT, "shares must be positive");
    }

    WithdrawReceipt receipt;
    const EpochSeconds now = clock_->now();
    auto status = mutate(id, [&](StrategyBook& book) -> OpResult {
        Strategy& s = book.strategy;
        if (s.status == StrategyStatus::EMERGENCY_STOP) {
            return OpResult::failure(ErrorCode::NOT_ACTIVE, "strategy is emergency stopped");
        }

        auto it = book.positions.find(investor);
        if (it == book.positions.end() || it->second.shares < shares) {
            const Shares owned = (it == book.positions.end()) ? 0 : it->second.shares;
            return OpResult::failure(ErrorCode::INSUFFICIENT_SHARES,
                                     "owns " + std::to_string(owned) + " shares, requested " + std::to_string(shares));
        }
        InvestorPosition& pos = it->second;

        const Amount gross = (shares == s.total_shares)
            ? s.total_capital
            : fixed::mulDiv(shares, s.total_capital, s.total_shares);

        // Closing a position removes exactly what it contributed; a partial
        // redemption never removes the position's last unit of capital.
        const bool closing = (shares == pos.shares);
        Amount capital_removed = closing ? pos.capital_contributed
                                         : std::min(gross, pos.capital_contributed - 1);
        capital_removed = std::max<Amount>(capital_removed, 0);

        const Amount fee = FeeCalculator::managementFee(
            capital_removed, s.management_fee_bps_per_year, now - pos.entry_time);

        pos.shares -= shares;
        pos.capital_contributed -= capital_removed;
        s.total_shares -= shares;
        s.total_capital -= capital_removed;
        s.active_capital -= std::min(capital_removed, s.active_capital);
        // Compounded profit belongs to no one once the last share is burned.
        if (s.total_shares == 0 && s.active_capital > 0) {
            LOG_INFO("[Ledger] strategy {} fully redeemed, releasing {} compounded capital",
                     s.id, s.active_capital);
            s.active_capital = 0;
        }

        if (closing) {
            book.positions.erase(it);
        }

        receipt.asset = s.quote_asset;
        receipt.shares_burned = shares;
        receipt.gross_amount = capital_removed;
        receipt.management_fee = fee;
        receipt.payout = capital_removed - fee;
        receipt.position_closed = closing;

        if (after) {
            return after(book);
        }
        return OpResult::success();
    });

    if (!status.ok()) {
        return status;
    }
    return ValueResult<WithdrawReceipt>::of(receipt);
}

OpResult LedgerStore::pause(StrategyId id) {
    return mutate(id, [](StrategyBook& book) -> OpResult {
        if (book.strategy.status != StrategyStatus::ACTIVE) {
            return OpResult::failure(ErrorCode::INVALID_STATUS_TRANSITION,
                                     std::string("cannot pause from ") + toString(book.strategy.status));
        }
        book.strategy.status = StrategyStatus::PAUSED;
        return OpResult::success();
    });
}

OpResult LedgerStore::resume(StrategyId id) {
    return mutate(id, [](StrategyBook& book) -> OpResult {
        if (book.strategy.status != StrategyStatus::PAUSED) {
            return OpResult::failure(ErrorCode::INVALID_STATUS_TRANSITION,
                                     std::string("cannot resume from ") + toString(book.strategy.status));
        }
        book.strategy.status = StrategyStatus::ACTIVE;
        return OpResult::success();
    });
}

OpResult LedgerStore::emergencyStop(StrategyId id) {
    Slot* slot = findSlot(id);
    if (!slot) {
        return OpResult::failure(ErrorCode::STRATEGY_NOT_FOUND, "strategy " + std::to_string(id));
    }

    // The flag takes effect for every later mutation even if the section is
    // busy right now.
    slot->emergency_stop.store(true);

    auto published = mutate(id, [](StrategyBook& book) -> OpResult {
        book.strategy.status = StrategyStatus::EMERGENCY_STOP;
        return OpResult::success();
    });
    if (!published.ok()) {
        LOG_WARN("[Ledger] strategy {} stop flagged; snapshot update deferred: {}", id, published.message);
    }
    return OpResult::success();
}

OpResult LedgerStore::updateParams(StrategyId id, const StrategyParams& params) {
    return mutate(id, [&](StrategyBook& book) -> OpResult {
        Strategy& s = book.strategy;
        if (s.status == StrategyStatus::EMERGENCY_STOP) {
            return OpResult::failure(ErrorCode::NOT_ACTIVE, "strategy is emergency stopped");
        }
        auto check = validateParams(s.type, params);
        if (!check.ok()) {
            return check;
        }
        const bool geometry_changed = params.grid_levels != s.params.grid_levels ||
                                      params.grid_spacing != s.params.grid_spacing;
        if (s.type == StrategyType::GRID_TRADING && geometry_changed &&
            s.status != StrategyStatus::INACTIVE) {
            return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                     "grid geometry is fixed once the ladder is seeded");
        }
        s.params = params;
        return OpResult::success();
    });
}

ValueResult<Amount> LedgerStore::drainPerformanceFees(StrategyId id) {
    Amount drained = 0;
    auto status = mutate(id, [&](StrategyBook& book) -> OpResult {
        drained = book.strategy.accrued_performance_fee;
        book.strategy.accrued_performance_fee = 0;
        return OpResult::success();
    });
    if (!status.ok()) {
        return status;
    }
    return ValueResult<Amount>::of(drained);
}

// ===== Exclusive section =====

OpResult LedgerStore::mutate(StrategyId id, const Mutation& fn, LockMode mode) {
    Slot* slot = findSlot(id);
    if (!slot) {
        return OpResult::failure(ErrorCode::STRATEGY_NOT_FOUND, "strategy " + std::to_string(id));
    }

    std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
    const bool acquired = (mode == LockMode::TRY_ONCE)
        ? lock.try_lock()
        : lock.try_lock_for(lock_timeout_);
    if (!acquired) {
        return OpResult::failure(ErrorCode::BUSY, "strategy " + std::to_string(id) + " is busy");
    }

    StrategyBook working = *std::atomic_load(&slot->published);
    if (slot->emergency_stop.load()) {
        working.strategy.status = StrategyStatus::EMERGENCY_STOP;
    }

    OpResult result = fn(working);
    if (!result.ok()) {
        // A stop raised while this mutation ran must still reach readers.
        if (slot->emergency_stop.load()) {
            publishStopped(*slot);
        }
        return result;
    }

    if (slot->emergency_stop.load()) {
        working.strategy.status = StrategyStatus::EMERGENCY_STOP;
    }
    std::shared_ptr<const StrategyBook> next = std::make_shared<const StrategyBook>(std::move(working));
    std::atomic_store(&slot->published, next);
    return result;
}

void LedgerStore::publishStopped(Slot& slot) {
    auto current = std::atomic_load(&slot.published);
    if (current->strategy.status == StrategyStatus::EMERGENCY_STOP) {
        return;
    }
    auto stopped = std::make_shared<StrategyBook>(*current);
    stopped->strategy.status = StrategyStatus::EMERGENCY_STOP;
    std::atomic_store(&slot.published, std::shared_ptr<const StrategyBook>(std::move(stopped)));
}

LedgerStore::Slot* LedgerStore::findSlot(StrategyId id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second.get();
}

// ===== Queries =====

std::shared_ptr<const StrategyBook> LedgerStore::snapshot(StrategyId id) const {
    Slot* slot = findSlot(id);
    if (!slot) {
        return nullptr;
    }
    return std::atomic_load(&slot->published);
}

std::optional<Strategy> LedgerStore::getStrategy(StrategyId id) const {
    auto book = snapshot(id);
    if (!book) {
        return std::nullopt;
    }
    return book->strategy;
}

std::optional<StrategyMetrics> LedgerStore::getMetrics(StrategyId id) const {
    auto book = snapshot(id);
    if (!book) {
        return std::nullopt;
    }
    return book->strategy.metrics;
}

std::vector<InvestorPosition> LedgerStore::getPositions(StrategyId id) const {
    std::vector<InvestorPosition> out;
    auto book = snapshot(id);
    if (!book) {
        return out;
    }
    out.reserve(book->positions.size());
    for (const auto& item : book->positions) {
        out.push_back(item.second);
    }
    return out;
}

std::optional<InvestorPosition> LedgerStore::getPosition(StrategyId id, const std::string& investor) const {
    auto book = snapshot(id);
    if (!book) {
        return std::nullopt;
    }
    auto it = book->positions.find(investor);
    if (it == book->positions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<GridOrder> LedgerStore::getGridOrders(StrategyId id, bool active_only) const {
    std::vector<GridOrder> out;
    auto book = snapshot(id);
    if (!book) {
        return out;
    }
    for (const auto& order : book->grid_orders) {
        if (!active_only || order.is_active) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Strategy> LedgerStore::listStrategies() const {
    std::vector<std::shared_ptr<const StrategyBook>> books;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        books.reserve(slots_.size());
        for (const auto& item : slots_) {
            books.push_back(std::atomic_load(&item.second->published));
        }
    }
    std::vector<Strategy> out;
    out.reserve(books.size());
    for (const auto& book : books) {
        out.push_back(book->strategy);
    }
    return out;
}

std::vector<Strategy> LedgerStore::listActiveStrategies() const {
    auto all = listStrategies();
    all.erase(std::remove_if(all.begin(), all.end(), [](const Strategy& s) {
        return s.status != StrategyStatus::ACTIVE;
    }), all.end());
    return all;
}

// ===== Opportunities =====

bool LedgerStore::addOpportunity(const ArbitrageOpportunity& opportunity) {
    if (opportunity.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(opportunity_mutex_);
    return opportunities_.emplace(opportunity.id, opportunity).second;
}

std::optional<ArbitrageOpportunity> LedgerStore::takeOpportunity(const std::string& id) {
    std::lock_guard<std::mutex> lock(opportunity_mutex_);
    auto it = opportunities_.find(id);
    if (it == opportunities_.end()) {
        return std::nullopt;
    }
    ArbitrageOpportunity taken = it->second;
    opportunities_.erase(it);
    return taken;
}

bool LedgerStore::hasOpportunity(const std::string& id) const {
    std::lock_guard<std::mutex> lock(opportunity_mutex_);
    return opportunities_.count(id) > 0;
}

std::size_t LedgerStore::opportunityCount() const {
    std::lock_guard<std::mutex> lock(opportunity_mutex_);
    return opportunities_.size();
}

// ===== Validation =====

OpResult LedgerStore::validateParams(StrategyType type, const StrategyParams& params) {
    if (params.trade_size_bps < 0 || params.trade_size_bps > kBpsDenominator ||
        params.max_slippage_bps < 0 || params.max_drawdown_bps < 0 ||
        params.stop_loss_bps < 0 || params.take_profit_bps < 0) {
        return OpResult::failure(ErrorCode::INVALID_PARAMS, "basis-point parameter out of range");
    }

    switch (type) {
        case StrategyType::GRID_TRADING:
            if (params.grid_levels <= 0 || params.grid_spacing <= 0.0) {
                return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                         "grid needs positive grid_levels and grid_spacing");
            }
            break;
        case StrategyType::DCA:
            if (params.dca_interval_sec <= 0 || params.dca_amount <= 0 || params.dca_total_budget < 0) {
                return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                         "dca needs positive interval and amount");
            }
            break;
        case StrategyType::MOMENTUM:
        case StrategyType::MEAN_REVERSION:
            if (params.rebalance_threshold_bps <= 0) {
                return OpResult::failure(ErrorCode::INVALID_PARAMS,
                                         "trend strategies need a positive rebalance threshold");
            }
            break;
        default:
            break;
    }
    return OpResult::success();
}

} // namespace ledger
} // namespace stratvault
