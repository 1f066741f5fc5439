#include "ledger/LedgerStore.h"

#include <cassert>
#include <iostream>
#include <memory>

using namespace stratvault;
using namespace stratvault::ledger;

namespace {

CreateStrategyRequest gridRequest() {
    CreateStrategyRequest r;
    r.type = StrategyType::GRID_TRADING;
    r.base_asset = "BTC";
    r.quote_asset = "USDT";
    r.min_investment = 100;
    r.max_investment = 5000;
    r.params.grid_levels = 5;
    r.params.grid_spacing = 100.0;
    r.creator = "manager";
    return r;
}

void checkInvariants(const LedgerStore& store, StrategyId id) {
    auto book = store.snapshot(id);
    assert(book);
    assert(book->strategy.total_capital == book->sumContributedCapital());
    assert(book->strategy.total_shares == book->sumShares());
    for (const auto& item : book->positions) {
        assert((item.second.shares > 0) == (item.second.capital_contributed > 0));
    }
    if (book->strategy.total_shares == 0) {
        assert(book->strategy.active_capital == 0);
    }
}

}

int main() {
    auto clock = std::make_shared<ManualClock>(1000000);
    LedgerStore store(clock, std::chrono::milliseconds(100));

    // creation validation
    {
        auto r = gridRequest();
        r.quote_asset = "BTC";
        assert(store.createStrategy(r).error == ErrorCode::INVALID_ASSET_PAIR);

        r = gridRequest();
        r.base_asset.clear();
        assert(store.createStrategy(r).error == ErrorCode::INVALID_ASSET_PAIR);

        r = gridRequest();
        r.performance_fee_bps = 2001;
        assert(store.createStrategy(r).error == ErrorCode::FEE_TOO_HIGH);

        r = gridRequest();
        r.management_fee_bps_per_year = 501;
        assert(store.createStrategy(r).error == ErrorCode::FEE_TOO_HIGH);

        r = gridRequest();
        r.min_investment = 1000;
        r.max_investment = 500;
        assert(store.createStrategy(r).error == ErrorCode::INVALID_PARAMS);

        r = gridRequest();
        r.params.grid_levels = 0;
        assert(store.createStrategy(r).error == ErrorCode::INVALID_PARAMS);

        r = gridRequest();
        r.performance_fee_bps = 2000;
        assert(store.createStrategy(r).ok());
        std::cout << "[TEST] create validation PASSED\n";
    }

    const auto created = store.createStrategy(gridRequest());
    assert(created.ok());
    const StrategyId id = created.value;

    // lifecycle
    {
        auto s = store.getStrategy(id);
        assert(s && s->status == StrategyStatus::INACTIVE);
        assert(s->created_at == 1000000);
        assert(store.invest(id, "alice", 1000).error == ErrorCode::NOT_ACTIVE);
        assert(store.pause(id).error == ErrorCode::INVALID_STATUS_TRANSITION);

        assert(store.activate(id).ok());
        assert(store.activate(id).error == ErrorCode::ALREADY_ACTIVE);
        assert(store.getStrategy(id)->status == StrategyStatus::ACTIVE);
        assert(store.listActiveStrategies().size() == 1);
        std::cout << "[TEST] lifecycle PASSED\n";
    }

    // share minting
    {
        auto a = store.invest(id, "alice", 1000);
        assert(a.ok());
        assert(a.value.shares_minted == 1000);

        auto b = store.invest(id, "bob", 500);
        assert(b.ok());
        assert(b.value.shares_minted == 500);

        auto a2 = store.invest(id, "alice", 200);
        assert(a2.ok());
        assert(a2.value.position_shares == 1200);

        auto s = store.getStrategy(id);
        assert(s->total_capital == 1700);
        assert(s->active_capital == 1700);
        assert(s->total_shares == 1700);
        assert(store.getPositions(id).size() == 2);
        checkInvariants(store, id);
        std::cout << "[TEST] share minting PASSED\n";
    }

    // deposit bounds
    {
        assert(store.invest(id, "carol", 0).error == ErrorCode::INVALID_AMOUNT);
        assert(store.invest(id, "carol", -5).error == ErrorCode::INVALID_AMOUNT);
        assert(store.invest(id, "carol", 50).error == ErrorCode::BELOW_MINIMUM);
        assert(store.invest(id, "carol", 6000).error == ErrorCode::ABOVE_MAXIMUM);
        assert(store.invest(id, "", 1000).error == ErrorCode::INVALID_PARAMS);
        assert(!store.getPosition(id, "carol"));
        assert(store.getStrategy(id)->total_capital == 1700);
        std::cout << "[TEST] deposit bounds PASSED\n";
    }

    // withdrawal validation and partial redemption
    {
        assert(store.withdraw(id, "alice", 0).error == ErrorCode::INVALID_AMOUNT);
        assert(store.withdraw(id, "nobody", 10).error == ErrorCode::INSUFFICIENT_SHARES);
        assert(store.withdraw(id, "bob", 501).error == ErrorCode::INSUFFICIENT_SHARES);

        auto w = store.withdraw(id, "alice", 400);
        assert(w.ok());
        assert(w.value.gross_amount == 400);
        assert(w.value.management_fee == 0);
        assert(w.value.payout == 400);
        assert(!w.value.position_closed);
        assert(w.value.asset == "USDT");

        auto pos = store.getPosition(id, "alice");
        assert(pos && pos->shares == 800 && pos->capital_contributed == 800);
        assert(store.getStrategy(id)->total_capital == 1300);
        checkInvariants(store, id);
        std::cout << "[TEST] partial withdrawal PASSED\n";
    }

    // full withdrawal minus prorated management fee
    {
        auto r = gridRequest();
        r.max_investment = 0;
        r.management_fee_bps_per_year = 200;
        const StrategyId fee_id = store.createStrategy(r).value;
        assert(store.activate(fee_id).ok());
        assert(store.invest(fee_id, "alice", 10000).ok());

        clock->advance(kSecondsPerYear);
        auto w = store.withdraw(fee_id, "alice", 10000);
        assert(w.ok());
        assert(w.value.gross_amount == 10000);
        assert(w.value.management_fee == 200);
        assert(w.value.payout == 9800);
        assert(w.value.position_closed);
        assert(!store.getPosition(fee_id, "alice"));

        auto s = store.getStrategy(fee_id);
        assert(s->total_capital == 0);
        assert(s->total_shares == 0);
        assert(s->active_capital == 0);
        checkInvariants(store, fee_id);

        // empty strategy mints 1:1 again
        auto again = store.invest(fee_id, "bob", 700);
        assert(again.ok() && again.value.shares_minted == 700);
        std::cout << "[TEST] full withdrawal PASSED\n";
    }

    // capital grown by compounding is released when the last share leaves
    {
        auto r = gridRequest();
        r.max_investment = 0;
        const StrategyId id = store.createStrategy(r).value;
        assert(store.activate(id).ok());
        assert(store.invest(id, "carol", 1000).ok());
        assert(store.invest(id, "dan", 1000).ok());
        assert(store.mutate(id, [](StrategyBook& book) {
            book.strategy.active_capital += 400;
            return OpResult::success();
        }).ok());

        assert(store.withdraw(id, "carol", 1000).ok());
        assert(store.getStrategy(id)->active_capital == 1400);
        checkInvariants(store, id);

        auto last = store.withdraw(id, "dan", 1000);
        assert(last.ok() && last.value.payout == 1000);
        assert(store.getStrategy(id)->active_capital == 0);
        checkInvariants(store, id);
        std::cout << "[TEST] compounded capital release PASSED\n";
    }

    // pause / resume
    {
        assert(store.pause(id).ok());
        assert(store.getStrategy(id)->status == StrategyStatus::PAUSED);
        assert(store.invest(id, "alice", 1000).error == ErrorCode::NOT_ACTIVE);
        assert(store.withdraw(id, "bob", 100).ok());
        assert(store.pause(id).error == ErrorCode::INVALID_STATUS_TRANSITION);
        assert(store.resume(id).ok());
        assert(store.resume(id).error == ErrorCode::INVALID_STATUS_TRANSITION);
        checkInvariants(store, id);
        std::cout << "[TEST] pause/resume PASSED\n";
    }

    // parameter updates
    {
        auto params = store.getStrategy(id)->params;
        params.max_slippage_bps = 30;
        assert(store.updateParams(id, params).ok());
        assert(store.getStrategy(id)->params.max_slippage_bps == 30);

        params.grid_levels = 8;
        assert(store.updateParams(id, params).error == ErrorCode::INVALID_PARAMS);

        params = store.getStrategy(id)->params;
        params.trade_size_bps = 10001;
        assert(store.updateParams(id, params).error == ErrorCode::INVALID_PARAMS);
        std::cout << "[TEST] updateParams PASSED\n";
    }

    // failing activation hook commits nothing
    {
        const StrategyId hook_id = store.createStrategy(gridRequest()).value;
        auto r = store.activate(hook_id, [](StrategyBook&) {
            return OpResult::failure(ErrorCode::PRICE_UNAVAILABLE, "no price");
        });
        assert(r.error == ErrorCode::PRICE_UNAVAILABLE);
        assert(store.getStrategy(hook_id)->status == StrategyStatus::INACTIVE);
        std::cout << "[TEST] activation hook rollback PASSED\n";
    }

    // performance fee drain
    {
        assert(store.mutate(id, [](StrategyBook& book) {
            book.strategy.accrued_performance_fee = 50;
            return OpResult::success();
        }).ok());
        auto first = store.drainPerformanceFees(id);
        assert(first.ok() && first.value == 50);
        auto second = store.drainPerformanceFees(id);
        assert(second.ok() && second.value == 0);
        std::cout << "[TEST] fee drain PASSED\n";
    }

    // emergency stop is terminal
    {
        assert(store.emergencyStop(9999).error == ErrorCode::STRATEGY_NOT_FOUND);
        assert(store.emergencyStop(id).ok());
        auto s = store.getStrategy(id);
        assert(s && s->status == StrategyStatus::EMERGENCY_STOP);
        assert(store.invest(id, "alice", 1000).error == ErrorCode::NOT_ACTIVE);
        assert(store.withdraw(id, "alice", 10).error == ErrorCode::NOT_ACTIVE);
        assert(store.resume(id).error == ErrorCode::INVALID_STATUS_TRANSITION);
        assert(store.activate(id).error == ErrorCode::ALREADY_ACTIVE);
        assert(store.updateParams(id, s->params).error == ErrorCode::NOT_ACTIVE);
        assert(store.emergencyStop(id).ok());
        // reads keep working
        assert(store.getPositions(id).size() == 2);
        checkInvariants(store, id);
        std::cout << "[TEST] emergency stop PASSED\n";
    }

    // opportunities are consumed once
    {
        ArbitrageOpportunity opp;
        opp.id = "opp-1";
        opp.timestamp = clock->now();
        assert(store.addOpportunity(opp));
        assert(!store.addOpportunity(opp));
        ArbitrageOpportunity unnamed;
        assert(!store.addOpportunity(unnamed));
        assert(store.hasOpportunity("opp-1"));
        assert(store.opportunityCount() == 1);
        auto taken = store.takeOpportunity("opp-1");
        assert(taken && taken->id == "opp-1");
        assert(!store.takeOpportunity("opp-1"));
        assert(store.opportunityCount() == 0);
        std::cout << "[TEST] opportunities PASSED\n";
    }

    assert(!store.getStrategy(9999));
    assert(store.getPositions(9999).empty());
    assert(store.mutate(9999, [](StrategyBook&) { return OpResult::success(); }).error ==
           ErrorCode::STRATEGY_NOT_FOUND);

    std::cout << "[TEST] LedgerStore PASSED\n";
    return 0;
}
