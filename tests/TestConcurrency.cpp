#include "engine/StrategyController.h"
#include "core/adapters/PaperExecutionPort.h"
#include "core/adapters/PaperPriceFeed.h"
#include "core/adapters/PaperSettlement.h"
#include "core/adapters/StaticRoleAuthorizer.h"

#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace stratvault;
using stratvault::engine::StrategyController;
using stratvault::ledger::CreateStrategyRequest;
using stratvault::ledger::StrategyBook;

namespace {

std::unique_ptr<StrategyController> makeController(int lock_timeout_ms) {
    auto prices = std::make_shared<core::PaperPriceFeed>();
    prices->setPrice("ETH", 2000.0);
    auto authorizer = std::make_shared<core::StaticRoleAuthorizer>();
    authorizer->grant("admin", Role::ADMIN);
    authorizer->grant("manager", Role::STRATEGY_MANAGER);
    authorizer->grant("op", Role::OPERATOR);

    engine::VaultConfig config;
    config.lock_timeout_ms = lock_timeout_ms;
    return std::make_unique<StrategyController>(
        config, prices,
        std::make_shared<core::PaperSettlement>(),
        authorizer,
        std::make_shared<core::PaperExecutionPort>(),
        nullptr,
        std::make_shared<ManualClock>(1700000000));
}

StrategyId createDca(StrategyController& controller) {
    CreateStrategyRequest r;
    r.type = StrategyType::DCA;
    r.base_asset = "ETH";
    r.quote_asset = "USDT";
    r.params.dca_interval_sec = 3600;
    r.params.dca_amount = 100;
    auto created = controller.createStrategy("manager", r);
    assert(created.ok());
    assert(controller.activate("manager", created.value).ok());
    return created.value;
}

// Holds a strategy's exclusive section on a background thread until released.
class SectionHolder {
public:
    SectionHolder(StrategyController& controller, StrategyId id, bool fail = false) {
        std::shared_future<void> release = release_.get_future().share();
        worker_ = std::thread([&controller, id, fail, release, this]() {
            auto result = controller.ledger().mutate(id, [&](StrategyBook& book) {
                entered_.set_value();
                release.wait();
                if (fail) {
                    return OpResult::failure(ErrorCode::BELOW_MINIMUM, "held mutation rejected");
                }
                book.strategy.metrics.volatility = 0.5;
                return OpResult::success();
            });
            committed_ = result.ok();
        });
        entered_.get_future().wait();
    }

    bool release() {
        release_.set_value();
        worker_.join();
        return committed_;
    }

private:
    std::promise<void> entered_;
    std::promise<void> release_;
    std::thread worker_;
    std::atomic<bool> committed_{false};
};

}

int main() {
    // held section: rebalance skips, bounded mutations time out with Busy
    {
        auto controller = makeController(20);
        const StrategyId id = createDca(*controller);
        assert(controller->invest("alice", id, 1000).ok());

        SectionHolder holder(*controller, id);
        auto skipped = controller->rebalance("op", id);
        assert(skipped.error == ErrorCode::BUSY);
        assert(skipped.retryable());
        assert(skipped.value.skipped);

        auto busy = controller->invest("bob", id, 500);
        assert(busy.error == ErrorCode::BUSY);

        // reads never wait on the section
        auto s = controller->getStrategy(id);
        assert(s && s->total_capital == 1000);

        assert(holder.release());
        assert(controller->getMetrics(id)->volatility == 0.5);
        assert(!controller->getPosition(id, "bob"));

        auto after = controller->rebalance("op", id);
        assert(after.ok() && after.value.traded);
        std::cout << "[TEST] busy section PASSED\n";
    }

    // emergency stop wins over a mutation in flight
    {
        auto controller = makeController(20);
        const StrategyId id = createDca(*controller);

        SectionHolder holder(*controller, id);
        assert(controller->emergencyStop("admin", id).ok());
        assert(holder.release());
        assert(controller->getStrategy(id)->status == StrategyStatus::EMERGENCY_STOP);
        assert(controller->invest("alice", id, 1000).error == ErrorCode::NOT_ACTIVE);
        std::cout << "[TEST] emergency stop under contention PASSED\n";
    }

    // a stop raised during a mutation that then fails still reaches readers
    {
        auto controller = makeController(20);
        const StrategyId id = createDca(*controller);
        assert(controller->listActiveStrategies().size() == 1);

        SectionHolder holder(*controller, id, true);
        assert(controller->emergencyStop("admin", id).ok());
        assert(!holder.release());
        assert(controller->getStrategy(id)->status == StrategyStatus::EMERGENCY_STOP);
        assert(controller->listActiveStrategies().empty());
        assert(controller->invest("alice", id, 1000).error == ErrorCode::NOT_ACTIVE);
        assert(controller->getStrategy(id)->status == StrategyStatus::EMERGENCY_STOP);
        std::cout << "[TEST] emergency stop behind failed mutation PASSED\n";
    }

    // strategies do not contend with each other
    {
        auto controller = makeController(20);
        const StrategyId a = createDca(*controller);
        const StrategyId b = createDca(*controller);

        SectionHolder holder(*controller, a);
        assert(controller->invest("alice", b, 1000).ok());
        assert(controller->rebalance("op", b).ok());
        assert(holder.release());
        std::cout << "[TEST] independent sections PASSED\n";
    }

    // parallel deposits keep the ledger consistent
    {
        auto controller = makeController(5000);
        const StrategyId id = createDca(*controller);

        constexpr int kThreads = 8;
        constexpr int kDeposits = 100;
        std::atomic<bool> done{false};
        std::atomic<int> torn_reads{0};

        std::thread reader([&]() {
            while (!done.load()) {
                auto book = controller->ledger().snapshot(id);
                if (book->strategy.total_capital != book->sumContributedCapital() ||
                    book->strategy.total_shares != book->sumShares()) {
                    torn_reads++;
                }
            }
        });

        std::vector<std::thread> writers;
        for (int t = 0; t < kThreads; t++) {
            writers.emplace_back([&, t]() {
                const std::string investor = "investor-" + std::to_string(t);
                for (int i = 0; i < kDeposits; i++) {
                    auto r = controller->invest(investor, id, 10);
                    assert(r.ok());
                }
            });
        }
        for (auto& w : writers) {
            w.join();
        }
        done.store(true);
        reader.join();

        auto s = controller->getStrategy(id);
        assert(s->total_capital == kThreads * kDeposits * 10);
        assert(s->total_shares == kThreads * kDeposits * 10);
        assert(controller->getPositions(id).size() == static_cast<std::size_t>(kThreads));
        for (const auto& pos : controller->getPositions(id)) {
            assert(pos.shares == kDeposits * 10);
            assert(pos.capital_contributed == kDeposits * 10);
        }
        assert(torn_reads.load() == 0);
        std::cout << "[TEST] parallel deposits PASSED\n";
    }

    std::cout << "[TEST] Concurrency PASSED\n";
    return 0;
}
