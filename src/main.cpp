#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/adapters/PaperExecutionPort.h"
#include "core/adapters/PaperPriceFeed.h"
#include "core/adapters/PaperSettlement.h"
#include "core/adapters/StaticRoleAuthorizer.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/StrategyController.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace stratvault;

namespace {

constexpr EpochSeconds kHour = 3600;
constexpr EpochSeconds kDay = 24 * kHour;

void printStrategy(const engine::StrategyController& controller, StrategyId id) {
    const auto s = controller.getStrategy(id);
    if (!s) {
        return;
    }
    std::cout << "  #" << s->id << " " << toString(s->type) << " " << s->base_asset << "/" << s->quote_asset
              << " [" << toString(s->status) << "]"
              << " capital=" << s->total_capital
              << " active=" << s->active_capital
              << " shares=" << s->total_shares
              << " trades=" << s->metrics.total_trades
              << " pnl=" << s->metrics.total_return << "\n";
}

void report(const std::string& step, const OpResult& result) {
    std::cout << "  " << std::left << std::setw(34) << step
              << (result.ok() ? "ok" : toString(result.error));
    if (!result.ok() && !result.message.empty()) {
        std::cout << " (" << result.message << ")";
    }
    std::cout << "\n";
}

// Scripted paper session: one strategy of each engine type, driven by a
// manual clock and a settable oracle.
int runPaperScenario(const engine::VaultConfig& cfg) {
    auto clock = std::make_shared<ManualClock>(SystemClock().now());
    auto prices = std::make_shared<core::PaperPriceFeed>();
    auto settlement = std::make_shared<core::PaperSettlement>();
    auto execution = std::make_shared<core::PaperExecutionPort>();
    auto authorizer = std::make_shared<core::StaticRoleAuthorizer>(cfg.roles);

    const std::string admin = cfg.roles.count("admin") && !cfg.roles.at("admin").empty()
        ? cfg.roles.at("admin").front() : "admin";
    const std::string manager = cfg.roles.count("strategy_manager") && !cfg.roles.at("strategy_manager").empty()
        ? cfg.roles.at("strategy_manager").front() : "manager";
    const std::string op = cfg.roles.count("operator") && !cfg.roles.at("operator").empty()
        ? cfg.roles.at("operator").front() : "operator";
    if (cfg.roles.empty()) {
        LOG_WARN("no roles configured; granting demo roles to '{}', '{}', '{}'", admin, manager, op);
        authorizer->grant(admin, Role::ADMIN);
        authorizer->grant(manager, Role::STRATEGY_MANAGER);
        authorizer->grant(op, Role::OPERATOR);
    }

    auto journal = std::make_shared<core::EventJournalJsonl>(utils::PathUtils::anchored(cfg.journal_path));

    engine::StrategyController controller(cfg, prices, settlement, authorizer, execution, journal, clock);

    prices->setPrice("BTC", 30000.0);
    prices->setPrice("ETH", 2000.0);

    // ===== Grid =====
    std::cout << "\n[grid] BTC/USDT, 5 levels, spacing 100\n";
    ledger::CreateStrategyRequest grid_req;
    grid_req.type = StrategyType::GRID_TRADING;
    grid_req.base_asset = "BTC";
    grid_req.quote_asset = "USDT";
    grid_req.min_investment = 100;
    grid_req.performance_fee_bps = 1000;
    grid_req.management_fee_bps_per_year = 200;
    grid_req.params = cfg.default_params;
    grid_req.params.grid_levels = 5;
    grid_req.params.grid_spacing = 100.0;
    auto grid = controller.createStrategy(manager, grid_req);
    report("create", grid);
    if (!grid.ok()) {
        return 1;
    }
    report("activate", controller.activate(manager, grid.value));
    report("invest alice 10000", controller.invest("alice", grid.value, 10000));
    report("invest bob 5000", controller.invest("bob", grid.value, 5000));

    clock->advance(kHour);
    prices->setPrice("BTC", 29850.0);
    auto grid_pass = controller.rebalance(op, grid.value);
    report("rebalance @29850", grid_pass);
    std::cout << "  fills=" << grid_pass.value.fills
              << " active_orders=" << controller.getGridOrders(grid.value, true).size() << "\n";
    printStrategy(controller, grid.value);

    // ===== DCA =====
    std::cout << "\n[dca] ETH/USDT, 100 per hour, budget 300\n";
    ledger::CreateStrategyRequest dca_req;
    dca_req.type = StrategyType::DCA;
    dca_req.base_asset = "ETH";
    dca_req.quote_asset = "USDT";
    dca_req.params = cfg.default_params;
    dca_req.params.dca_interval_sec = kHour;
    dca_req.params.dca_amount = 100;
    dca_req.params.dca_total_budget = 300;
    auto dca = controller.createStrategy(manager, dca_req);
    report("create", dca);
    report("activate", controller.activate(manager, dca.value));
    report("invest carol 1000", controller.invest("carol", dca.value, 1000));
    for (int tick = 1; tick <= 4; tick++) {
        auto pass = controller.rebalance(op, dca.value);
        report("tick " + std::to_string(tick) + " -> " + pass.value.action, pass);
        clock->advance(kHour);
    }
    printStrategy(controller, dca.value);

    // ===== Momentum =====
    std::cout << "\n[momentum] BTC/USDT, threshold 200 bps\n";
    ledger::CreateStrategyRequest mom_req;
    mom_req.type = StrategyType::MOMENTUM;
    mom_req.base_asset = "BTC";
    mom_req.quote_asset = "USDT";
    mom_req.performance_fee_bps = 2000;
    mom_req.params = cfg.default_params;
    mom_req.params.rebalance_threshold_bps = 200;
    mom_req.params.auto_compound = true;
    auto mom = controller.createStrategy(manager, mom_req);
    report("create", mom);
    report("activate", controller.activate(manager, mom.value));
    report("invest dave 20000", controller.invest("dave", mom.value, 20000));
    prices->setPrice("BTC", 31000.0);
    prices->setTwap("BTC", cfg.momentum_twap_window_sec, 30000.0);
    execution->queuePnl(400);
    auto mom_pass = controller.rebalance(op, mom.value);
    report("rebalance -> " + mom_pass.value.action, mom_pass);
    printStrategy(controller, mom.value);
    auto fees = controller.collectFees(admin, mom.value);
    report("collect fees " + std::to_string(fees.value), fees);

    // ===== Arbitrage =====
    std::cout << "\n[arbitrage] ETH/USDT across two venues\n";
    ledger::CreateStrategyRequest arb_req;
    arb_req.type = StrategyType::ARBITRAGE;
    arb_req.base_asset = "ETH";
    arb_req.quote_asset = "USDT";
    arb_req.params = cfg.default_params;
    auto arb = controller.createStrategy(manager, arb_req);
    report("create", arb);
    report("activate", controller.activate(manager, arb.value));
    report("invest erin 5000", controller.invest("erin", arb.value, 5000));

    ArbitrageOpportunity fresh;
    fresh.id = "eth-spread-1";
    fresh.token_a = "ETH";
    fresh.token_b = "USDT";
    fresh.venue_a = "venue-a";
    fresh.venue_b = "venue-b";
    fresh.price_a = 1995.0;
    fresh.price_b = 2005.0;
    fresh.profit = 25;
    report("register " + fresh.id, controller.registerOpportunity(op, fresh));
    clock->advance(120);
    report("execute " + fresh.id, controller.executeArbitrage(op, arb.value, fresh.id));

    ArbitrageOpportunity stale = fresh;
    stale.id = "eth-spread-2";
    stale.timestamp = clock->now();
    report("register " + stale.id, controller.registerOpportunity(op, stale));
    clock->advance(cfg.arbitrage_window_sec + 1);
    report("execute " + stale.id + " (stale)", controller.executeArbitrage(op, arb.value, stale.id));

    // ===== Withdrawals =====
    std::cout << "\n[withdraw] after 30 days\n";
    clock->advance(30 * kDay);
    const auto alice = controller.getPosition(grid.value, "alice");
    if (alice) {
        auto out = controller.withdraw("alice", grid.value, alice->shares);
        report("alice full withdrawal", out);
        std::cout << "  gross=" << out.value.gross_amount << " fee=" << out.value.management_fee
                  << " payout=" << out.value.payout << "\n";
    }
    settlement->setFailNext(1);
    auto bob = controller.withdraw("bob", grid.value, 1000);
    report("bob partial withdrawal", bob);
    for (const auto& item : controller.pendingReconciliations()) {
        std::cout << "  pending reconciliation #" << item.id << " " << item.reason
                  << " " << item.amount << " " << item.asset << " -> " << item.to << "\n";
        report("resolve #" + std::to_string(item.id), controller.resolveReconciliation(admin, item.id));
    }

    report("emergency stop grid", controller.emergencyStop(admin, grid.value));
    report("invest after stop", controller.invest("frank", grid.value, 1000));

    std::cout << "\n[summary]\n";
    for (const auto& s : controller.listStrategies()) {
        printStrategy(controller, s.id);
        std::cout << "    journal entries: " << journal->strategyHistory(s.id).size() << "\n";
    }
    std::cout << "  settled to treasury: " << settlement->totalTo(cfg.fee_recipient)
              << ", journal seq: " << journal->lastSeq() << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    try {
        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       StratVault multi-strategy vault\n";
        std::cout << "       paper session\n";
        std::cout << "=============================================\n\n";

        const std::string config_path = argc > 1 ? argv[1] : "config/stratvault.json";
        Config::getInstance().load(config_path);
        const engine::VaultConfig cfg = Config::getInstance().getVaultConfig();

        Logger::getInstance().initialize(cfg.logging);
        LOG_INFO("StratVault starting (config {})", Config::getInstance().isLoaded() ? config_path : "defaults");

        const int rc = runPaperScenario(cfg);
        LOG_INFO("Program terminated (rc={})", rc);
        Logger::getInstance().flush();
        return rc;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        return 1;
    }
}
