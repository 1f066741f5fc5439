#pragma once

#include "common/Types.h"

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace stratvault {
namespace ledger {

// Everything the ledger owns for one strategy. Published as an immutable
// snapshot after each committed mutation, so every mutation copies it.
struct StrategyBook {
    // Filled rungs kept in the book; older fills live only in the event journal.
    static constexpr std::size_t kRetainedFilledOrders = 256;

    Strategy strategy;
    std::map<std::string, InvestorPosition> positions;  // investor id -> position
    std::vector<GridOrder> grid_orders;                 // creation order
    std::uint64_t next_order_id = 1;

    // Drops the oldest filled rungs beyond `keep`. Active rungs are never touched.
    // Returns the number removed.
    std::size_t pruneFilledOrders(std::size_t keep = kRetainedFilledOrders) {
        std::size_t filled = 0;
        for (const auto& o : grid_orders) {
            filled += o.is_active ? 0 : 1;
        }
        if (filled <= keep) {
            return 0;
        }
        std::size_t to_drop = filled - keep;
        const std::size_t dropped = to_drop;
        grid_orders.erase(std::remove_if(grid_orders.begin(), grid_orders.end(),
                                         [&to_drop](const GridOrder& o) {
                                             if (o.is_active || to_drop == 0) {
                                                 return false;
                                             }
                                             --to_drop;
                                             return true;
                                         }),
                          grid_orders.end());
        return dropped;
    }

    std::size_t activeGridOrderCount() const {
        std::size_t n = 0;
        for (const auto& o : grid_orders) {
            if (o.is_active) {
                ++n;
            }
        }
        return n;
    }

    Amount sumContributedCapital() const {
        Amount total = 0;
        for (const auto& item : positions) {
            total += item.second.capital_contributed;
        }
        return total;
    }

    Shares sumShares() const {
        Shares total = 0;
        for (const auto& item : positions) {
            total += item.second.shares;
        }
        return total;
    }
};

} // namespace ledger
} // namespace stratvault
