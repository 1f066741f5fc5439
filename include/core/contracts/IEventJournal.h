#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "core/model/VaultEvents.h"

namespace stratvault {
namespace core {

// Ordered audit trail of vault events. Sequence numbers start at 1.
class IEventJournal {
public:
    using Visitor = std::function<void(const JournalEvent&)>;

    virtual ~IEventJournal() = default;

    // Stores the event under the next sequence number and returns it; 0 when nothing was stored.
    virtual std::uint64_t append(const JournalEvent& event) = 0;
    // Visits events with seq >= from_seq in order. Returns the number visited.
    virtual std::size_t replay(std::uint64_t from_seq, const Visitor& visit) const = 0;
    virtual std::uint64_t lastSeq() const = 0;

    std::vector<JournalEvent> readFrom(std::uint64_t from_seq) const {
        std::vector<JournalEvent> out;
        replay(from_seq, [&out](const JournalEvent& e) { out.push_back(e); });
        return out;
    }

    std::vector<JournalEvent> strategyHistory(StrategyId strategy_id, std::uint64_t from_seq = 1) const {
        std::vector<JournalEvent> out;
        replay(from_seq, [&out, strategy_id](const JournalEvent& e) {
            if (e.strategy_id == strategy_id) {
                out.push_back(e);
            }
        });
        return out;
    }
};

} // namespace core
} // namespace stratvault
