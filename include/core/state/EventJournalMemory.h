#pragma once

#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace stratvault {
namespace core {

// Process-local journal for paper runs and tests.
class EventJournalMemory : public IEventJournal {
public:
    std::uint64_t append(const JournalEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        events_.back().seq = events_.size();
        return events_.back().seq;
    }

    std::size_t replay(std::uint64_t from_seq, const Visitor& visit) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t first = from_seq > 0 ? static_cast<std::size_t>(from_seq - 1) : 0;
        std::size_t visited = 0;
        for (std::size_t i = first; i < events_.size(); ++i) {
            visit(events_[i]);
            ++visited;
        }
        return visited;
    }

    std::uint64_t lastSeq() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    std::size_t count(VaultEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            n += e.type == type ? 1 : 0;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<JournalEvent> events_;
};

} // namespace core
} // namespace stratvault
