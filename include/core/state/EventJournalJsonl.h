#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace stratvault {
namespace core {

// One JSON object per line, appended and flushed per event.
// Reopening an existing file resumes after its highest seq; unreadable lines are skipped.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    std::uint64_t append(const JournalEvent& event) override;
    std::size_t replay(std::uint64_t from_seq, const Visitor& visit) const override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }
    std::size_t skippedLines() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t skipped_lines_ = 0;
};

} // namespace core
} // namespace stratvault
