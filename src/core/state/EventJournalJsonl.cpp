#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <fstream>
#include <string>

namespace stratvault {
namespace core {

namespace {

// Parses one journal row. Returns false and logs when the row is unusable.
bool decodeRow(const std::string& row, JournalEvent& event, const std::filesystem::path& file) {
    try {
        nlohmann::json::parse(row).get_to(event);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("[EventJournal] {}: unreadable row skipped ({})", file.string(), e.what());
        return false;
    }
}

} // namespace

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    JournalEvent event;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        if (decodeRow(row, event, file_path_)) {
            last_seq_ = (std::max)(last_seq_, event.seq);
        } else {
            ++skipped_lines_;
        }
    }
    LOG_INFO("[EventJournal] opened {} at seq {}", file_path_.string(), last_seq_);
}

std::uint64_t EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!utils::PathUtils::ensureParentDirectory(file_path_, ec)) {
        LOG_ERROR("[EventJournal] cannot create {}: {}", file_path_.parent_path().string(), ec.message());
        return 0;
    }

    JournalEvent stored = event;
    stored.seq = last_seq_ + 1;

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    out << nlohmann::json(stored).dump() << '\n';
    out.flush();
    if (!out.good()) {
        LOG_ERROR("[EventJournal] write failed for seq {} ({})", stored.seq, toString(stored.type));
        return 0;
    }
    last_seq_ = stored.seq;
    return last_seq_;
}

std::size_t EventJournalJsonl::replay(std::uint64_t from_seq, const Visitor& visit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return 0;
    }

    std::size_t visited = 0;
    std::string row;
    JournalEvent event;
    while (std::getline(in, row)) {
        if (row.empty() || !decodeRow(row, event, file_path_) || event.seq < from_seq) {
            continue;
        }
        visit(event);
        ++visited;
    }
    return visited;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::skippedLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_lines_;
}

} // namespace core
} // namespace stratvault
