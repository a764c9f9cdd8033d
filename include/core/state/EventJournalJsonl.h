#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace phoenix {
namespace core {

// One JSON object per line, appended in seq order. Reopening an existing
// file resumes numbering after its highest seq; rows that fail to parse
// are skipped and counted.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::uint64_t lastSeq() const override;
    std::vector<JournalEvent> readFrom(std::uint64_t from_seq) override;
    std::size_t malformedRows() const override;

    static std::string toString(JournalEventType type);
    static std::optional<JournalEventType> parseType(const std::string& value);

    static std::string encode(const JournalEvent& event);
    static std::optional<JournalEvent> decode(const std::string& row);

private:
    bool ensureOpen();

    std::filesystem::path file_path_;
    std::ofstream out_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t malformed_rows_ = 0;
};

} // namespace core
} // namespace phoenix
