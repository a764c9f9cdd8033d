#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/model/JournalTypes.h"

namespace phoenix {
namespace core {

// Durable, ordered record of engine lifecycle events. seq is assigned on
// append, starts at 1 and never repeats, including across reopen.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    // False when the row could not be persisted; no seq is consumed then
    virtual bool append(const JournalEvent& event) = 0;

    // Highest seq written so far, 0 for an empty journal
    virtual std::uint64_t lastSeq() const = 0;

    // Rows with seq >= from_seq, oldest first
    virtual std::vector<JournalEvent> readFrom(std::uint64_t from_seq) = 0;

    // Stored rows that could not be read back
    virtual std::size_t malformedRows() const = 0;
};

} // namespace core
} // namespace phoenix
