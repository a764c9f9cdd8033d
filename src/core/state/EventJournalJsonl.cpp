#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <utility>

namespace phoenix {
namespace core {

namespace {
const std::pair<JournalEventType, const char*> TYPE_NAMES[] = {
    {JournalEventType::ENGAGEMENT_DECLINED, "ENGAGEMENT_DECLINED"},
    {JournalEventType::ORDER_SUBMITTED, "ORDER_SUBMITTED"},
    {JournalEventType::ORDER_UPDATED, "ORDER_UPDATED"},
    {JournalEventType::POSITION_OPENED, "POSITION_OPENED"},
    {JournalEventType::POSITION_REDUCED, "POSITION_REDUCED"},
    {JournalEventType::STOP_UPDATED, "STOP_UPDATED"},
    {JournalEventType::POSITION_CLOSED, "POSITION_CLOSED"},
};
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        if (auto event = decode(row)) {
            last_seq_ = std::max(last_seq_, event->seq);
        } else {
            ++malformed_rows_;
            LOG_WARN("Journal {}:{} unreadable, skipped", file_path_.string(), line_no);
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureOpen()) {
        return false;
    }

    JournalEvent row = event;
    row.seq = last_seq_ + 1;
    out_ << encode(row) << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERROR("Journal write failed: {}", file_path_.string());
        out_.close();
        return false;
    }
    last_seq_ = row.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t from_seq) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> rows;
    std::ifstream in(file_path_, std::ios::binary);
    std::string row;
    while (std::getline(in, row)) {
        auto event = decode(row);
        if (event && event->seq >= from_seq) {
            rows.push_back(std::move(*event));
        }
    }
    return rows;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::malformedRows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return malformed_rows_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<JournalEventType> EventJournalJsonl::parseType(const std::string& value) {
    for (const auto& entry : TYPE_NAMES) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::string EventJournalJsonl::encode(const JournalEvent& event) {
    const nlohmann::json line = {
        {"seq", event.seq},
        {"ts", event.ts},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"position_id", event.position_id},
        {"payload", event.payload},
    };
    return line.dump();
}

std::optional<JournalEvent> EventJournalJsonl::decode(const std::string& row) {
    if (row.empty()) {
        return std::nullopt;
    }
    try {
        const auto line = nlohmann::json::parse(row);
        const auto type = parseType(line.at("type").get<std::string>());
        if (!type) {
            return std::nullopt;
        }

        JournalEvent event;
        event.seq = line.at("seq").get<std::uint64_t>();
        event.type = *type;
        event.ts = line.value("ts", Timestamp{0});
        event.symbol = line.value("symbol", std::string());
        event.position_id = line.value("position_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        return event;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool EventJournalJsonl::ensureOpen() {
    if (out_.is_open()) {
        return true;
    }
    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_WARN("Journal directory create failed: {} ({})",
                     file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    out_.clear();
    out_.open(file_path_, std::ios::binary | std::ios::app);
    return out_.is_open();
}

} // namespace core
} // namespace phoenix
