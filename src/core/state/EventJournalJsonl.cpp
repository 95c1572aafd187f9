#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace semilev {
namespace core {

namespace {
nlohmann::json encode(const JournalEvent& event, std::uint64_t seq) {
    return {
        {"seq", seq},
        {"ts", event.ts},
        {"type", EventJournalJsonl::toString(event.type)},
        {"symbol", event.symbol},
        {"run_id", event.run_id},
        {"payload", event.payload.is_null() ? nlohmann::json::object() : event.payload}
    };
}

// Unknown event types keep `event` unset
struct DecodedLine {
    std::uint64_t seq = 0;
    std::optional<JournalEvent> event;
};

DecodedLine readFields(const nlohmann::json& line) {
    DecodedLine decoded;
    decoded.seq = line.value("seq", static_cast<std::uint64_t>(0));

    const auto type = EventJournalJsonl::fromString(line.value("type", std::string()));
    if (!type) {
        return decoded;
    }

    JournalEvent event;
    event.seq = decoded.seq;
    event.ts = line.value("ts", static_cast<Timestamp>(0));
    event.type = *type;
    event.symbol = line.value("symbol", std::string());
    event.run_id = line.value("run_id", std::string());
    if (line.contains("payload")) {
        event.payload = line.at("payload");
    } else {
        event.payload = nlohmann::json::object();
    }
    decoded.event = std::move(event);
    return decoded;
}

// Unparseable lines and lines with mistyped fields are skipped
std::optional<DecodedLine> decode(const std::string& row, const std::filesystem::path& path) {
    try {
        const auto line = nlohmann::json::parse(row);
        if (!line.is_object()) {
            return std::nullopt;
        }
        return readFields(line);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Skipping malformed journal line in {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

template <typename Fn>
void scanLines(const std::filesystem::path& path, Fn&& on_line) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return;
    }
    std::string row;
    while (std::getline(in, row)) {
        if (!row.empty() && row.back() == '\r') {
            row.pop_back();
        }
        if (row.empty()) {
            continue;
        }
        if (auto decoded = decode(row, path)) {
            on_line(*decoded);
        }
    }
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    // Resume numbering after whatever a previous run left behind
    scanLines(file_path_, [this](const DecodedLine& line) {
        last_seq_ = std::max(last_seq_, line.seq);
    });
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create journal directory {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t seq = last_seq_ + 1;
    out << encode(event, seq).dump() << '\n';
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> events;
    scanLines(file_path_, [&](const DecodedLine& line) {
        if (line.seq < seq_inclusive) {
            return;
        }
        if (!line.event) {
            LOG_WARN("Skipping journal event {} with unknown type", line.seq);
            return;
        }
        events.push_back(*line.event);
    });
    return events;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_RESIZED: return "POSITION_RESIZED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::STOP_TRIGGERED: return "STOP_TRIGGERED";
        case JournalEventType::KILL_SWITCH_TRIPPED: return "KILL_SWITCH_TRIPPED";
        case JournalEventType::DAY_CLOSED: return "DAY_CLOSED";
    }
    return "POSITION_OPENED";
}

std::optional<JournalEventType> EventJournalJsonl::fromString(const std::string& value) {
    static const std::pair<const char*, JournalEventType> kNames[] = {
        {"POSITION_OPENED", JournalEventType::POSITION_OPENED},
        {"POSITION_RESIZED", JournalEventType::POSITION_RESIZED},
        {"POSITION_CLOSED", JournalEventType::POSITION_CLOSED},
        {"STOP_TRIGGERED", JournalEventType::STOP_TRIGGERED},
        {"KILL_SWITCH_TRIPPED", JournalEventType::KILL_SWITCH_TRIPPED},
        {"DAY_CLOSED", JournalEventType::DAY_CLOSED},
    };
    for (const auto& entry : kNames) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace semilev
