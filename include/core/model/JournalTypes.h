#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "common/Types.h"

namespace semilev {
namespace core {

enum class JournalEventType {
    POSITION_OPENED,
    POSITION_RESIZED,
    POSITION_CLOSED,
    STOP_TRIGGERED,
    KILL_SWITCH_TRIPPED,
    DAY_CLOSED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    Timestamp ts = 0;
    JournalEventType type = JournalEventType::POSITION_OPENED;
    std::string symbol;
    std::string run_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace semilev
