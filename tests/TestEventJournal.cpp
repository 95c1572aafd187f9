#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using semilev::core::EventJournalJsonl;
using semilev::core::JournalEvent;
using semilev::core::JournalEventType;

int main() {
    const auto path = std::filesystem::temp_directory_path() / "semilev_test" / "test_event_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        EventJournalJsonl journal(path);
        if (journal.lastSeq() != 0) {
            std::cerr << "[TEST] fresh journal should start at 0, got " << journal.lastSeq() << "\n";
            return 1;
        }

        JournalEvent first;
        first.ts = 1704187500;
        first.type = JournalEventType::POSITION_OPENED;
        first.symbol = "SMH";
        first.run_id = "journal-test";
        first.payload["price"] = 100.0;
        first.payload["leverage"] = 2.0;

        JournalEvent second;
        second.ts = 1704187800;
        second.type = JournalEventType::STOP_TRIGGERED;
        second.symbol = "SMH";
        second.run_id = "journal-test";
        second.payload["day_start_equity"] = 100000.0;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return one event, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().type != JournalEventType::STOP_TRIGGERED || rows.front().symbol != "SMH") {
            std::cerr << "[TEST] unexpected event at seq 2\n";
            return 1;
        }
        if (rows.front().payload.value("day_start_equity", 0.0) != 100000.0) {
            std::cerr << "[TEST] payload not preserved\n";
            return 1;
        }
    }

    // Foreign, malformed and mistyped lines are skipped
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"seq\":3,\"ts\":1,\"type\":\"ORDER_SUBMITTED\",\"symbol\":\"SMH\"}\n";
        out << "not json\n";
        out << "{\"seq\":\"9\",\"ts\":1,\"type\":\"DAY_CLOSED\"}\n";
        out << "{\"seq\":3,\"ts\":\"later\",\"type\":\"DAY_CLOSED\"}\n";
    }

    // Reopening continues the sequence
    {
        EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 3) {
            std::cerr << "[TEST] reopened lastSeq should be 3, got " << reopened.lastSeq() << "\n";
            return 1;
        }

        JournalEvent day;
        day.ts = 1704229200;
        day.type = JournalEventType::DAY_CLOSED;
        day.payload["equity"] = 98200.0;
        if (!reopened.append(day)) {
            std::cerr << "[TEST] append after reopen failed\n";
            return 1;
        }

        const auto all = reopened.readFrom(1);
        if (all.size() != 3) {
            std::cerr << "[TEST] expected 3 readable events, got " << all.size() << "\n";
            return 1;
        }
        if (all.back().seq != 4 || all.back().type != JournalEventType::DAY_CLOSED) {
            std::cerr << "[TEST] last event should be DAY_CLOSED at seq 4\n";
            return 1;
        }
    }

    if (EventJournalJsonl::fromString("KILL_SWITCH_TRIPPED") != JournalEventType::KILL_SWITCH_TRIPPED ||
        EventJournalJsonl::fromString("ORDER_FILLED").has_value()) {
        std::cerr << "[TEST] event type names do not round-trip\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
