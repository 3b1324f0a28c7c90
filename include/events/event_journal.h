#pragma once

#include "events/event.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <vector>

namespace repute {
namespace events {

/// @brief SHA-256 digest (32 bytes)
using Digest = std::vector<uint8_t>;

/**
 * Journal entry: the event, its position and the chained digest
 */
struct JournalRecord {
    uint64_t sequence = 0;       // starts at 1
    Event event;
    Digest digest;               // sha256(previous digest || encode(sequence, event))
};

/**
 * Append-only, hash-chained event log
 *
 * Each record's digest covers the previous record's digest, so editing or
 * dropping any record breaks verify_chain() from that point on.
 */
class EventJournal : public IEventSink {
public:
    EventJournal() = default;

    void on_event(const Event& event) override;
    std::string get_name() const override { return "journal"; }

    /// Append one event; returns the assigned sequence number
    Result<uint64_t> append(const Event& event);

    const std::vector<JournalRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }

    /// Digest of the newest record, or 32 zero bytes for an empty journal
    Digest head_digest() const;

    /// Recompute every digest and compare with the stored chain
    bool verify_chain() const;

    nlohmann::json to_json() const;

    // Helpers shared with verification and tests
    static std::vector<uint8_t> encode(uint64_t sequence, const Event& event);
    static Result<Digest> sha256(const std::vector<uint8_t>& data);
    static std::string to_hex(const Digest& digest);

private:
    std::vector<JournalRecord> records_;
};

/**
 * Forwards every event to the logger under module "events"
 */
class LoggingEventSink : public IEventSink {
public:
    void on_event(const Event& event) override;
    std::string get_name() const override { return "log"; }
};

} // namespace events
} // namespace repute
