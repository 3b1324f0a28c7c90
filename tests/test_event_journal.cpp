/**
 * Unit tests for the hash-chained event journal
 *
 * Covers:
 * - SHA-256 helper against a known vector
 * - Sequence numbering and head digest
 * - Chain verification and tamper detection
 * - Journal fed by a live RewardEngine
 */

#include "engine/reward_engine.h"
#include "events/event_journal.h"
#include <gtest/gtest.h>
#include <memory>

using namespace repute::events;
using namespace repute::common;

// ============================================================================
// Test Fixtures
// ============================================================================

class EventJournalTest : public ::testing::Test {
protected:
    EventJournal journal;

    static Event make_event(EventKind kind, const std::string& account, Points amount) {
        Event event;
        event.kind = kind;
        event.account = account;
        event.amount = amount;
        event.timestamp = 1700000000;
        return event;
    }

    void fill(size_t n) {
        for (size_t i = 0; i < n; ++i) {
            auto result = journal.append(
                make_event(EventKind::POINTS_EARNED, "user" + std::to_string(i), i + 1));
            ASSERT_TRUE(result.is_ok()) << result.error();
        }
    }
};

// ============================================================================
// Digest helpers
// ============================================================================

TEST_F(EventJournalTest, Sha256KnownVector) {
    std::vector<uint8_t> input = {'a', 'b', 'c'};
    auto digest = EventJournal::sha256(input);

    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value().size(), 32u);
    EXPECT_EQ(EventJournal::to_hex(digest.value()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(EventJournalTest, EncodingDistinguishesFieldBoundaries) {
    Event left = make_event(EventKind::ENDORSED, "ab", 0);
    left.counterparty = "c";
    Event right = make_event(EventKind::ENDORSED, "a", 0);
    right.counterparty = "bc";

    EXPECT_NE(EventJournal::encode(1, left), EventJournal::encode(1, right));
    EXPECT_NE(EventJournal::encode(1, left), EventJournal::encode(2, left));
}

// ============================================================================
// Chain structure
// ============================================================================

TEST_F(EventJournalTest, EmptyJournal) {
    EXPECT_EQ(journal.size(), 0u);
    EXPECT_EQ(journal.head_digest(), Digest(32, 0));
    EXPECT_TRUE(journal.verify_chain());
    EXPECT_TRUE(journal.to_json().empty());
}

TEST_F(EventJournalTest, SequencesStartAtOne) {
    auto first = journal.append(make_event(EventKind::POINTS_EARNED, "alice", 5));
    auto second = journal.append(make_event(EventKind::LEVEL_UP, "alice", 0));

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), 1u);
    EXPECT_EQ(second.value(), 2u);
    EXPECT_EQ(journal.head_digest(), journal.records().back().digest);
    EXPECT_NE(journal.records()[0].digest, journal.records()[1].digest);
}

TEST_F(EventJournalTest, DigestChainsPreviousRecord) {
    fill(2);

    std::vector<uint8_t> input = journal.records()[0].digest;
    auto body = EventJournal::encode(2, journal.records()[1].event);
    input.insert(input.end(), body.begin(), body.end());

    auto expected = EventJournal::sha256(input);
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(journal.records()[1].digest, expected.value());
}

TEST_F(EventJournalTest, IdenticalEventsGetDistinctDigests) {
    Event event = make_event(EventKind::POINTS_EARNED, "bob", 5);
    ASSERT_TRUE(journal.append(event).is_ok());
    ASSERT_TRUE(journal.append(event).is_ok());

    EXPECT_NE(journal.records()[0].digest, journal.records()[1].digest);
    EXPECT_TRUE(journal.verify_chain());
}

// ============================================================================
// Tamper detection
// ============================================================================

TEST_F(EventJournalTest, VerifyDetectsEditedEvent) {
    fill(5);
    ASSERT_TRUE(journal.verify_chain());

    EventJournal tampered = journal;
    auto& records = const_cast<std::vector<JournalRecord>&>(tampered.records());
    records[2].event.amount += 1000;

    EXPECT_FALSE(tampered.verify_chain());
    EXPECT_TRUE(journal.verify_chain());
}

TEST_F(EventJournalTest, VerifyDetectsDroppedRecord) {
    fill(4);

    EventJournal tampered = journal;
    auto& records = const_cast<std::vector<JournalRecord>&>(tampered.records());
    records.erase(records.begin() + 1);

    EXPECT_FALSE(tampered.verify_chain());
}

TEST_F(EventJournalTest, VerifyDetectsForgedDigest) {
    fill(3);

    EventJournal tampered = journal;
    auto& records = const_cast<std::vector<JournalRecord>&>(tampered.records());
    records.back().digest[0] ^= 0xFF;

    EXPECT_FALSE(tampered.verify_chain());
}

// ============================================================================
// Engine integration
// ============================================================================

TEST_F(EventJournalTest, RecordsEngineActivity) {
    auto clock = std::make_shared<repute::engine::ManualClock>(86400);
    auto engine = std::make_shared<repute::engine::RewardEngine>(EngineConfig{}, clock);
    auto sink = std::make_shared<EventJournal>();
    engine->add_event_sink(sink);

    ASSERT_TRUE(engine->check_in("alice").is_ok());
    ASSERT_TRUE(engine->mint_badge("alice", 0).is_ok());
    EXPECT_TRUE(engine->mint_badge("alice", 0).is_err());

    // POINTS_EARNED, LEVEL_UP, BADGE_UNLOCKED, BADGE_MINTED, TRANSFER
    ASSERT_EQ(sink->size(), 5u);
    EXPECT_EQ(sink->records()[3].event.kind, EventKind::BADGE_MINTED);
    EXPECT_EQ(sink->records()[4].event.kind, EventKind::TRANSFER);
    EXPECT_EQ(sink->records()[4].event.token_id, 1u);
    EXPECT_TRUE(sink->verify_chain());

    auto json = sink->to_json();
    ASSERT_EQ(json.size(), 5u);
    EXPECT_EQ(json[0]["kind"], "POINTS_EARNED");
    EXPECT_EQ(json[0]["detail"], "daily_check_in");
    EXPECT_EQ(json[4]["digest"], EventJournal::to_hex(sink->head_digest()));
}
