#pragma once

#include "common/types.h"
#include <string>

namespace repute {
namespace events {

using namespace repute::common;

/**
 * Notifications published after each successful mutation
 */
enum class EventKind {
    POINTS_EARNED,
    LEVEL_UP,
    BADGE_UNLOCKED,
    BADGE_MINTED,
    ENDORSED,
    TRANSFER,                // creation transfer of a freshly minted token
    BADGE_CREATED,
    BADGE_METADATA_UPDATED
};

const char* event_kind_to_string(EventKind kind) noexcept;

/**
 * One audit record. Fields that do not apply to a kind stay at their
 * defaults:
 *  - POINTS_EARNED: account, amount, detail = reason
 *  - LEVEL_UP: account, level
 *  - BADGE_UNLOCKED: account, badge_index
 *  - BADGE_MINTED: account, badge_index, token_id
 *  - ENDORSED: counterparty = endorser, account = endorsed
 *  - TRANSFER: counterparty = "" (minted from nothing), account = owner, token_id
 *  - BADGE_CREATED / BADGE_METADATA_UPDATED: account = admin, badge_index,
 *    detail = metadata reference
 */
struct Event {
    EventKind kind = EventKind::POINTS_EARNED;
    Address account;
    Address counterparty;
    BadgeIndex badge_index = 0;
    TokenId token_id = NO_TOKEN;
    Points amount = 0;
    Level level = 0;
    std::string detail;
    Timestamp timestamp = 0;
};

/**
 * Receiver of engine notifications
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void on_event(const Event& event) = 0;
    virtual std::string get_name() const = 0;
};

} // namespace events
} // namespace repute
