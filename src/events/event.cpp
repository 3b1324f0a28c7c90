#include "events/event.h"

namespace repute {
namespace events {

const char *event_kind_to_string(EventKind kind) noexcept {
  switch (kind) {
  case EventKind::POINTS_EARNED:
    return "POINTS_EARNED";
  case EventKind::LEVEL_UP:
    return "LEVEL_UP";
  case EventKind::BADGE_UNLOCKED:
    return "BADGE_UNLOCKED";
  case EventKind::BADGE_MINTED:
    return "BADGE_MINTED";
  case EventKind::ENDORSED:
    return "ENDORSED";
  case EventKind::TRANSFER:
    return "TRANSFER";
  case EventKind::BADGE_CREATED:
    return "BADGE_CREATED";
  case EventKind::BADGE_METADATA_UPDATED:
    return "BADGE_METADATA_UPDATED";
  }
  return "UNKNOWN";
}

} // namespace events
} // namespace repute
