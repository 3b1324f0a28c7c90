#include "events/event_journal.h"
#include "common/logging.h"
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace repute {
namespace events {

namespace {

void put_u64(std::vector<uint8_t> &out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

// Length-prefixed so adjacent strings cannot be confused
void put_string(std::vector<uint8_t> &out, const std::string &value) {
  put_u64(out, value.size());
  out.insert(out.end(), value.begin(), value.end());
}

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::vector<uint8_t> EventJournal::encode(uint64_t sequence,
                                          const Event &event) {
  std::vector<uint8_t> out;
  put_u64(out, sequence);
  put_u64(out, static_cast<uint64_t>(event.kind));
  put_string(out, event.account);
  put_string(out, event.counterparty);
  put_u64(out, event.badge_index);
  put_u64(out, event.token_id);
  put_u64(out, event.amount);
  put_u64(out, event.level);
  put_string(out, event.detail);
  put_u64(out, event.timestamp);
  return out;
}

Result<Digest> EventJournal::sha256(const std::vector<uint8_t> &data) {
  std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return Result<Digest>(ErrorCode::INTERNAL_ERROR,
                          "Failed to allocate digest context");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    return Result<Digest>(ErrorCode::INTERNAL_ERROR, "SHA-256 update failed");
  }

  Digest digest(SHA256_DIGEST_LENGTH);
  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    return Result<Digest>(ErrorCode::INTERNAL_ERROR, "SHA-256 finalize failed");
  }

  return Result<Digest>(std::move(digest));
}

std::string EventJournal::to_hex(const Digest &digest) {
  std::ostringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(byte);
  }
  return ss.str();
}

Digest EventJournal::head_digest() const {
  if (records_.empty()) {
    return Digest(SHA256_DIGEST_LENGTH, 0);
  }
  return records_.back().digest;
}

Result<uint64_t> EventJournal::append(const Event &event) {
  uint64_t sequence = records_.size() + 1;

  std::vector<uint8_t> input = head_digest();
  std::vector<uint8_t> body = encode(sequence, event);
  input.insert(input.end(), body.begin(), body.end());

  auto digest = sha256(input);
  if (digest.is_err()) {
    return digest.propagate<uint64_t>();
  }

  JournalRecord record;
  record.sequence = sequence;
  record.event = event;
  record.digest = std::move(digest).value();
  records_.push_back(std::move(record));
  return Result<uint64_t>(sequence);
}

void EventJournal::on_event(const Event &event) {
  auto result = append(event);
  if (result.is_err()) {
    Logger::instance().log_structured(
        LogLevel::CRITICAL, "journal", "Failed to append event to journal",
        error_code_to_string(result.code()),
        {{"kind", event_kind_to_string(event.kind)},
         {"account", event.account},
         {"detail", result.error()}});
  }
}

bool EventJournal::verify_chain() const {
  Digest previous(SHA256_DIGEST_LENGTH, 0);
  for (size_t i = 0; i < records_.size(); ++i) {
    const auto &record = records_[i];
    if (record.sequence != i + 1) {
      return false;
    }

    std::vector<uint8_t> input = previous;
    std::vector<uint8_t> body = encode(record.sequence, record.event);
    input.insert(input.end(), body.begin(), body.end());

    auto digest = sha256(input);
    if (digest.is_err() || digest.value() != record.digest) {
      return false;
    }
    previous = record.digest;
  }
  return true;
}

nlohmann::json EventJournal::to_json() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &record : records_) {
    const Event &e = record.event;
    out.push_back({{"sequence", record.sequence},
                   {"kind", event_kind_to_string(e.kind)},
                   {"account", e.account},
                   {"counterparty", e.counterparty},
                   {"badge_index", e.badge_index},
                   {"token_id", e.token_id},
                   {"amount", e.amount},
                   {"level", e.level},
                   {"detail", e.detail},
                   {"timestamp", e.timestamp},
                   {"digest", to_hex(record.digest)}});
  }
  return out;
}

void LoggingEventSink::on_event(const Event &event) {
  Logger::instance().log_structured(
      LogLevel::INFO, "events", event_kind_to_string(event.kind), "",
      {{"account", event.account},
       {"counterparty", event.counterparty},
       {"badge_index", std::to_string(event.badge_index)},
       {"token_id", std::to_string(event.token_id)},
       {"amount", std::to_string(event.amount)},
       {"level", std::to_string(event.level)},
       {"detail", event.detail}});
}

} // namespace events
} // namespace repute
