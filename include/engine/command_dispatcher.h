#pragma once

#include "engine/reward_engine.h"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace repute {
namespace engine {

/**
 * JSON request surface over a RewardEngine
 *
 * Request:  {"op": "endorse_user", "caller": "alice", "target": "bob"}
 * Success:  {"ok": true, "result": ...}
 * Failure:  {"ok": false, "error": "DUPLICATE_ENDORSEMENT", "message": "..."}
 *
 * Token transfer requests are accepted as operations only to be refused
 * with NON_TRANSFERABLE; no engine call can move a token.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(std::shared_ptr<RewardEngine> engine);

    nlohmann::json dispatch(const nlohmann::json& request);

    /// Names of every accepted operation, sorted
    std::vector<std::string> operations() const;

    static nlohmann::json ok(nlohmann::json result);
    static nlohmann::json error(ErrorCode code, const std::string& message);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    std::shared_ptr<RewardEngine> engine_;
    std::unordered_map<std::string, Handler> handlers_;

    void register_handlers();

    template <typename T>
    static nlohmann::json respond(const Result<T>& result);
};

} // namespace engine
} // namespace repute
