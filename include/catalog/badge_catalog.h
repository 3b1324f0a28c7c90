#pragma once

#include "common/config.h"
#include "common/types.h"
#include <string>
#include <utility>
#include <vector>

namespace repute {
namespace engine {
class RewardEngine;
}

namespace catalog {

using namespace repute::common;

/**
 * Badge definition. Identity (index, name, threshold) is fixed once created;
 * only the metadata reference can be replaced.
 */
struct Badge {
    std::string name;
    std::string description;
    Points required_points = 0;
    std::string metadata_ref;
    bool exists = false;
};

/**
 * Proof of administrator authority, required by every catalog mutation.
 * Only RewardEngine::authorize_admin() can produce a valid one; a default
 * constructed capability is rejected with UNAUTHORIZED.
 */
class AdminCapability {
public:
    AdminCapability() = default;

    bool is_valid() const { return !holder_.empty(); }
    const Address& holder() const { return holder_; }

private:
    explicit AdminCapability(Address holder) : holder_(std::move(holder)) {}
    Address holder_;

    friend class repute::engine::RewardEngine;
};

/**
 * Ordered, append-only registry of badge definitions
 */
class BadgeCatalog {
public:
    BadgeCatalog() = default;

    /// Build a catalog holding the given seed badges at indices 0..n-1
    explicit BadgeCatalog(const std::vector<SeedBadge>& seed);

    // Mutations
    Result<BadgeIndex> create_badge(const AdminCapability& cap,
                                    const std::string& name,
                                    const std::string& description,
                                    Points required_points,
                                    const std::string& metadata_ref);
    Result<bool> update_metadata_ref(const AdminCapability& cap,
                                     BadgeIndex index,
                                     const std::string& new_ref);

    // Queries
    Result<Badge> get(BadgeIndex index) const;
    bool contains(BadgeIndex index) const { return index < badges_.size(); }
    size_t size() const { return badges_.size(); }
    const std::vector<Badge>& badges() const { return badges_; }

private:
    BadgeIndex append(const std::string& name, const std::string& description,
                      Points required_points, const std::string& metadata_ref);

    std::vector<Badge> badges_;
};

} // namespace catalog
} // namespace repute
