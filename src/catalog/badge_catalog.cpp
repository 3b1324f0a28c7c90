#include "catalog/badge_catalog.h"
#include "common/logging.h"

namespace repute {
namespace catalog {

BadgeCatalog::BadgeCatalog(const std::vector<SeedBadge> &seed) {
  badges_.reserve(seed.size());
  for (const auto &badge : seed) {
    append(badge.name, badge.description, badge.required_points,
           badge.metadata_ref);
  }
}

BadgeIndex BadgeCatalog::append(const std::string &name,
                                const std::string &description,
                                Points required_points,
                                const std::string &metadata_ref) {
  Badge badge;
  badge.name = name;
  badge.description = description;
  badge.required_points = required_points;
  badge.metadata_ref = metadata_ref;
  badge.exists = true;
  badges_.push_back(std::move(badge));
  return badges_.size() - 1;
}

Result<BadgeIndex> BadgeCatalog::create_badge(const AdminCapability &cap,
                                              const std::string &name,
                                              const std::string &description,
                                              Points required_points,
                                              const std::string &metadata_ref) {
  if (!cap.is_valid()) {
    return Result<BadgeIndex>(ErrorCode::UNAUTHORIZED,
                              "Catalog mutation requires admin capability");
  }

  if (name.empty()) {
    return Result<BadgeIndex>(ErrorCode::INVALID_INPUT,
                              "Badge name cannot be empty");
  }

  BadgeIndex index = append(name, description, required_points, metadata_ref);
  LOG_DEBUG("catalog", "Created badge ", index, " '", name, "' threshold ",
            required_points);
  return Result<BadgeIndex>(index);
}

Result<bool> BadgeCatalog::update_metadata_ref(const AdminCapability &cap,
                                               BadgeIndex index,
                                               const std::string &new_ref) {
  if (!cap.is_valid()) {
    return Result<bool>(ErrorCode::UNAUTHORIZED,
                        "Catalog mutation requires admin capability");
  }

  if (!contains(index)) {
    return Result<bool>(ErrorCode::NOT_FOUND,
                        "Badge " + std::to_string(index) + " does not exist");
  }

  badges_[index].metadata_ref = new_ref;
  LOG_DEBUG("catalog", "Updated metadata of badge ", index);
  return Result<bool>(true);
}

Result<Badge> BadgeCatalog::get(BadgeIndex index) const {
  if (!contains(index)) {
    return Result<Badge>(ErrorCode::NOT_FOUND,
                         "Badge " + std::to_string(index) + " does not exist");
  }
  return Result<Badge>(badges_[index]);
}

} // namespace catalog
} // namespace repute
