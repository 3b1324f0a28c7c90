#include "ledger/endorsement_graph.h"

namespace repute {
namespace ledger {

bool EndorsementGraph::has_endorsed(const Address &endorser,
                                    const Address &endorsed) const {
  auto it = edges_.find(endorser);
  return it != edges_.end() && it->second.count(endorsed) > 0;
}

Result<bool> EndorsementGraph::record(const Address &endorser,
                                      const Address &endorsed) {
  if (!edges_[endorser].insert(endorsed).second) {
    return Result<bool>(ErrorCode::DUPLICATE_ENDORSEMENT,
                        endorser + " already endorsed " + endorsed);
  }
  ++received_[endorsed];
  ++total_;
  return Result<bool>(true);
}

size_t EndorsementGraph::endorsements_given(const Address &endorser) const {
  auto it = edges_.find(endorser);
  return it == edges_.end() ? 0 : it->second.size();
}

size_t EndorsementGraph::endorsements_received(const Address &endorsed) const {
  auto it = received_.find(endorsed);
  return it == received_.end() ? 0 : it->second;
}

} // namespace ledger
} // namespace repute
