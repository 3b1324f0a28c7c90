#pragma once

#include "common/types.h"
#include <unordered_map>
#include <unordered_set>

namespace repute {
namespace ledger {

using namespace repute::common;

/**
 * Sparse set of ordered (endorser, endorsed) pairs. A recorded pair is
 * permanent; the graph only exists to reject duplicates.
 */
class EndorsementGraph {
public:
    bool has_endorsed(const Address& endorser, const Address& endorsed) const;

    /// Record the pair; DUPLICATE_ENDORSEMENT if it is already present
    Result<bool> record(const Address& endorser, const Address& endorsed);

    size_t endorsements_given(const Address& endorser) const;
    size_t endorsements_received(const Address& endorsed) const;
    size_t total_endorsements() const { return total_; }

private:
    std::unordered_map<Address, std::unordered_set<Address>> edges_;
    std::unordered_map<Address, size_t> received_;
    size_t total_ = 0;
};

} // namespace ledger
} // namespace repute
