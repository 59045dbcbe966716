#pragma once

#include "ledger/state_path.hpp"
#include <future>

namespace zkverify {

/**
 * StateQuery - read access to ledger state needed to prove record inclusion.
 *
 * The process asks for the state path of every record commitment it consumes.
 * Implementations must be safe for concurrent readers.
 */
class StateQuery {
public:
    virtual ~StateQuery() = default;

    virtual Digest current_state_root() const = 0;

    // @throws NotFoundError if the commitment is unknown
    virtual StatePath get_state_path_for_commitment(const BFieldElement& commitment) const = 0;

    // Completed on the calling thread; exceptions are delivered through the future
    std::future<Digest> current_state_root_async() const;
    std::future<StatePath> get_state_path_for_commitment_async(const BFieldElement& commitment) const;
};

} // namespace zkverify
