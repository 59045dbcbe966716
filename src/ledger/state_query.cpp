#include "ledger/state_query.hpp"
#include <exception>

namespace zkverify {

std::future<Digest> StateQuery::current_state_root_async() const {
    std::promise<Digest> promise;
    try {
        promise.set_value(current_state_root());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::future<StatePath> StateQuery::get_state_path_for_commitment_async(const BFieldElement& commitment) const {
    std::promise<StatePath> promise;
    try {
        promise.set_value(get_state_path_for_commitment(commitment));
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

} // namespace zkverify
