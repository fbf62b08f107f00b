#include "chain/header_store.hh"

namespace spv {

bool HeaderStore::contains(const hash_t& fingerprint) const {
    return headers_.find(fingerprint) != headers_.end();
}

std::optional<Header> HeaderStore::get(const hash_t& fingerprint) const {
    auto it = headers_.find(fingerprint);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HeaderStore::insert(const hash_t& fingerprint, const Header& header) {
    return headers_.emplace(fingerprint, header).second;
}

}  // namespace spv
