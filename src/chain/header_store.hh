#pragma once

#include "core/types.hh"
#include "chain/header.hh"
#include <optional>
#include <unordered_map>

namespace spv {

// ============================================================================
// Header Store
// ============================================================================

// Append-only fingerprint -> header map. Entries are never overwritten or
// removed. Not synchronized; the owning ChainState is accessed by one caller
// at a time.
class HeaderStore {
public:
    HeaderStore() = default;

    [[nodiscard]] bool contains(const hash_t& fingerprint) const;
    [[nodiscard]] std::optional<Header> get(const hash_t& fingerprint) const;

    // Returns false (and leaves the store untouched) if the fingerprint exists
    [[nodiscard]] bool insert(const hash_t& fingerprint, const Header& header);

    [[nodiscard]] std::size_t size() const { return headers_.size(); }
    [[nodiscard]] const std::unordered_map<hash_t, Header>& entries() const { return headers_; }

    bool operator==(const HeaderStore&) const = default;

private:
    std::unordered_map<hash_t, Header> headers_;
};

}  // namespace spv
