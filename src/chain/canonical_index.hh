#pragma once

#include "core/types.hh"
#include "chain/header.hh"
#include "chain/header_store.hh"
#include <map>
#include <optional>
#include <vector>

namespace spv {

// ============================================================================
// Canonical Chain Index
// ============================================================================

// height -> fingerprint of the header considered canonical at that height.
// For every h in (genesis_height, best_height], canon[h] is a child of
// canon[h-1]. Bindings are the only mutable relation in the chain state and
// change only through apply_new_tip().
class CanonicalChainIndex {
public:
    CanonicalChainIndex() = default;

    // Seeds the index with the checkpoint header
    CanonicalChainIndex(height_t genesis_height, const hash_t& genesis_fingerprint);

    [[nodiscard]] height_t genesis_height() const { return genesis_height_; }
    [[nodiscard]] height_t best_height() const { return best_height_; }
    [[nodiscard]] std::optional<hash_t> at(height_t height) const;
    [[nodiscard]] std::optional<hash_t> tip() const { return at(best_height_); }

    // True iff the header is in `store` and bound at its own height
    [[nodiscard]] bool is_canonical(const HeaderStore& store, const hash_t& fingerprint) const;

    // Walks every binding above genesis and checks the parent links
    [[nodiscard]] bool is_connected(const HeaderStore& store) const;

    [[nodiscard]] const std::map<height_t, hash_t>& bindings() const { return canon_; }

    // Restores an index from persisted bindings; no validation
    [[nodiscard]] static CanonicalChainIndex from_bindings(
        height_t genesis_height,
        height_t best_height,
        std::map<height_t, hash_t> bindings);

    bool operator==(const CanonicalChainIndex&) const = default;

private:
    friend class ReorgEngine;

    void bind(height_t height, const hash_t& fingerprint);

    height_t genesis_height_ = 0;
    height_t best_height_ = 0;
    std::map<height_t, hash_t> canon_;
};

// ============================================================================
// Reorg Engine
// ============================================================================

struct ReorgReport {
    bool new_tip = false;            // header extended best_height
    hash_t old_tip{};
    height_t old_best_height = 0;
    height_t fork_height = 0;        // highest ancestor that stayed canonical
    std::vector<height_t> rebound;   // heights whose binding changed, descending

    // Number of previously canonical blocks that were displaced
    [[nodiscard]] std::size_t depth() const;
    [[nodiscard]] bool reorganized() const { return depth() > 0; }
};

class ReorgEngine {
public:
    // Offer a freshly admitted header. If it is taller than best_height the
    // index is rebound along its ancestry down to the first ancestor that is
    // already canonical; otherwise nothing changes (side branch, or a tie
    // lost to the first header seen at that height).
    //
    // Throws std::logic_error if an ancestor is missing from the store.
    static ReorgReport apply_new_tip(
        CanonicalChainIndex& index,
        const HeaderStore& store,
        const hash_t& fingerprint,
        const Header& header);
};

}  // namespace spv
