#include "chain/canonical_index.hh"
#include "core/logging.hh"
#include <algorithm>
#include <stdexcept>

namespace spv {

// ============================================================================
// CanonicalChainIndex Implementation
// ============================================================================

CanonicalChainIndex::CanonicalChainIndex(height_t genesis_height, const hash_t& genesis_fingerprint)
    : genesis_height_(genesis_height)
    , best_height_(genesis_height) {
    canon_[genesis_height] = genesis_fingerprint;
}

std::optional<hash_t> CanonicalChainIndex::at(height_t height) const {
    auto it = canon_.find(height);
    if (it == canon_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CanonicalChainIndex::is_canonical(const HeaderStore& store, const hash_t& fingerprint) const {
    auto header = store.get(fingerprint);
    if (!header) {
        return false;
    }
    auto bound = at(header->height);
    return bound && *bound == fingerprint;
}

bool CanonicalChainIndex::is_connected(const HeaderStore& store) const {
    for (height_t h = genesis_height_ + 1; h <= best_height_; ++h) {
        auto child_fp = at(h);
        auto parent_fp = at(h - 1);
        if (!child_fp || !parent_fp) {
            return false;
        }
        auto child = store.get(*child_fp);
        if (!child || child->height != h || child->parent_fingerprint != *parent_fp) {
            return false;
        }
    }
    return at(genesis_height_).has_value();
}

CanonicalChainIndex CanonicalChainIndex::from_bindings(
    height_t genesis_height,
    height_t best_height,
    std::map<height_t, hash_t> bindings) {

    CanonicalChainIndex index;
    index.genesis_height_ = genesis_height;
    index.best_height_ = best_height;
    index.canon_ = std::move(bindings);
    return index;
}

void CanonicalChainIndex::bind(height_t height, const hash_t& fingerprint) {
    canon_[height] = fingerprint;
}

// ============================================================================
// ReorgReport Implementation
// ============================================================================

std::size_t ReorgReport::depth() const {
    return static_cast<std::size_t>(std::count_if(rebound.begin(), rebound.end(),
        [this](height_t h) { return h <= old_best_height; }));
}

// ============================================================================
// ReorgEngine Implementation
// ============================================================================

ReorgReport ReorgEngine::apply_new_tip(
    CanonicalChainIndex& index,
    const HeaderStore& store,
    const hash_t& fingerprint,
    const Header& header) {

    ReorgReport report;
    report.old_best_height = index.best_height_;
    report.old_tip = index.tip().value_or(hash_t{});

    if (header.height <= index.best_height_) {
        SPV_LOG_DEBUG(log::reorg) << "Side branch header " << short_hex(fingerprint)
                                  << " at height " << header.height
                                  << " (best " << index.best_height_ << ")";
        return report;
    }

    report.new_tip = true;
    index.best_height_ = header.height;
    index.bind(header.height, fingerprint);
    report.rebound.push_back(header.height);

    // Rebind ancestors until the walk meets the existing canonical path.
    // Height strictly decreases and genesis is always canonical.
    hash_t cursor = header.parent_fingerprint;
    while (true) {
        auto ancestor = store.get(cursor);
        if (!ancestor) {
            SPV_LOG_ERROR(log::reorg) << "Missing ancestor " << short_hex(cursor)
                                      << " while indexing " << short_hex(fingerprint);
            throw std::logic_error("reorg walk reached an unknown header");
        }

        auto bound = index.at(ancestor->height);
        if (bound && *bound == cursor) {
            report.fork_height = ancestor->height;
            break;
        }

        if (ancestor->height <= index.genesis_height_) {
            throw std::logic_error("reorg walk passed the genesis height");
        }

        index.bind(ancestor->height, cursor);
        report.rebound.push_back(ancestor->height);
        cursor = ancestor->parent_fingerprint;
    }

    if (report.reorganized()) {
        SPV_LOG_INFO(log::reorg) << "Reorganized " << report.depth()
                                 << " block(s) above fork height " << report.fork_height
                                 << ", new tip " << short_hex(fingerprint)
                                 << " at height " << header.height;
    } else {
        SPV_LOG_DEBUG(log::reorg) << "Extended best chain to height " << header.height;
    }

    return report;
}

}  // namespace spv
