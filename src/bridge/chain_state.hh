#pragma once

#include "core/types.hh"
#include "chain/header.hh"
#include "chain/header_store.hh"
#include "chain/canonical_index.hh"
#include "state/fee_ledger.hh"
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace spv {

// ============================================================================
// Events
// ============================================================================

struct HeaderSubmitted {
    hash_t fingerprint;
    height_t height;
    Address submitter;

    bool operator==(const HeaderSubmitted&) const = default;
};

struct ChainReorganized {
    hash_t old_tip;
    hash_t new_tip;
    height_t fork_height;
    std::size_t depth;     // canonical blocks displaced

    bool operator==(const ChainReorganized&) const = default;
};

struct InclusionVerified {
    hash_t claim_fingerprint;
    hash_t header_fingerprint;
    Address recipient;
    amount_t fee;

    bool operator==(const InclusionVerified&) const = default;
};

using Event = std::variant<HeaderSubmitted, ChainReorganized, InclusionVerified>;

// ============================================================================
// Submission Result
// ============================================================================

enum class SubmitResult : std::uint8_t {
    ACCEPTED = 0x00,
    INSUFFICIENT_FEE = 0x01,
    DUPLICATE_HEADER = 0x02,
    UNKNOWN_PARENT = 0x03,
    INVALID_HEIGHT = 0x04,
    POW_NOT_MET = 0x05,
    FEE_UNCOLLECTED = 0x06,   // rail could not collect the relay fee from the submitter
};

[[nodiscard]] std::string_view submit_result_string(SubmitResult result);

struct Admission {
    SubmitResult result = SubmitResult::ACCEPTED;
    hash_t fingerprint{};
    height_t height = 0;
    ReorgReport reorg;
    std::vector<Event> events;

    [[nodiscard]] bool accepted() const { return result == SubmitResult::ACCEPTED; }
};

// ============================================================================
// Chain State
// ============================================================================

// Everything the light client persists. Operations take it by exclusive
// reference; there is no other mutable state.
struct ChainState {
    HeaderStore headers;
    CanonicalChainIndex canon;
    FeeLedger fees;
    hash_t difficulty_threshold{};

    [[nodiscard]] height_t best_height() const { return canon.best_height(); }
    [[nodiscard]] height_t genesis_height() const { return canon.genesis_height(); }

    // Deterministic snapshot: headers, recipients and bindings sorted by key
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    // nullopt on truncated or inconsistent input (bad magic, fingerprint
    // mismatch, disconnected canonical path)
    [[nodiscard]] static std::optional<ChainState> deserialize(
        std::span<const std::uint8_t> data);

    bool operator==(const ChainState&) const = default;
};

// Builds the initial state around a trusted checkpoint header. The header
// bypasses parent, height and proof-of-work checks; `deployer` becomes its
// fee recipient. Throws std::invalid_argument on an all-zero header.
[[nodiscard]] ChainState seed_genesis(
    const Header& genesis,
    const Address& deployer,
    const hash_t& difficulty_threshold,
    amount_t relay_fee,
    amount_t verify_fee);

// Admission pipeline: relay fee, duplicate, parent, height, proof of work,
// collection of `paid_fee` from the submitter through `rail`, then store +
// recipient + fee burn + canonical index update. Any rejection leaves
// `state` and `rail` untouched.
[[nodiscard]] Admission admit_header(
    ChainState& state,
    const Header& header,
    const Address& submitter,
    amount_t paid_fee,
    PaymentRail& rail);

}  // namespace spv
