#include "bridge/light_client.hh"
#include "core/logging.hh"
#include <stdexcept>

namespace spv {

// ============================================================================
// LightClientConfig Implementation
// ============================================================================

std::string LightClientConfig::validate() const {
    if (is_zero(difficulty_threshold)) {
        return "difficulty threshold is zero; no header could ever be admitted";
    }
    if (state_root_source != StateRootSource::STORAGE_ROOT &&
        state_root_source != StateRootSource::TRANSACTIONS_ROOT) {
        return "unknown state root source";
    }
    return {};
}

std::optional<hash_t> LightClientConfig::difficulty_from_hex(std::string_view hex) {
    return hash_from_hex(hex);
}

// ============================================================================
// LightClient Implementation
// ============================================================================

namespace {

const LightClientConfig& checked(const LightClientConfig& config) {
    std::string problem = config.validate();
    if (!problem.empty()) {
        log::bridge.error() << "Invalid light client config: " << problem;
        throw std::invalid_argument(problem);
    }
    return config;
}

}  // namespace

LightClient::LightClient(const Header& genesis,
                         const LightClientConfig& config,
                         const Address& deployer,
                         PaymentRail& rail,
                         const MerkleProofOracle& oracle)
    : config_(checked(config))
    , state_(seed_genesis(genesis, deployer, config.difficulty_threshold,
                          config.relay_fee, config.verify_fee))
    , rail_(rail)
    , verifier_(oracle, rail, config.state_root_source) {

    SPV_LOG_INFO(log::bridge) << "Light client initialized at height " << genesis.height
                              << ", relay fee " << config.relay_fee
                              << ", verify fee " << config.verify_fee
                              << ", state claims checked against "
                              << (config.state_root_source == StateRootSource::STORAGE_ROOT
                                      ? "storage root" : "transactions root");
}

SubmitReceipt LightClient::submit_header(const Header& header,
                                         const Address& submitter,
                                         amount_t paid_fee) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Admission admission = admit_header(state_, header, submitter, paid_fee, rail_);

    SubmitReceipt receipt;
    receipt.result = admission.result;
    receipt.fingerprint = admission.fingerprint;
    receipt.height = admission.height;
    receipt.new_tip = admission.reorg.new_tip;
    receipt.reorganized = admission.reorg.reorganized();
    receipt.events = std::move(admission.events);

    events_.insert(events_.end(), receipt.events.begin(), receipt.events.end());
    return receipt;
}

VerifyOutcome LightClient::verify_transaction_inclusion(const hash_t& tx_id,
                                                        const hash_t& header_fingerprint,
                                                        height_t min_depth,
                                                        const MerkleProof& proof,
                                                        const Address& payer,
                                                        amount_t paid_fee) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return record(verifier_.verify_transaction(
        state_, tx_id, header_fingerprint, min_depth, proof, payer, paid_fee));
}

VerifyOutcome LightClient::verify_state_inclusion(const StateClaim& claim,
                                                  const hash_t& header_fingerprint,
                                                  height_t min_depth,
                                                  const MerkleProof& proof,
                                                  const Address& payer,
                                                  amount_t paid_fee) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return record(verifier_.verify_state(
        state_, claim, header_fingerprint, min_depth, proof, payer, paid_fee));
}

VerifyOutcome LightClient::record(VerifyOutcome outcome) {
    events_.insert(events_.end(), outcome.events.begin(), outcome.events.end());
    return outcome;
}

bool LightClient::is_header_known(const hash_t& fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.headers.contains(fingerprint);
}

bool LightClient::is_canonical(const hash_t& fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.canon.is_canonical(state_.headers, fingerprint);
}

hash_t LightClient::fingerprint_of(const Header& header) {
    return spv::fingerprint_of(header);
}

height_t LightClient::best_height() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.best_height();
}

height_t LightClient::genesis_height() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.genesis_height();
}

std::optional<hash_t> LightClient::canonical_at(height_t height) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.canon.at(height);
}

std::optional<Header> LightClient::header(const hash_t& fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.headers.get(fingerprint);
}

std::optional<Address> LightClient::fee_recipient(const hash_t& fingerprint) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.fees.recipient(fingerprint);
}

std::size_t LightClient::header_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.headers.size();
}

amount_t LightClient::burned_total() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.fees.burned_total();
}

amount_t LightClient::retained_total() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.fees.retained_total();
}

amount_t LightClient::paid_out_total() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.fees.paid_out_total();
}

std::vector<Event> LightClient::events() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_;
}

std::vector<std::uint8_t> LightClient::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.serialize();
}

bool LightClient::restore(std::span<const std::uint8_t> data) {
    auto restored = ChainState::deserialize(data);
    if (!restored) {
        return false;
    }

    if (restored->difficulty_threshold != config_.difficulty_threshold ||
        restored->fees.relay_fee() != config_.relay_fee ||
        restored->fees.verify_fee() != config_.verify_fee) {
        SPV_LOG_WARN(log::bridge) << "Snapshot was taken under a different configuration";
        return false;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_ = std::move(*restored);
    events_.clear();

    SPV_LOG_INFO(log::bridge) << "Restored " << state_.headers.size()
                              << " headers, best height " << state_.best_height();
    return true;
}

}  // namespace spv
