#include "bridge/chain_state.hh"
#include "chain/pow.hh"
#include "core/logging.hh"
#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <stdexcept>

namespace spv {

std::string_view submit_result_string(SubmitResult result) {
    switch (result) {
        case SubmitResult::ACCEPTED: return "accepted";
        case SubmitResult::INSUFFICIENT_FEE: return "insufficient_fee";
        case SubmitResult::DUPLICATE_HEADER: return "duplicate_header";
        case SubmitResult::UNKNOWN_PARENT: return "unknown_parent";
        case SubmitResult::INVALID_HEIGHT: return "invalid_height";
        case SubmitResult::POW_NOT_MET: return "pow_not_met";
        case SubmitResult::FEE_UNCOLLECTED: return "fee_uncollected";
    }
    return "unknown";
}

// ============================================================================
// Genesis
// ============================================================================

ChainState seed_genesis(
    const Header& genesis,
    const Address& deployer,
    const hash_t& difficulty_threshold,
    amount_t relay_fee,
    amount_t verify_fee) {

    if (genesis.is_null()) {
        log::bridge.error() << "Refusing all-zero checkpoint header";
        throw std::invalid_argument("checkpoint header must have a non-zero field");
    }

    hash_t fp = fingerprint_of(genesis);

    ChainState state;
    state.difficulty_threshold = difficulty_threshold;
    state.fees = FeeLedger(relay_fee, verify_fee);
    state.canon = CanonicalChainIndex(genesis.height, fp);
    (void)state.headers.insert(fp, genesis);
    (void)state.fees.record_recipient(fp, deployer);

    SPV_LOG_INFO(log::chain) << "Checkpoint " << short_hex(fp) << " at height " << genesis.height
                             << ", recipient " << deployer.to_hex();
    return state;
}

// ============================================================================
// Admission
// ============================================================================

namespace {

Admission reject(SubmitResult result, const hash_t& fp, const Header& header) {
    SPV_LOG_DEBUG(log::chain) << "Rejected header " << short_hex(fp) << " at height "
                              << header.height << ": " << submit_result_string(result);
    Admission admission;
    admission.result = result;
    admission.fingerprint = fp;
    admission.height = header.height;
    return admission;
}

}  // namespace

Admission admit_header(
    ChainState& state,
    const Header& header,
    const Address& submitter,
    amount_t paid_fee,
    PaymentRail& rail) {

    hash_t fp = fingerprint_of(header);

    // Fee first, before any structural check
    if (!state.fees.covers_relay_fee(paid_fee)) {
        return reject(SubmitResult::INSUFFICIENT_FEE, fp, header);
    }

    if (state.headers.contains(fp)) {
        return reject(SubmitResult::DUPLICATE_HEADER, fp, header);
    }

    auto parent = state.headers.get(header.parent_fingerprint);
    if (!parent) {
        return reject(SubmitResult::UNKNOWN_PARENT, fp, header);
    }

    if (parent->height == std::numeric_limits<height_t>::max() ||
        header.height != parent->height + 1) {
        return reject(SubmitResult::INVALID_HEIGHT, fp, header);
    }

    if (!meets_threshold(fp, state.difficulty_threshold)) {
        return reject(SubmitResult::POW_NOT_MET, fp, header);
    }

    // Last fallible step; the rail is unchanged when it fails
    if (rail.collect(paid_fee, submitter) != PayoutResult::SUCCESS) {
        return reject(SubmitResult::FEE_UNCOLLECTED, fp, header);
    }

    // From here every write succeeds
    (void)state.headers.insert(fp, header);
    (void)state.fees.record_recipient(fp, submitter);
    state.fees.burn(paid_fee);

    Admission admission;
    admission.fingerprint = fp;
    admission.height = header.height;
    admission.reorg = ReorgEngine::apply_new_tip(state.canon, state.headers, fp, header);

    admission.events.emplace_back(HeaderSubmitted{fp, header.height, submitter});
    if (admission.reorg.reorganized()) {
        admission.events.emplace_back(ChainReorganized{
            admission.reorg.old_tip, fp, admission.reorg.fork_height, admission.reorg.depth()});
    }

    SPV_LOG_DEBUG(log::chain) << "Admitted header " << short_hex(fp) << " at height "
                              << header.height << " from " << submitter.to_hex()
                              << (admission.reorg.new_tip ? " (new tip)" : " (side branch)");
    return admission;
}

// ============================================================================
// Snapshot Codec
// ============================================================================

namespace {

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), v);
    out.insert(out.end(), buf.begin(), buf.end());
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), v);
    out.insert(out.end(), buf.begin(), buf.end());
}

void put_u64(std::vector<std::uint8_t>& out, std::uint64_t v) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), v);
    out.insert(out.end(), buf.begin(), buf.end());
}

template<typename Bytes>
void put_bytes(std::vector<std::uint8_t>& out, const Bytes& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data) : ptr_(data.data()), end_(data.data() + data.size()) {}

    [[nodiscard]] bool has(std::size_t n) const { return static_cast<std::size_t>(end_ - ptr_) >= n; }
    [[nodiscard]] bool at_end() const { return ptr_ == end_; }

    std::optional<std::uint16_t> u16() {
        if (!has(2)) return std::nullopt;
        auto v = decode_u16(ptr_);
        ptr_ += 2;
        return v;
    }

    std::optional<std::uint32_t> u32() {
        if (!has(4)) return std::nullopt;
        auto v = decode_u32(ptr_);
        ptr_ += 4;
        return v;
    }

    std::optional<std::uint64_t> u64() {
        if (!has(8)) return std::nullopt;
        auto v = decode_u64(ptr_);
        ptr_ += 8;
        return v;
    }

    template<std::size_t N>
    std::optional<std::array<std::uint8_t, N>> bytes() {
        if (!has(N)) return std::nullopt;
        std::array<std::uint8_t, N> out;
        std::copy(ptr_, ptr_ + N, out.begin());
        ptr_ += N;
        return out;
    }

private:
    const std::uint8_t* ptr_;
    const std::uint8_t* end_;
};

}  // namespace

std::vector<std::uint8_t> ChainState::serialize() const {
    std::vector<std::uint8_t> out;

    put_u32(out, SNAPSHOT_MAGIC);
    put_u16(out, SNAPSHOT_VERSION);
    put_u64(out, canon.genesis_height());
    put_u64(out, canon.best_height());
    put_bytes(out, difficulty_threshold);
    put_u64(out, fees.relay_fee());
    put_u64(out, fees.verify_fee());
    put_u64(out, fees.burned_total());
    put_u64(out, fees.retained_total());
    put_u64(out, fees.paid_out_total());

    // Headers, sorted by fingerprint
    std::vector<hash_t> fps;
    fps.reserve(headers.size());
    for (const auto& [fp, header] : headers.entries()) {
        fps.push_back(fp);
    }
    std::sort(fps.begin(), fps.end());

    put_u32(out, static_cast<std::uint32_t>(fps.size()));
    for (const auto& fp : fps) {
        put_bytes(out, fp);
        put_bytes(out, headers.entries().at(fp).encode());
    }

    // Recipients, sorted by fingerprint
    std::vector<std::pair<hash_t, Address>> recipients(fees.recipients().begin(),
                                                       fees.recipients().end());
    std::sort(recipients.begin(), recipients.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    put_u32(out, static_cast<std::uint32_t>(recipients.size()));
    for (const auto& [fp, addr] : recipients) {
        put_bytes(out, fp);
        put_bytes(out, addr.bytes);
    }

    // Canonical bindings (std::map iterates in height order)
    put_u32(out, static_cast<std::uint32_t>(canon.bindings().size()));
    for (const auto& [height, fp] : canon.bindings()) {
        put_u64(out, height);
        put_bytes(out, fp);
    }

    return out;
}

std::optional<ChainState> ChainState::deserialize(std::span<const std::uint8_t> data) {
    Reader in(data);

    auto magic = in.u32();
    auto version = in.u16();
    if (!magic || *magic != SNAPSHOT_MAGIC || !version || *version != SNAPSHOT_VERSION) {
        SPV_LOG_WARN(log::bridge) << "Snapshot has unknown magic or version";
        return std::nullopt;
    }

    auto genesis_height = in.u64();
    auto best_height = in.u64();
    auto threshold = in.bytes<HASH_SIZE>();
    auto relay_fee = in.u64();
    auto verify_fee = in.u64();
    auto burned = in.u64();
    auto retained = in.u64();
    auto paid_out = in.u64();
    if (!genesis_height || !best_height || !threshold || !relay_fee || !verify_fee ||
        !burned || !retained || !paid_out || *best_height < *genesis_height) {
        return std::nullopt;
    }

    ChainState state;
    state.difficulty_threshold = *threshold;
    state.fees = FeeLedger(*relay_fee, *verify_fee);
    state.fees.restore_totals(*burned, *retained, *paid_out);

    auto header_count = in.u32();
    if (!header_count) {
        return std::nullopt;
    }
    for (std::uint32_t i = 0; i < *header_count; ++i) {
        auto fp = in.bytes<HASH_SIZE>();
        auto encoded = in.bytes<HEADER_ENCODED_SIZE>();
        if (!fp || !encoded) {
            return std::nullopt;
        }
        auto header = Header::decode(*encoded);
        if (!header || fingerprint_of(*header) != *fp || !state.headers.insert(*fp, *header)) {
            SPV_LOG_WARN(log::bridge) << "Snapshot header " << i << " is corrupt";
            return std::nullopt;
        }
    }

    auto recipient_count = in.u32();
    if (!recipient_count) {
        return std::nullopt;
    }
    for (std::uint32_t i = 0; i < *recipient_count; ++i) {
        auto fp = in.bytes<HASH_SIZE>();
        auto addr = in.bytes<ADDRESS_SIZE>();
        if (!fp || !addr || !state.headers.contains(*fp)) {
            return std::nullopt;
        }
        if (!state.fees.record_recipient(*fp, Address{*addr})) {
            return std::nullopt;
        }
    }

    auto binding_count = in.u32();
    if (!binding_count) {
        return std::nullopt;
    }
    std::map<height_t, hash_t> bindings;
    for (std::uint32_t i = 0; i < *binding_count; ++i) {
        auto height = in.u64();
        auto fp = in.bytes<HASH_SIZE>();
        if (!height || !fp || !bindings.emplace(*height, *fp).second) {
            return std::nullopt;
        }
    }

    if (!in.at_end()) {
        return std::nullopt;
    }

    state.canon = CanonicalChainIndex::from_bindings(*genesis_height, *best_height, std::move(bindings));
    if (!state.canon.is_connected(state.headers) ||
        !state.canon.is_canonical(state.headers, state.canon.tip().value_or(hash_t{}))) {
        SPV_LOG_WARN(log::bridge) << "Snapshot canonical path is not connected";
        return std::nullopt;
    }

    return state;
}

}  // namespace spv
