#include <gtest/gtest.h>
#include "bridge/chain_state.hh"
#include "test_chain.hh"

namespace spv {
namespace {

constexpr amount_t RELAY_FEE = 10;
constexpr amount_t VERIFY_FEE = 25;

class ChainStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        genesis_ = test::checkpoint(100);
        state_ = seed_genesis(genesis_, deployer_, test::easy_threshold(), RELAY_FEE, VERIFY_FEE);
        rail_.credit(relayer_, 1000);
    }

    Admission submit(const Header& header, amount_t fee = RELAY_FEE) {
        return admit_header(state_, header, relayer_, fee, rail_);
    }

    Header genesis_;
    Address deployer_ = test::address(0xD0);
    Address relayer_ = test::address(0xE1);
    ChainState state_;
    BalanceBook rail_;
};

// ============================================================================
// Genesis
// ============================================================================

TEST_F(ChainStateTest, GenesisSeedsEverything) {
    hash_t fp = fingerprint_of(genesis_);

    EXPECT_EQ(state_.genesis_height(), 100u);
    EXPECT_EQ(state_.best_height(), 100u);
    EXPECT_TRUE(state_.headers.contains(fp));
    EXPECT_TRUE(state_.canon.is_canonical(state_.headers, fp));
    EXPECT_EQ(state_.fees.recipient(fp).value(), deployer_);
    EXPECT_EQ(state_.fees.burned_total(), 0u);
}

TEST_F(ChainStateTest, GenesisSkipsProofOfWork) {
    // A zero threshold admits nothing, but the checkpoint is trusted
    ChainState state = seed_genesis(genesis_, deployer_, hash_t{}, 0, 0);
    EXPECT_EQ(state.headers.size(), 1u);
}

TEST_F(ChainStateTest, NullGenesisThrows) {
    EXPECT_THROW((void)seed_genesis(Header{}, deployer_, test::easy_threshold(), 0, 0),
                 std::invalid_argument);
}

// ============================================================================
// Admission
// ============================================================================

TEST_F(ChainStateTest, AcceptedHeaderExtendsChain) {
    Header a = test::child_of(genesis_);
    Admission admission = submit(a, RELAY_FEE + 5);

    ASSERT_TRUE(admission.accepted());
    EXPECT_EQ(admission.fingerprint, fingerprint_of(a));
    EXPECT_EQ(admission.height, 101u);
    EXPECT_TRUE(admission.reorg.new_tip);
    EXPECT_EQ(state_.best_height(), 101u);
    EXPECT_EQ(state_.fees.recipient(admission.fingerprint).value(), relayer_);

    // The whole paid amount is collected and retired
    EXPECT_EQ(state_.fees.burned_total(), RELAY_FEE + 5);
    EXPECT_EQ(rail_.balance_of(relayer_), 1000 - RELAY_FEE - 5);
    EXPECT_EQ(rail_.escrow(), RELAY_FEE + 5);

    ASSERT_EQ(admission.events.size(), 1u);
    auto* submitted = std::get_if<HeaderSubmitted>(&admission.events[0]);
    ASSERT_NE(submitted, nullptr);
    EXPECT_EQ(submitted->fingerprint, admission.fingerprint);
    EXPECT_EQ(submitted->height, 101u);
    EXPECT_EQ(submitted->submitter, relayer_);
}

TEST_F(ChainStateTest, InsufficientFee) {
    Header a = test::child_of(genesis_);
    ChainState before = state_;

    EXPECT_EQ(submit(a, RELAY_FEE - 1).result, SubmitResult::INSUFFICIENT_FEE);
    EXPECT_EQ(state_, before);
    EXPECT_EQ(rail_.escrow(), 0u);
}

TEST_F(ChainStateTest, UnfundedSubmitterIsRejected) {
    Header a = test::child_of(genesis_);
    Address broke = test::address(0xB0);
    rail_.credit(broke, RELAY_FEE - 1);
    ChainState before = state_;

    Admission admission = admit_header(state_, a, broke, RELAY_FEE, rail_);
    EXPECT_EQ(admission.result, SubmitResult::FEE_UNCOLLECTED);
    EXPECT_TRUE(admission.events.empty());
    EXPECT_EQ(state_, before);
    EXPECT_EQ(rail_.balance_of(broke), RELAY_FEE - 1);
    EXPECT_EQ(rail_.escrow(), 0u);
}

TEST_F(ChainStateTest, StructuralRejectionCollectsNothing) {
    Header weak = test::weak_child_of(genesis_);
    EXPECT_EQ(submit(weak).result, SubmitResult::POW_NOT_MET);
    EXPECT_EQ(rail_.balance_of(relayer_), 1000u);
    EXPECT_EQ(rail_.escrow(), 0u);
}

TEST_F(ChainStateTest, FeeIsCheckedBeforeEverythingElse) {
    // Unknown parent and bad proof of work, but the fee is reported first
    Header orphan = test::weak_child_of(test::child_of(genesis_));
    EXPECT_EQ(submit(orphan, 0).result, SubmitResult::INSUFFICIENT_FEE);
}

TEST_F(ChainStateTest, DuplicateHeader) {
    Header a = test::child_of(genesis_);
    ASSERT_TRUE(submit(a).accepted());
    ChainState before = state_;

    Admission again = submit(a);
    EXPECT_EQ(again.result, SubmitResult::DUPLICATE_HEADER);
    EXPECT_TRUE(again.events.empty());
    EXPECT_EQ(state_, before);
}

TEST_F(ChainStateTest, GenesisResubmissionIsDuplicate) {
    EXPECT_EQ(submit(genesis_).result, SubmitResult::DUPLICATE_HEADER);
}

TEST_F(ChainStateTest, UnknownParent) {
    Header a = test::child_of(genesis_);
    Header b = test::child_of(a);
    ChainState before = state_;

    EXPECT_EQ(submit(b).result, SubmitResult::UNKNOWN_PARENT);
    EXPECT_EQ(state_, before);
}

TEST_F(ChainStateTest, NullHeaderHasUnknownParent) {
    EXPECT_EQ(submit(Header{}).result, SubmitResult::UNKNOWN_PARENT);
}

TEST_F(ChainStateTest, InvalidHeight) {
    Header a = test::child_of(genesis_);
    a.height = 102;
    auto ground = grind_nonce(a, test::easy_threshold());
    ASSERT_TRUE(ground.has_value());
    ChainState before = state_;

    EXPECT_EQ(submit(ground->header).result, SubmitResult::INVALID_HEIGHT);
    EXPECT_EQ(state_, before);

    Header same = ground->header;
    same.height = 100;
    EXPECT_EQ(submit(same).result, SubmitResult::INVALID_HEIGHT);
}

TEST_F(ChainStateTest, ProofOfWorkNotMet) {
    Header weak = test::weak_child_of(genesis_);
    ChainState before = state_;

    EXPECT_EQ(submit(weak).result, SubmitResult::POW_NOT_MET);
    EXPECT_EQ(state_, before);
}

TEST_F(ChainStateTest, ReorgEmitsEvent) {
    Header a1 = test::child_of(genesis_, 1);
    Header b1 = test::child_of(genesis_, 2);
    Header b2 = test::child_of(b1, 2);
    ASSERT_TRUE(submit(a1).accepted());

    Admission side = submit(b1);
    ASSERT_TRUE(side.accepted());
    EXPECT_FALSE(side.reorg.new_tip);
    EXPECT_EQ(side.events.size(), 1u);

    Admission tip = submit(b2);
    ASSERT_TRUE(tip.accepted());
    ASSERT_EQ(tip.events.size(), 2u);

    auto* reorg = std::get_if<ChainReorganized>(&tip.events[1]);
    ASSERT_NE(reorg, nullptr);
    EXPECT_EQ(reorg->old_tip, fingerprint_of(a1));
    EXPECT_EQ(reorg->new_tip, fingerprint_of(b2));
    EXPECT_EQ(reorg->fork_height, 100u);
    EXPECT_EQ(reorg->depth, 1u);
}

TEST_F(ChainStateTest, ResultNames) {
    EXPECT_EQ(submit_result_string(SubmitResult::ACCEPTED), "accepted");
    EXPECT_EQ(submit_result_string(SubmitResult::POW_NOT_MET), "pow_not_met");
    EXPECT_EQ(submit_result_string(SubmitResult::UNKNOWN_PARENT), "unknown_parent");
    EXPECT_EQ(submit_result_string(SubmitResult::FEE_UNCOLLECTED), "fee_uncollected");
}

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(ChainStateTest, SnapshotRoundTripWithFork) {
    Header a1 = test::child_of(genesis_, 1);
    Header a2 = test::child_of(a1, 1);
    Header b1 = test::child_of(genesis_, 2);
    ASSERT_TRUE(submit(a1).accepted());
    ASSERT_TRUE(submit(a2).accepted());
    ASSERT_TRUE(submit(b1, RELAY_FEE + 1).accepted());
    state_.fees.retain(7);

    auto bytes = state_.serialize();
    auto restored = ChainState::deserialize(bytes);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, state_);
    EXPECT_EQ(restored->serialize(), bytes);
}

TEST_F(ChainStateTest, SnapshotIsDeterministic) {
    Header a1 = test::child_of(genesis_, 1);
    Header a2 = test::child_of(a1, 1);
    Header b1 = test::child_of(genesis_, 2);

    ChainState other = state_;
    ASSERT_TRUE(submit(a1).accepted());
    ASSERT_TRUE(submit(a2).accepted());
    ASSERT_TRUE(submit(b1).accepted());

    // Side branch arrives earlier; the canonical path is the same
    ASSERT_TRUE(admit_header(other, a1, relayer_, RELAY_FEE, rail_).accepted());
    ASSERT_TRUE(admit_header(other, b1, relayer_, RELAY_FEE, rail_).accepted());
    ASSERT_TRUE(admit_header(other, a2, relayer_, RELAY_FEE, rail_).accepted());
    EXPECT_EQ(other.serialize(), state_.serialize());
}

TEST_F(ChainStateTest, SnapshotRejectsBadMagic) {
    auto bytes = state_.serialize();
    bytes[0] ^= 0xFF;
    EXPECT_FALSE(ChainState::deserialize(bytes).has_value());
}

TEST_F(ChainStateTest, SnapshotRejectsTruncation) {
    auto bytes = state_.serialize();
    bytes.pop_back();
    EXPECT_FALSE(ChainState::deserialize(bytes).has_value());
    EXPECT_FALSE(ChainState::deserialize({}).has_value());
}

TEST_F(ChainStateTest, SnapshotRejectsTrailingBytes) {
    auto bytes = state_.serialize();
    bytes.push_back(0);
    EXPECT_FALSE(ChainState::deserialize(bytes).has_value());
}

TEST_F(ChainStateTest, SnapshotRejectsTamperedHeader) {
    ASSERT_TRUE(submit(test::child_of(genesis_)).accepted());
    auto bytes = state_.serialize();

    // Header section starts after the fixed prefix and the count
    std::size_t prefix = 4 + 2 + 8 + 8 + HASH_SIZE + 5 * 8 + 4;
    std::size_t first_field = prefix + HASH_SIZE + 40;
    ASSERT_LT(first_field, bytes.size());
    bytes[first_field] ^= 0x01;

    EXPECT_FALSE(ChainState::deserialize(bytes).has_value());
}

}  // namespace
}  // namespace spv
