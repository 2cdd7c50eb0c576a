#pragma once

#include <libveil/zkp/IncrementalMerkleTree.h>
#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/beast/utility/Journal.h>

#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace veil {
namespace zkp {

/**
 * In-process ledger
 *
 * Holds pools, trees, relayer records and the nullifier set, and applies
 * operations the way the on-chain program does. One mutex covers every
 * operation, so the nullifier check and its recording are atomic.
 *
 * Each operation runs in three stages:
 * - preflight: payload shape and amounts, no state access
 * - preclaim: checks against current state, including proof verification
 * - apply: state changes, which can no longer fail
 */
class LocalLedger : public Ledger
{
public:
    /**
     * @param verifier checks withdrawal proofs; null accepts any proof
     */
    explicit LocalLedger(
        beast::Journal journal,
        Verifier const* verifier = nullptr);

    /**
     * Provision the pool for a standard denomination with its first tree.
     * @throws std::invalid_argument on a duplicate or non-standard pool
     */
    AccountId
    createPool(
        std::uint64_t denomination,
        TokenType token,
        std::size_t treeDepth,
        std::uint16_t maxFeeBasisPoints = PoolState::defaultMaxFeeBasisPoints);

    AccountId
    addTree(AccountId const& pool, std::size_t depth);

    void
    putRelayer(RelayerState const& relayer);

    std::optional<PoolState>
    pool(AccountId const& id) const;

    std::optional<TreeState>
    tree(AccountId const& id) const;

    std::size_t
    nullifierCount() const;

    SubmitResult
    submitAndConfirm(Operation const& op) override;

    std::optional<Blob>
    readAccount(AccountId const& id) override;

    std::vector<AccountRecord>
    readProgramAccounts(AccountFilter const& filter) override;

    std::optional<MerkleProof>
    fetchMerkleProof(uint256 const& commitment) override;

private:
    struct Tree
    {
        AccountId pool;
        IncrementalMerkleTree tree;
    };

    struct Leaf
    {
        AccountId tree;
        std::uint64_t index;
    };

    beast::Journal j_;
    Verifier const* verifier_;

    mutable std::mutex mutex_;
    std::map<AccountId, PoolState> pools_;
    std::map<AccountId, Tree> trees_;
    std::map<AccountId, std::uint32_t> treeSequence_;
    std::map<AccountId, RelayerState> relayers_;
    std::map<AccountId, NullifierState> nullifiers_;
    std::map<uint256, Leaf> leaves_;

    AccountId
    addTreeLocked(AccountId const& pool, std::size_t depth);

    TreeState
    treeState(AccountId const& id, Tree const& tree) const;

    std::optional<SubmitResult>
    preflight(DepositOperation const& op) const;

    std::optional<SubmitResult>
    preclaim(DepositOperation const& op) const;

    SubmitResult
    doApply(DepositOperation const& op);

    std::optional<SubmitResult>
    preflight(WithdrawOperation const& op) const;

    std::optional<SubmitResult>
    preclaim(WithdrawOperation const& op) const;

    SubmitResult
    doApply(WithdrawOperation const& op);

    template <class Op>
    SubmitResult
    process(Op const& op);
};

} // namespace zkp
} // namespace veil
