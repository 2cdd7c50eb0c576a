#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/MerkleProof.h>
#include <libveil/zkp/MixerConfig.h>

#include <xrpl/beast/clock/abstract_clock.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Read side of the commitment trees.
 *
 * The active-tree list is cached briefly and only used to choose where a
 * deposit goes; proofs and roots are always read fresh.
 */
class MerkleTreeManager
{
public:
    using clock_type = beast::abstract_clock<std::chrono::steady_clock>;

    MerkleTreeManager(
        Ledger& ledger,
        MixerConfig const& config,
        clock_type& clock,
        beast::Journal journal);

    /** Trees below capacity, ordered by id. */
    std::vector<TreeState>
    getActiveTrees(bool forceRefresh = false);

    /** Active trees owned by one pool. */
    std::vector<TreeState>
    getActiveTrees(AccountId const& pool, bool forceRefresh = false);

    /**
     * Choose the non-full tree holding the most leaves; ties go to the
     * lowest id. Filling one tree at a time keeps its anonymity set large.
     *
     * @throws MixerError(NoAvailableTree) if every tree is full
     */
    static TreeState
    pickTreeForDeposit(std::vector<TreeState> const& trees);

    /** @throws MixerError(CommitmentNotFound) */
    MerkleProof
    getMerkleProof(uint256 const& commitment);

    TreeState
    getTree(AccountId const& treeId);

    uint256
    getLatestRoot(AccountId const& treeId);

    /** Forget the cached tree list. */
    void
    invalidate();

private:
    Ledger& ledger_;
    MixerConfig const& config_;
    clock_type& clock_;
    beast::Journal j_;

    std::mutex mutex_;
    std::vector<TreeState> trees_;
    std::optional<clock_type::time_point> fetched_;

    std::vector<TreeState>
    fetchActiveTrees();
};

} // namespace zkp
} // namespace veil
