#include <libveil/zkp/MerkleTreeManager.h>
#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/NetworkRetry.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <algorithm>

namespace veil {
namespace zkp {

MerkleTreeManager::MerkleTreeManager(
    Ledger& ledger,
    MixerConfig const& config,
    clock_type& clock,
    beast::Journal journal)
    : ledger_(ledger), config_(config), clock_(clock), j_(journal)
{
}

std::vector<TreeState>
MerkleTreeManager::fetchActiveTrees()
{
    auto const records = withNetworkRetry(config_, j_, "Tree listing", [&] {
        return ledger_.readProgramAccounts(
            AccountFilter{AccountKind::tree, TreeState::size});
    });

    std::vector<TreeState> trees;
    for (auto const& record : records)
    {
        auto tree = parseTreeState(record.id, record.data);
        if (!tree)
        {
            JLOG(j_.warn()) << "Skipping malformed tree account " << record.id;
            continue;
        }
        if (!tree->full())
            trees.push_back(*tree);
    }

    std::sort(trees.begin(), trees.end(), [](auto const& a, auto const& b) {
        return a.id < b.id;
    });
    return trees;
}

std::vector<TreeState>
MerkleTreeManager::getActiveTrees(bool forceRefresh)
{
    std::lock_guard lock(mutex_);

    auto const now = clock_.now();
    if (!forceRefresh && fetched_ && now - *fetched_ < config_.treeCacheTtl)
        return trees_;

    try
    {
        trees_ = fetchActiveTrees();
        fetched_ = now;
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::NetworkError || !fetched_)
            throw;
        JLOG(j_.warn()) << "Using cached tree list: " << e.what();
    }

    JLOG(j_.trace()) << trees_.size() << " active trees";
    return trees_;
}

std::vector<TreeState>
MerkleTreeManager::getActiveTrees(AccountId const& pool, bool forceRefresh)
{
    auto trees = getActiveTrees(forceRefresh);
    trees.erase(
        std::remove_if(
            trees.begin(),
            trees.end(),
            [&](TreeState const& tree) { return tree.pool != pool; }),
        trees.end());
    return trees;
}

TreeState
MerkleTreeManager::pickTreeForDeposit(std::vector<TreeState> const& trees)
{
    TreeState const* best = nullptr;
    for (auto const& tree : trees)
    {
        if (tree.full())
            continue;
        if (!best || tree.leafCount > best->leafCount ||
            (tree.leafCount == best->leafCount && tree.id < best->id))
            best = &tree;
    }

    if (!best)
        ripple::Throw<MixerError>(
            ErrorKind::NoAvailableTree, "every commitment tree is full");
    return *best;
}

MerkleProof
MerkleTreeManager::getMerkleProof(uint256 const& commitment)
{
    auto proof = withNetworkRetry(config_, j_, "Merkle proof fetch", [&] {
        return ledger_.fetchMerkleProof(commitment);
    });

    if (!proof)
        ripple::Throw<MixerError>(
            ErrorKind::CommitmentNotFound,
            "commitment is not in any tree",
            commitment);

    JLOG(j_.debug()) << "Fetched proof for " << commitment << " at leaf "
                     << proof->leafIndex << " of tree " << proof->treeId;
    return std::move(*proof);
}

TreeState
MerkleTreeManager::getTree(AccountId const& treeId)
{
    auto const data = withNetworkRetry(config_, j_, "Tree read", [&] {
        return ledger_.readAccount(treeId);
    });

    std::optional<TreeState> tree;
    if (data)
        tree = parseTreeState(treeId, *data);
    if (!tree)
        ripple::Throw<MixerError>(
            ErrorKind::NoAvailableTree,
            "tree " + to_string(treeId) + " not found");
    return *tree;
}

uint256
MerkleTreeManager::getLatestRoot(AccountId const& treeId)
{
    return getTree(treeId).root;
}

void
MerkleTreeManager::invalidate()
{
    std::lock_guard lock(mutex_);
    fetched_.reset();
}

} // namespace zkp
} // namespace veil
