#include <libveil/zkp/DepositManager.h>
#include <libveil/zkp/NetworkRetry.h>
#include <libveil/zkp/Operation.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <algorithm>
#include <chrono>

namespace veil {
namespace zkp {

std::string
to_string(DepositState state)
{
    switch (state)
    {
        case DepositState::Idle:
            return "Idle";
        case DepositState::NoteGenerated:
            return "NoteGenerated";
        case DepositState::TreeSelected:
            return "TreeSelected";
        case DepositState::CommitmentSubmitted:
            return "CommitmentSubmitted";
        case DepositState::Confirmed:
            return "Confirmed";
        case DepositState::Failed:
            return "Failed";
        case DepositState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

DepositManager::DepositManager(
    Ledger& ledger,
    PoolRegistry& pools,
    MerkleTreeManager& trees,
    MixerConfig const& config,
    beast::Journal journal)
    : ledger_(ledger)
    , pools_(pools)
    , trees_(trees)
    , config_(config)
    , j_(journal)
{
}

void
DepositManager::transition(DepositResult& result, DepositState next) const
{
    JLOG(j_.debug()) << "Deposit " << result.note.commitment() << ": "
                     << to_string(result.state) << " -> " << to_string(next);
    result.state = next;
    result.transitions.push_back(next);
}

DepositResult
DepositManager::deposit(
    std::uint64_t amount,
    TokenType token,
    std::optional<AccountId> const& recipient,
    CancelToken const& cancel)
{
    DepositResult result;
    result.transitions.push_back(DepositState::Idle);

    auto const pool = pools_.getPool(amount, token);

    auto const now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    result.note = DepositNote::create(
        pool.id,
        token,
        amount,
        recipient,
        static_cast<std::uint64_t>(std::max<std::int64_t>(now.count(), 0)));
    result.noteString = result.note.encode();
    transition(result, DepositState::NoteGenerated);

    submit(result, pool, cancel);
    return result;
}

void
DepositManager::submit(
    DepositResult& result,
    PoolState const& pool,
    CancelToken const& cancel)
{
    if (cancel.cancelled())
    {
        transition(result, DepositState::Aborted);
        return;
    }

    auto active = trees_.getActiveTrees(pool.id);
    if (active.empty())
    {
        // A tree provisioned since the last refresh
        active = trees_.getActiveTrees(pool.id, true);
    }
    auto const tree = MerkleTreeManager::pickTreeForDeposit(active);
    result.treeId = tree.id;
    transition(result, DepositState::TreeSelected);

    // Last point at which the deposit can be abandoned
    if (cancel.cancelled())
    {
        transition(result, DepositState::Aborted);
        return;
    }

    auto const commitment = result.note.commitment();
    auto const op = makeOperation(DepositOperation{
        pool.id, tree.id, commitment, result.note.denomination});

    transition(result, DepositState::CommitmentSubmitted);

    SubmitResult submitted;
    try
    {
        submitted = ledger_.submitAndConfirm(op);
    }
    catch (MixerError const& e)
    {
        JLOG(j_.error()) << "Deposit " << commitment
                         << " submission failed: " << e.what();
        result.error = e.kind();
        result.message = e.what();
        trees_.invalidate();
        transition(result, DepositState::Failed);
        return;
    }

    result.signature = submitted.signature;
    if (!submitted.ok())
    {
        JLOG(j_.error()) << "Deposit " << commitment << " rejected: "
                         << to_string(submitted.code) << " "
                         << submitted.message;
        result.error = ErrorKind::SubmissionRejected;
        result.message = submitted.message;
        // The cached tree list may be what led to the rejection
        trees_.invalidate();
        transition(result, DepositState::Failed);
        return;
    }

    result.confirmed = true;
    result.note.leafIndex = submitted.leafIndex;
    result.noteString = result.note.encode();
    trees_.invalidate();
    transition(result, DepositState::Confirmed);

    JLOG(j_.info()) << "Deposit confirmed: " << result.note.denomination << " "
                    << to_string(result.note.tokenType) << " into tree "
                    << tree.id << " signature " << submitted.signature;
}

bool
DepositManager::checkDepositStatus(DepositNote const& note)
{
    auto const commitment = note.commitment();
    auto const proof = withNetworkRetry(config_, j_, "Deposit status", [&] {
        return ledger_.fetchMerkleProof(commitment);
    });
    return proof.has_value();
}

DepositResult
DepositManager::retryDeposit(DepositNote const& note, CancelToken const& cancel)
{
    DepositResult result;
    result.note = note;
    result.noteString = note.encode();
    result.transitions.push_back(DepositState::Idle);

    auto const commitment = note.commitment();
    auto const existing = withNetworkRetry(config_, j_, "Deposit status", [&] {
        return ledger_.fetchMerkleProof(commitment);
    });
    if (existing)
    {
        JLOG(j_.info()) << "Deposit " << commitment << " already confirmed";
        result.confirmed = true;
        result.treeId = existing->treeId;
        result.note.leafIndex = existing->leafIndex;
        result.noteString = result.note.encode();
        transition(result, DepositState::Confirmed);
        return result;
    }

    auto const pool = pools_.getPoolById(note.poolId);
    if (pool.denomination != note.denomination ||
        pool.tokenType != note.tokenType)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidNoteFormat,
            "note does not match its pool",
            commitment);

    transition(result, DepositState::NoteGenerated);
    submit(result, pool, cancel);
    return result;
}

} // namespace zkp
} // namespace veil
