#include <libveil/zkp/MerkleProof.h>
#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/Operation.h>
#include <libveil/zkp/WithdrawManager.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

namespace veil {
namespace zkp {

std::string
to_string(WithdrawState state)
{
    switch (state)
    {
        case WithdrawState::Idle:
            return "Idle";
        case WithdrawState::NoteParsed:
            return "NoteParsed";
        case WithdrawState::NullifierChecked:
            return "NullifierChecked";
        case WithdrawState::ProofGenerated:
            return "ProofGenerated";
        case WithdrawState::Submitted:
            return "Submitted";
        case WithdrawState::Confirmed:
            return "Confirmed";
        case WithdrawState::Failed:
            return "Failed";
        case WithdrawState::AlreadySpent:
            return "AlreadySpent";
        case WithdrawState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

//------------------------------------------------------------------------------

class WithdrawManager::InFlightGuard
{
public:
    InFlightGuard(WithdrawManager& manager, uint256 const& key)
        : manager_(manager), key_(key)
    {
        std::lock_guard lock(manager_.mutex_);
        if (!manager_.inFlight_.insert(key_).second)
            ripple::Throw<MixerError>(
                ErrorKind::WithdrawalInFlight,
                "a withdrawal for this note is already running",
                key_);
    }

    ~InFlightGuard()
    {
        std::lock_guard lock(manager_.mutex_);
        manager_.inFlight_.erase(key_);
    }

    InFlightGuard(InFlightGuard const&) = delete;
    InFlightGuard&
    operator=(InFlightGuard const&) = delete;

private:
    WithdrawManager& manager_;
    uint256 key_;
};

//------------------------------------------------------------------------------

WithdrawManager::WithdrawManager(
    Ledger& ledger,
    PoolRegistry& pools,
    MerkleTreeManager& trees,
    NullifierSetManager& nullifiers,
    ProofGenerator& proofs,
    RelayerRegistry& relayers,
    MixerConfig const& config,
    beast::Journal journal)
    : ledger_(ledger)
    , pools_(pools)
    , trees_(trees)
    , nullifiers_(nullifiers)
    , proofs_(proofs)
    , relayers_(relayers)
    , config_(config)
    , j_(journal)
{
}

std::size_t
WithdrawManager::inFlight() const
{
    std::lock_guard lock(mutex_);
    return inFlight_.size();
}

void
WithdrawManager::transition(WithdrawResult& result, WithdrawState next) const
{
    JLOG(j_.debug()) << "Withdrawal " << result.nullifierHash << ": "
                     << to_string(result.state) << " -> " << to_string(next);
    result.state = next;
    result.transitions.push_back(next);
}

WithdrawManager::FeeTerms
WithdrawManager::resolveFunding(Funding const& funding, PoolState const& pool)
{
    struct Resolver
    {
        WithdrawManager& self;
        PoolState const& pool;

        FeeTerms
        operator()(SelfPaid const&) const
        {
            return FeeTerms{};
        }

        FeeTerms
        operator()(ViaRelayer const& via) const
        {
            if (via.fee)
                return FeeTerms{via.relayer, *via.fee};

            auto const relayer = self.relayers_.getRelayer(via.relayer);
            if (!relayer || !relayer->active)
                ripple::Throw<MixerError>(
                    ErrorKind::RelayerUnavailable,
                    "relayer " + to_string(via.relayer) + " is not active");
            return FeeTerms{via.relayer, relayer->feeFor(pool.denomination)};
        }
    };

    auto terms = std::visit(Resolver{*this, pool}, funding);
    PoolRegistry::checkFee(pool, terms.fee);
    return terms;
}

WithdrawResult
WithdrawManager::withdraw(
    std::string const& noteString,
    AccountId const& recipient,
    Funding const& funding,
    CancelToken const& cancel,
    ProgressChannel* progress)
{
    WithdrawResult result;
    result.transitions.push_back(WithdrawState::Idle);

    auto const note = DepositNote::decode(noteString);
    result.nullifierHash = note.nullifierHash();
    result.recipient = recipient;
    transition(result, WithdrawState::NoteParsed);

    InFlightGuard guard(*this, result.nullifierHash);

    try
    {
        run(result, note, recipient, funding, cancel, progress);
    }
    catch (MixerError const& e)
    {
        transition(
            result,
            e.kind() == ErrorKind::AlreadySpent ? WithdrawState::AlreadySpent
                                                : WithdrawState::Failed);
        JLOG(j_.warn()) << "Withdrawal " << result.nullifierHash
                        << " failed: " << e.what();
        throw;
    }

    if (progress)
        progress->close();
    return result;
}

void
WithdrawManager::run(
    WithdrawResult& result,
    DepositNote const& note,
    AccountId const& recipient,
    Funding const& funding,
    CancelToken const& cancel,
    ProgressChannel* progress)
{
    auto const& nullifierHash = result.nullifierHash;
    auto const commitment = note.commitment();

    if (note.recipient && *note.recipient != recipient)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidCircuitInput,
            "note is bound to a different recipient",
            nullifierHash);

    auto const pool = pools_.getPoolById(note.poolId);
    if (pool.denomination != note.denomination ||
        pool.tokenType != note.tokenType)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidNoteFormat,
            "note does not match its pool",
            nullifierHash);

    auto const terms = resolveFunding(funding, pool);
    result.relayer = terms.relayer;
    result.fee = terms.fee;
    result.amount = pool.denomination - terms.fee;

    if (cancel.cancelled())
        return transition(result, WithdrawState::Aborted);

    if (nullifiers_.checkNullifier(nullifierHash))
        ripple::Throw<MixerError>(
            ErrorKind::AlreadySpent, "note has been withdrawn", nullifierHash);
    transition(result, WithdrawState::NullifierChecked);

    for (int attempt = 0; attempt <= config_.staleRootRetries; ++attempt)
    {
        if (cancel.cancelled())
            return transition(result, WithdrawState::Aborted);

        auto const merkleProof = trees_.getMerkleProof(commitment);
        if (!verifyMerkleProof(commitment, merkleProof))
        {
            JLOG(j_.warn()) << "Inconsistent Merkle proof for " << commitment
                            << ", refetching";
            trees_.invalidate();
            continue;
        }

        auto const tree = trees_.getTree(merkleProof.treeId);
        auto const inputs = buildWithdrawalCircuitInputs(
            note, merkleProof, recipient, terms.relayer, terms.fee, tree.depth);

        ++result.proofAttempts;
        auto const proof = proofs_.generateProof(inputs, progress, cancel);
        if (!proof)
            return transition(result, WithdrawState::Aborted);

        if (!proofs_.verifyProof(*proof))
        {
            proofs_.discard(proof->fingerprint);
            ripple::Throw<MixerError>(
                ErrorKind::ProofGenerationFailed,
                "generated proof does not verify",
                nullifierHash);
        }
        transition(result, WithdrawState::ProofGenerated);

        // Last point at which the withdrawal can be abandoned
        if (cancel.cancelled())
            return transition(result, WithdrawState::Aborted);

        auto const op = makeOperation(WithdrawOperation{
            pool.id,
            merkleProof.treeId,
            proof->proof,
            merkleProof.root,
            nullifierHash,
            recipient,
            terms.relayer.value_or(recipient),
            terms.fee});

        transition(result, WithdrawState::Submitted);
        auto const submitted = ledger_.submitAndConfirm(op);
        result.signature = submitted.signature;

        switch (submitted.code)
        {
            case SubmitCode::Success:
                nullifiers_.noteSpent(nullifierHash);
                trees_.invalidate();
                transition(result, WithdrawState::Confirmed);
                JLOG(j_.info()) << "Withdrawal confirmed: " << result.amount
                                << " " << to_string(note.tokenType) << " to "
                                << recipient << " signature "
                                << submitted.signature;
                return;

            case SubmitCode::NullifierSpent:
                nullifiers_.noteSpent(nullifierHash);
                ripple::Throw<MixerError>(
                    ErrorKind::AlreadySpent,
                    "ledger reports the nullifier as spent",
                    nullifierHash);

            case SubmitCode::StaleRoot:
                JLOG(j_.warn()) << "Root " << merkleProof.root
                                << " went stale, regenerating proof";
                proofs_.invalidateRoot(merkleProof.root);
                trees_.invalidate();
                break;

            case SubmitCode::InvalidProof:
                proofs_.discard(proof->fingerprint);
                ripple::Throw<MixerError>(
                    ErrorKind::ProofGenerationFailed,
                    "ledger rejected the proof: " + submitted.message,
                    nullifierHash);

            case SubmitCode::Rejected:
                ripple::Throw<MixerError>(
                    ErrorKind::SubmissionRejected,
                    submitted.message,
                    nullifierHash);
        }
    }

    ripple::Throw<MixerError>(
        ErrorKind::StaleProof,
        "root kept changing after " + std::to_string(result.proofAttempts) +
            " proofs",
        nullifierHash);
}

WithdrawResult
WithdrawManager::withdrawViaBestRelayer(
    std::string const& noteString,
    AccountId const& recipient,
    RelayerFilter const& filter,
    CancelToken const& cancel,
    ProgressChannel* progress)
{
    auto const best = relayers_.getBestRelayer(filter);
    if (!best)
    {
        JLOG(j_.warn()) << "No relayer available, withdrawing self-paid";
        return withdraw(noteString, recipient, SelfPaid{}, cancel, progress);
    }

    try
    {
        return withdraw(
            noteString,
            recipient,
            ViaRelayer{best->address, std::nullopt},
            cancel,
            progress);
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::RelayerUnavailable)
            throw;
        JLOG(j_.warn()) << "Relayer " << best->address
                        << " unavailable, withdrawing self-paid";
    }
    return withdraw(noteString, recipient, SelfPaid{}, cancel, progress);
}

} // namespace zkp
} // namespace veil
