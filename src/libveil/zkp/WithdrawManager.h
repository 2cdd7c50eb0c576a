#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/MerkleTreeManager.h>
#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/Note.h>
#include <libveil/zkp/NullifierSetManager.h>
#include <libveil/zkp/PoolRegistry.h>
#include <libveil/zkp/RelayerRegistry.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/beast/utility/Journal.h>

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace veil {
namespace zkp {

enum class WithdrawState {
    Idle,
    NoteParsed,
    NullifierChecked,
    ProofGenerated,
    Submitted,
    Confirmed,
    Failed,
    AlreadySpent,
    Aborted
};

std::string
to_string(WithdrawState state);

/** The recipient receives the whole denomination and pays nothing. */
struct SelfPaid
{
};

/**
 * A relayer submits and takes its fee out of the withdrawn amount.
 * Without an explicit fee the relayer's advertised rate applies.
 */
struct ViaRelayer
{
    AccountId relayer;
    std::optional<std::uint64_t> fee;
};

using Funding = std::variant<SelfPaid, ViaRelayer>;

struct WithdrawResult
{
    WithdrawState state = WithdrawState::Idle;
    std::vector<WithdrawState> transitions;

    uint256 nullifierHash;
    AccountId recipient;
    std::optional<AccountId> relayer;
    std::uint64_t fee = 0;
    std::uint64_t amount = 0;
    std::string signature;
    int proofAttempts = 0;
};

/**
 * Withdrawal orchestration
 *
 * Runs parse, spend check, proof and submission strictly in order. The
 * cheap checks come first so a spent note never reaches the prover.
 * - At most one withdrawal per note is in flight in this process
 * - A stale root at submission regenerates the proof, up to the
 *   configured bound, then fails with StaleProof
 * - The ledger's verdict on the nullifier wins over the local check
 * - Cancellation is honoured until the request is submitted
 *
 * Failures are thrown as MixerError after the terminal state is logged.
 */
class WithdrawManager
{
public:
    WithdrawManager(
        Ledger& ledger,
        PoolRegistry& pools,
        MerkleTreeManager& trees,
        NullifierSetManager& nullifiers,
        ProofGenerator& proofs,
        RelayerRegistry& relayers,
        MixerConfig const& config,
        beast::Journal journal);

    WithdrawResult
    withdraw(
        std::string const& noteString,
        AccountId const& recipient,
        Funding const& funding = SelfPaid{},
        CancelToken const& cancel = {},
        ProgressChannel* progress = nullptr);

    /**
     * Withdraw through the best scoring relayer, or self-paid when no
     * relayer qualifies or the chosen one is unavailable.
     */
    WithdrawResult
    withdrawViaBestRelayer(
        std::string const& noteString,
        AccountId const& recipient,
        RelayerFilter const& filter = {},
        CancelToken const& cancel = {},
        ProgressChannel* progress = nullptr);

    std::size_t
    inFlight() const;

private:
    class InFlightGuard;

    struct FeeTerms
    {
        std::optional<AccountId> relayer;
        std::uint64_t fee = 0;
    };

    Ledger& ledger_;
    PoolRegistry& pools_;
    MerkleTreeManager& trees_;
    NullifierSetManager& nullifiers_;
    ProofGenerator& proofs_;
    RelayerRegistry& relayers_;
    MixerConfig const& config_;
    beast::Journal j_;

    mutable std::mutex mutex_;
    std::set<uint256> inFlight_;

    void
    transition(WithdrawResult& result, WithdrawState next) const;

    FeeTerms
    resolveFunding(Funding const& funding, PoolState const& pool);

    void
    run(WithdrawResult& result,
        DepositNote const& note,
        AccountId const& recipient,
        Funding const& funding,
        CancelToken const& cancel,
        ProgressChannel* progress);
};

} // namespace zkp
} // namespace veil
