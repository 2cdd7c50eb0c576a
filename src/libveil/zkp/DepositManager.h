#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/MerkleTreeManager.h>
#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/Note.h>
#include <libveil/zkp/PoolRegistry.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/beast/utility/Journal.h>

#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {

enum class DepositState {
    Idle,
    NoteGenerated,
    TreeSelected,
    CommitmentSubmitted,
    Confirmed,
    Failed,
    Aborted
};

std::string
to_string(DepositState state);

struct DepositResult
{
    DepositNote note;
    std::string noteString;
    DepositState state = DepositState::Idle;
    std::vector<DepositState> transitions;

    /** False when funds may or may not have moved; keep the note. */
    bool confirmed = false;
    std::string signature;
    AccountId treeId;

    std::optional<ErrorKind> error;
    std::string message;
};

/**
 * Deposit orchestration
 *
 * Creates the note, picks a tree and submits transfer plus leaf insertion
 * as one ledger operation:
 * - Everything before submission is cancellable and throws on error
 * - Once submitted the operation belongs to the ledger
 * - A submission failure still returns the note, marked unconfirmed, so
 *   the deposit can be checked or retried with the same note
 */
class DepositManager
{
public:
    DepositManager(
        Ledger& ledger,
        PoolRegistry& pools,
        MerkleTreeManager& trees,
        MixerConfig const& config,
        beast::Journal journal);

    /**
     * Deposit one denomination into its pool.
     *
     * @param amount pool denomination in base units
     * @param recipient binds the commitment to one withdrawal destination
     * @throws MixerError PoolNotFound, NoAvailableTree or NetworkError
     *         before anything is submitted
     */
    DepositResult
    deposit(
        std::uint64_t amount,
        TokenType token,
        std::optional<AccountId> const& recipient = std::nullopt,
        CancelToken const& cancel = {});

    /** True once the note's commitment is in a tree. */
    bool
    checkDepositStatus(DepositNote const& note);

    /**
     * Submit an unconfirmed note again. Nothing is submitted if the
     * commitment is already present.
     */
    DepositResult
    retryDeposit(DepositNote const& note, CancelToken const& cancel = {});

private:
    Ledger& ledger_;
    PoolRegistry& pools_;
    MerkleTreeManager& trees_;
    MixerConfig const& config_;
    beast::Journal j_;

    void
    transition(DepositResult& result, DepositState next) const;

    /** Tree selection through submission. */
    void
    submit(
        DepositResult& result,
        PoolState const& pool,
        CancelToken const& cancel);
};

} // namespace zkp
} // namespace veil
