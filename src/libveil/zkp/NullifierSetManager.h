#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/MixerConfig.h>

#include <xrpl/beast/utility/Journal.h>

#include <mutex>
#include <set>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Spent checks against the ledger's nullifier set.
 *
 * The ledger is authoritative. An "unspent" answer is always read from
 * the ledger; spends this process has observed are remembered because a
 * nullifier can never become unspent again.
 */
class NullifierSetManager
{
public:
    NullifierSetManager(
        Ledger& ledger,
        MixerConfig const& config,
        beast::Journal journal);

    /** @return true if the nullifier hash is recorded as spent */
    bool
    checkNullifier(uint256 const& nullifierHash);

    /** Independent reads in input order; not a consistent snapshot. */
    std::vector<bool>
    batchCheckNullifiers(std::vector<uint256> const& nullifierHashes);

    /** Remember a spend confirmed or reported by the ledger. */
    void
    noteSpent(uint256 const& nullifierHash);

private:
    Ledger& ledger_;
    MixerConfig const& config_;
    beast::Journal j_;

    std::mutex mutex_;
    std::set<uint256> knownSpent_;

    bool
    knownSpent(uint256 const& nullifierHash);
};

} // namespace zkp
} // namespace veil
