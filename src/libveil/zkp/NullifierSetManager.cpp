#include <libveil/zkp/Keylet.h>
#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/NetworkRetry.h>
#include <libveil/zkp/NullifierSetManager.h>

#include <xrpl/basics/Log.h>

namespace veil {
namespace zkp {

NullifierSetManager::NullifierSetManager(
    Ledger& ledger,
    MixerConfig const& config,
    beast::Journal journal)
    : ledger_(ledger), config_(config), j_(journal)
{
}

bool
NullifierSetManager::knownSpent(uint256 const& nullifierHash)
{
    std::lock_guard lock(mutex_);
    return knownSpent_.count(nullifierHash) != 0;
}

void
NullifierSetManager::noteSpent(uint256 const& nullifierHash)
{
    std::lock_guard lock(mutex_);
    knownSpent_.insert(nullifierHash);
}

bool
NullifierSetManager::checkNullifier(uint256 const& nullifierHash)
{
    if (knownSpent(nullifierHash))
        return true;

    auto const data = withNetworkRetry(config_, j_, "Nullifier read", [&] {
        return ledger_.readAccount(keylet::nullifier(nullifierHash));
    });

    if (!data)
        return false;

    auto const record = parseNullifierState(*data);
    if (!record)
    {
        // An account exists at the nullifier address, so the hash has
        // been used even if the record is unreadable.
        JLOG(j_.warn()) << "Malformed nullifier account for " << nullifierHash;
        noteSpent(nullifierHash);
        return true;
    }

    if (record->hash != nullifierHash || !record->spent)
        return false;

    JLOG(j_.debug()) << "Nullifier " << nullifierHash << " is spent";
    noteSpent(nullifierHash);
    return true;
}

std::vector<bool>
NullifierSetManager::batchCheckNullifiers(
    std::vector<uint256> const& nullifierHashes)
{
    std::vector<bool> result;
    result.reserve(nullifierHashes.size());
    for (auto const& hash : nullifierHashes)
        result.push_back(checkNullifier(hash));
    return result;
}

} // namespace zkp
} // namespace veil
