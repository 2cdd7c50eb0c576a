#pragma once

#include <libveil/zkp/DepositManager.h>
#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/MerkleTreeManager.h>
#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/NullifierSetManager.h>
#include <libveil/zkp/PoolRegistry.h>
#include <libveil/zkp/RelayerRegistry.h>
#include <libveil/zkp/WithdrawManager.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/beast/clock/abstract_clock.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>

namespace veil {
namespace zkp {

/**
 * Every mixer component bound to one ledger handle.
 *
 * Caches live here rather than in globals, so two contexts over two
 * ledgers never share state. The ledger, prover and verifier must
 * outlive the context.
 */
class MixerContext
{
public:
    using clock_type = beast::abstract_clock<std::chrono::steady_clock>;

    MixerContext(
        Ledger& ledger,
        Prover& prover,
        Verifier& verifier,
        MixerConfig config,
        beast::Journal journal);

    MixerContext(
        Ledger& ledger,
        Prover& prover,
        Verifier& verifier,
        MixerConfig config,
        clock_type& clock,
        beast::Journal journal);

    MixerContext(MixerContext const&) = delete;
    MixerContext&
    operator=(MixerContext const&) = delete;

    MixerConfig const&
    config() const
    {
        return config_;
    }

    Ledger&
    ledger()
    {
        return ledger_;
    }

    MerkleTreeManager&
    trees()
    {
        return trees_;
    }

    NullifierSetManager&
    nullifiers()
    {
        return nullifiers_;
    }

    PoolRegistry&
    pools()
    {
        return pools_;
    }

    RelayerRegistry&
    relayers()
    {
        return relayers_;
    }

    ProofCache&
    proofCache()
    {
        return proofCache_;
    }

    ProofGenerator&
    proofs()
    {
        return proofs_;
    }

    DepositManager&
    deposits()
    {
        return deposits_;
    }

    WithdrawManager&
    withdrawals()
    {
        return withdrawals_;
    }

private:
    MixerConfig const config_;
    Ledger& ledger_;
    beast::Journal j_;

    MerkleTreeManager trees_;
    NullifierSetManager nullifiers_;
    PoolRegistry pools_;
    RelayerRegistry relayers_;
    ProofCache proofCache_;
    ProofGenerator proofs_;
    DepositManager deposits_;
    WithdrawManager withdrawals_;
};

} // namespace zkp
} // namespace veil
