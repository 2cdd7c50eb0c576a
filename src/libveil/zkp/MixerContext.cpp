#include <libveil/zkp/MixerContext.h>

#include <utility>

namespace veil {
namespace zkp {

MixerContext::MixerContext(
    Ledger& ledger,
    Prover& prover,
    Verifier& verifier,
    MixerConfig config,
    beast::Journal journal)
    : MixerContext(
          ledger,
          prover,
          verifier,
          std::move(config),
          beast::get_abstract_clock<std::chrono::steady_clock>(),
          journal)
{
}

MixerContext::MixerContext(
    Ledger& ledger,
    Prover& prover,
    Verifier& verifier,
    MixerConfig config,
    clock_type& clock,
    beast::Journal journal)
    : config_(std::move(config))
    , ledger_(ledger)
    , j_(journal)
    , trees_(ledger_, config_, clock, j_)
    , nullifiers_(ledger_, config_, j_)
    , pools_(ledger_, config_, clock, j_)
    , relayers_(ledger_, config_, clock, j_)
    , proofCache_(config_.proofCacheSize)
    , proofs_(prover, verifier, proofCache_, config_, j_)
    , deposits_(ledger_, pools_, trees_, config_, j_)
    , withdrawals_(
          ledger_,
          pools_,
          trees_,
          nullifiers_,
          proofs_,
          relayers_,
          config_,
          j_)
{
}

} // namespace zkp
} // namespace veil
