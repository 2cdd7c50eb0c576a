#pragma once

#include <libveil/zkp/CircuitInputs.h>
#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/Types.h>

#include <xrpl/beast/utility/Journal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {

enum class ProofStage { Setup, Witness, Proving, Done };

std::string
to_string(ProofStage stage);

struct ProofProgress
{
    ProofStage stage;
    std::string detail;
};

/**
 * Ordered stream of progress events from one proof generation.
 *
 * The prover publishes from its worker thread; the caller polls or waits
 * on its own thread. Publishing after close() is a no-op.
 */
class ProgressChannel
{
public:
    void
    publish(ProofStage stage, std::string detail = {});

    std::optional<ProofProgress>
    poll();

    std::optional<ProofProgress>
    waitNext(std::chrono::milliseconds timeout);

    std::vector<ProofProgress>
    drain();

    void
    close();

    bool
    closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProofProgress> events_;
    bool closed_ = false;
};

/**
 * Shared cancellation flag. Copies observe the same flag.
 */
class CancelToken
{
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    void
    cancel() const
    {
        flag_->store(true);
    }

    bool
    cancelled() const
    {
        return flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct ProverOutput
{
    Blob proof;
    std::vector<std::string> publicSignals;
};

/**
 * External proving backend.
 *
 * prove() runs on a worker thread. It should publish Witness and Proving
 * stages, check the token between stages, and return nullopt once it sees
 * a cancellation. Failures are reported by throwing.
 */
class Prover
{
public:
    virtual ~Prover() = default;

    virtual std::optional<ProverOutput>
    prove(
        CircuitInputs const& inputs,
        std::string const& artifact,
        ProgressChannel& progress,
        CancelToken const& cancel) = 0;
};

/** Checks proof bytes against the ordered public signals. */
class Verifier
{
public:
    virtual ~Verifier() = default;

    virtual bool
    verify(Blob const& proof, std::vector<std::string> const& publicSignals)
        const = 0;
};

struct WithdrawalProof
{
    Blob proof;
    PublicSignals signals;
    uint256 fingerprint;
};

/**
 * Proofs keyed by input fingerprint.
 *
 * Every entry remembers the root it was built on; invalidateRoot drops
 * all of them at once so a proof is never reused across roots.
 */
class ProofCache
{
public:
    explicit ProofCache(std::size_t capacity);

    std::optional<WithdrawalProof>
    lookup(uint256 const& fingerprint) const;

    void
    insert(WithdrawalProof const& proof);

    void
    erase(uint256 const& fingerprint);

    std::size_t
    invalidateRoot(uint256 const& root);

    std::size_t
    size() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::map<uint256, WithdrawalProof> entries_;
    std::deque<uint256> order_;
};

/**
 * Drives the prover for withdrawal proofs.
 */
class ProofGenerator
{
public:
    ProofGenerator(
        Prover& prover,
        Verifier& verifier,
        ProofCache& cache,
        MixerConfig const& config,
        beast::Journal journal);

    /**
     * Produce a proof for the inputs.
     *
     * Blocks until the prover finishes. A run longer than the configured
     * stall interval is logged but never aborted.
     *
     * @param progress receives stage events, may be null
     * @return nullopt if the token was cancelled
     * @throws MixerError(ProofGenerationFailed) if the prover failed or
     *         returned signals that do not match the inputs
     */
    std::optional<WithdrawalProof>
    generateProof(
        CircuitInputs const& inputs,
        ProgressChannel* progress,
        CancelToken const& cancel);

    bool
    verifyProof(WithdrawalProof const& proof) const;

    void
    invalidateRoot(uint256 const& root);

    void
    discard(uint256 const& fingerprint);

private:
    Prover& prover_;
    Verifier& verifier_;
    ProofCache& cache_;
    MixerConfig const& config_;
    beast::Journal j_;
};

} // namespace zkp
} // namespace veil
