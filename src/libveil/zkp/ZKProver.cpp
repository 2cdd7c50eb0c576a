#include <libveil/zkp/FieldElement.h>
#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <algorithm>
#include <future>

namespace veil {
namespace zkp {

std::string
to_string(ProofStage stage)
{
    switch (stage)
    {
        case ProofStage::Setup:
            return "setup";
        case ProofStage::Witness:
            return "witness";
        case ProofStage::Proving:
            return "proving";
        case ProofStage::Done:
            return "done";
    }
    return "unknown";
}

//------------------------------------------------------------------------------

void
ProgressChannel::publish(ProofStage stage, std::string detail)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_)
            return;
        events_.push_back(ProofProgress{stage, std::move(detail)});
    }
    cv_.notify_all();
}

std::optional<ProofProgress>
ProgressChannel::poll()
{
    std::lock_guard lock(mutex_);
    if (events_.empty())
        return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProofProgress>
ProgressChannel::waitNext(std::chrono::milliseconds timeout)
{
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(
            lock, timeout, [this] { return !events_.empty() || closed_; }))
        return std::nullopt;
    if (events_.empty())
        return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<ProofProgress>
ProgressChannel::drain()
{
    std::lock_guard lock(mutex_);
    std::vector<ProofProgress> result(
        std::make_move_iterator(events_.begin()),
        std::make_move_iterator(events_.end()));
    events_.clear();
    return result;
}

void
ProgressChannel::close()
{
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool
ProgressChannel::closed() const
{
    std::lock_guard lock(mutex_);
    return closed_;
}

//------------------------------------------------------------------------------

ProofCache::ProofCache(std::size_t capacity) : capacity_(capacity)
{
}

std::optional<WithdrawalProof>
ProofCache::lookup(uint256 const& fingerprint) const
{
    std::lock_guard lock(mutex_);
    auto const it = entries_.find(fingerprint);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void
ProofCache::insert(WithdrawalProof const& proof)
{
    if (capacity_ == 0)
        return;

    std::lock_guard lock(mutex_);
    auto const [it, inserted] =
        entries_.insert_or_assign(proof.fingerprint, proof);
    if (inserted)
        order_.push_back(proof.fingerprint);

    while (entries_.size() > capacity_ && !order_.empty())
    {
        entries_.erase(order_.front());
        order_.pop_front();
    }
}

void
ProofCache::erase(uint256 const& fingerprint)
{
    std::lock_guard lock(mutex_);
    if (entries_.erase(fingerprint) != 0)
        order_.erase(
            std::remove(order_.begin(), order_.end(), fingerprint),
            order_.end());
}

std::size_t
ProofCache::invalidateRoot(uint256 const& root)
{
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (it->second.signals.root == root)
        {
            order_.erase(
                std::remove(order_.begin(), order_.end(), it->first),
                order_.end());
            it = entries_.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::size_t
ProofCache::size() const
{
    std::lock_guard lock(mutex_);
    return entries_.size();
}

//------------------------------------------------------------------------------

ProofGenerator::ProofGenerator(
    Prover& prover,
    Verifier& verifier,
    ProofCache& cache,
    MixerConfig const& config,
    beast::Journal journal)
    : prover_(prover)
    , verifier_(verifier)
    , cache_(cache)
    , config_(config)
    , j_(journal)
{
}

std::optional<WithdrawalProof>
ProofGenerator::generateProof(
    CircuitInputs const& inputs,
    ProgressChannel* progress,
    CancelToken const& cancel)
{
    ProgressChannel unobserved;
    ProgressChannel& channel = progress ? *progress : unobserved;

    if (cancel.cancelled())
        return std::nullopt;

    auto const fingerprint = inputs.fingerprint();
    if (auto cached = cache_.lookup(fingerprint))
    {
        JLOG(j_.debug()) << "Reusing cached proof for nullifier "
                         << inputs.nullifierHash;
        channel.publish(ProofStage::Done, "cached");
        return cached;
    }

    auto const expected = expectedPublicSignals(inputs);

    channel.publish(ProofStage::Setup, config_.provingArtifact);

    // inputs and channel outlive the task: get() below always joins it
    auto future = std::async(std::launch::async, [&, cancel]() {
        return prover_.prove(inputs, config_.provingArtifact, channel, cancel);
    });

    auto const started = std::chrono::steady_clock::now();
    if (config_.proofStallWarning.count() > 0)
    {
        while (future.wait_for(config_.proofStallWarning) !=
               std::future_status::ready)
        {
            auto const elapsed =
                std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::steady_clock::now() - started);
            JLOG(j_.warn()) << "Proof generation for nullifier "
                            << inputs.nullifierHash << " still running after "
                            << elapsed.count() << "s";
        }
    }

    std::optional<ProverOutput> output;
    try
    {
        output = future.get();
    }
    catch (MixerError const&)
    {
        throw;
    }
    catch (std::exception const& e)
    {
        JLOG(j_.warn()) << "Prover failed: " << e.what();
        ripple::Throw<MixerError>(
            ErrorKind::ProofGenerationFailed, e.what(), inputs.nullifierHash);
    }

    if (!output || cancel.cancelled())
    {
        JLOG(j_.debug()) << "Proof generation for nullifier "
                         << inputs.nullifierHash << " cancelled";
        return std::nullopt;
    }

    if (output->proof.empty())
        ripple::Throw<MixerError>(
            ErrorKind::ProofGenerationFailed,
            "prover returned an empty proof",
            inputs.nullifierHash);

    if (output->publicSignals.size() != expected.size())
        ripple::Throw<MixerError>(
            ErrorKind::ProofGenerationFailed,
            "prover returned " + std::to_string(output->publicSignals.size()) +
                " public signals, expected " + std::to_string(expected.size()),
            inputs.nullifierHash);

    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        auto const actual = parseFieldElement(output->publicSignals[i]);
        if (!actual || *actual != *parseFieldElement(expected[i]))
            ripple::Throw<MixerError>(
                ErrorKind::ProofGenerationFailed,
                "public signal " + std::to_string(i) +
                    " does not match the circuit inputs",
                inputs.nullifierHash);
    }

    WithdrawalProof proof{
        std::move(output->proof), inputs.publicSignals(), fingerprint};
    cache_.insert(proof);

    channel.publish(ProofStage::Done);
    JLOG(j_.debug()) << "Generated proof for nullifier " << inputs.nullifierHash
                     << " in "
                     << std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - started)
                            .count()
                     << "ms";
    return proof;
}

bool
ProofGenerator::verifyProof(WithdrawalProof const& proof) const
{
    return verifier_.verify(proof.proof, proof.signals.toStrings());
}

void
ProofGenerator::invalidateRoot(uint256 const& root)
{
    auto const removed = cache_.invalidateRoot(root);
    if (removed != 0)
    {
        JLOG(j_.debug()) << "Dropped " << removed << " cached proofs for root "
                         << root;
    }
}

void
ProofGenerator::discard(uint256 const& fingerprint)
{
    cache_.erase(fingerprint);
}

} // namespace zkp
} // namespace veil
