#pragma once

#include <libveil/zkp/CircuitInputs.h>
#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/ZKProver.h>

#include <xrpl/basics/contract.h>
#include <xrpl/beast/utility/Journal.h>

#include <openssl/sha.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {
namespace test {

inline beast::Journal
nullJournal()
{
    return beast::Journal{beast::Journal::getNullSink()};
}

/** Deterministic address derived from a label. */
inline AccountId
account(std::string const& label)
{
    AccountId result;
    SHA256(
        reinterpret_cast<unsigned char const*>(label.data()),
        label.size(),
        result.data());
    return result;
}

/** Defaults with retries that do not sleep. */
inline MixerConfig
testConfig()
{
    MixerConfig config;
    config.networkBackoff = std::chrono::milliseconds{0};
    return config;
}

/** Proof bytes bound to the signals: SHA-256 of the joined strings. */
inline Blob
fakeProof(std::vector<std::string> const& signals)
{
    std::string joined;
    for (auto const& s : signals)
        joined += s + "|";

    Blob proof(32);
    SHA256(
        reinterpret_cast<unsigned char const*>(joined.data()),
        joined.size(),
        proof.data());
    return proof;
}

/**
 * Prover that skips the circuit and emits a fakeProof over the expected
 * signals. The hook runs on the proving thread after the witness stage.
 */
class FakeProver : public Prover
{
public:
    std::atomic<int> calls{0};
    std::function<void(CircuitInputs const&, CancelToken const&)> hook;
    bool fail = false;
    bool wrongSignals = false;

    std::optional<ProverOutput>
    prove(
        CircuitInputs const& inputs,
        std::string const&,
        ProgressChannel& progress,
        CancelToken const& cancel) override
    {
        ++calls;
        progress.publish(ProofStage::Witness);
        if (hook)
            hook(inputs, cancel);
        if (cancel.cancelled())
            return std::nullopt;
        if (fail)
            throw std::runtime_error("witness generation failed");

        progress.publish(ProofStage::Proving);
        auto signals = expectedPublicSignals(inputs);
        if (wrongSignals)
            signals.back() = "12345";
        return ProverOutput{fakeProof(signals), signals};
    }
};

class FakeVerifier : public Verifier
{
public:
    bool
    verify(Blob const& proof, std::vector<std::string> const& signals)
        const override
    {
        return proof == fakeProof(signals);
    }
};

/**
 * Ledger wrapper that injects transport failures and lets a test act
 * just before an operation reaches the real ledger.
 */
class ScriptedLedger : public Ledger
{
public:
    explicit ScriptedLedger(Ledger& inner) : inner_(inner)
    {
    }

    // Number of upcoming reads that fail with NetworkError
    int readFailures = 0;
    int reads = 0;
    bool submitFails = false;
    bool hideNullifiers = false;
    std::function<void(Operation const&)> beforeSubmit;

    SubmitResult
    submitAndConfirm(Operation const& op) override
    {
        if (submitFails)
            ripple::Throw<MixerError>(
                ErrorKind::NetworkError, "connection reset");
        if (beforeSubmit)
            beforeSubmit(op);
        return inner_.submitAndConfirm(op);
    }

    std::optional<Blob>
    readAccount(AccountId const& id) override
    {
        read();
        auto data = inner_.readAccount(id);
        if (hideNullifiers && data && !data->empty() &&
            (*data)[0] == static_cast<std::uint8_t>(AccountKind::nullifier))
            return std::nullopt;
        return data;
    }

    std::vector<AccountRecord>
    readProgramAccounts(AccountFilter const& filter) override
    {
        read();
        return inner_.readProgramAccounts(filter);
    }

    std::optional<MerkleProof>
    fetchMerkleProof(uint256 const& commitment) override
    {
        read();
        return inner_.fetchMerkleProof(commitment);
    }

private:
    Ledger& inner_;

    void
    read()
    {
        ++reads;
        if (readFailures > 0)
        {
            --readFailures;
            ripple::Throw<MixerError>(ErrorKind::NetworkError, "timeout");
        }
    }
};

/** Run f and report the MixerError kind it threw, if any. */
template <class F>
std::optional<ErrorKind>
errorKindOf(F&& f)
{
    try
    {
        f();
    }
    catch (MixerError const& e)
    {
        return e.kind();
    }
    return std::nullopt;
}

} // namespace test
} // namespace zkp
} // namespace veil
