#pragma once

#include <libveil/zkp/FieldElement.h>
#include <libveil/zkp/ZKProver.h>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <memory>
#include <string>

namespace veil {
namespace zkp {

/**
 * Local Groth16 verification over alt_bn128.
 *
 * Proof bytes are a libsnark-serialized r1cs_gg_ppzksnark_proof; public
 * signals are decimal field elements in circuit order.
 */
class Groth16Verifier : public Verifier
{
public:
    using VerificationKey =
        libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;
    using Proof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

    explicit Groth16Verifier(VerificationKey key);

    /**
     * Load a verification key written with operator<<.
     * @return nullptr if the file can not be read
     */
    static std::unique_ptr<Groth16Verifier>
    fromFile(std::string const& path);

    bool
    verify(Blob const& proof, std::vector<std::string> const& publicSignals)
        const override;

    static Blob
    serializeProof(Proof const& proof);

    static std::optional<Proof>
    deserializeProof(Blob const& data);

private:
    VerificationKey key_;
};

} // namespace zkp
} // namespace veil
