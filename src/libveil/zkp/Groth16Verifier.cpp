#include <libveil/zkp/Groth16Verifier.h>

#include <fstream>
#include <sstream>

namespace veil {
namespace zkp {

Groth16Verifier::Groth16Verifier(VerificationKey key) : key_(std::move(key))
{
}

std::unique_ptr<Groth16Verifier>
Groth16Verifier::fromFile(std::string const& path)
{
    initCurveParams();

    std::ifstream file(path, std::ios::binary);
    if (!file.good())
        return nullptr;

    VerificationKey key;
    file >> key;
    if (file.fail())
        return nullptr;

    return std::make_unique<Groth16Verifier>(std::move(key));
}

Blob
Groth16Verifier::serializeProof(Proof const& proof)
{
    std::ostringstream oss;
    oss << proof;

    std::string const str = oss.str();
    return Blob(str.begin(), str.end());
}

std::optional<Groth16Verifier::Proof>
Groth16Verifier::deserializeProof(Blob const& data)
{
    if (data.empty())
        return std::nullopt;

    initCurveParams();

    std::string const str(data.begin(), data.end());
    std::istringstream iss(str);

    Proof proof;
    iss >> proof;
    if (iss.fail() || !proof.is_well_formed())
        return std::nullopt;
    return proof;
}

bool
Groth16Verifier::verify(
    Blob const& proof,
    std::vector<std::string> const& publicSignals) const
{
    initCurveParams();

    auto const parsed = deserializeProof(proof);
    if (!parsed)
        return false;

    libsnark::r1cs_primary_input<FieldT> primaryInput;
    primaryInput.reserve(publicSignals.size());
    for (auto const& signal : publicSignals)
    {
        auto element = parseFieldElement(signal);
        if (!element)
            return false;
        primaryInput.push_back(*element);
    }

    return libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
        key_, primaryInput, *parsed);
}

} // namespace zkp
} // namespace veil
