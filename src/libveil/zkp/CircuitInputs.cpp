#include <libveil/zkp/CircuitInputs.h>
#include <libveil/zkp/FieldElement.h>
#include <libveil/zkp/IncrementalMerkleTree.h>
#include <libveil/zkp/LittleEndian.h>
#include <libveil/zkp/MixerError.h>

#include <xrpl/basics/contract.h>

#include <openssl/sha.h>

namespace veil {
namespace zkp {

namespace {

[[noreturn]] void
badInput(std::string const& what, uint256 const& context)
{
    ripple::Throw<MixerError>(ErrorKind::InvalidCircuitInput, what, context);
}

void
appendHash(Blob& out, uint256 const& value)
{
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace

std::vector<std::string>
PublicSignals::toStrings() const
{
    return {
        toDecimal(toFieldElement(root)),
        toDecimal(toFieldElement(nullifierHash)),
        toDecimal(toFieldElement(recipient)),
        toDecimal(toFieldElement(relayer)),
        toDecimal(toFieldElement(fee))};
}

PublicSignals
CircuitInputs::publicSignals() const
{
    return PublicSignals{root, nullifierHash, recipient, relayer, fee};
}

Blob
CircuitInputs::serialize() const
{
    Blob out;
    out.reserve(32 * (6 + pathElements.size()) + pathIndices.size() + 16);

    appendHash(out, nullifier);
    appendHash(out, secret);
    appendLE<std::uint64_t>(out, pathElements.size());
    for (auto const& element : pathElements)
        appendHash(out, element);
    out.insert(out.end(), pathIndices.begin(), pathIndices.end());
    appendHash(out, root);
    appendHash(out, recipient);
    appendHash(out, relayer);
    appendLE(out, fee);
    appendHash(out, nullifierHash);
    appendHash(out, treeId);

    return out;
}

uint256
CircuitInputs::fingerprint() const
{
    auto const bytes = serialize();
    uint256 result;
    SHA256(bytes.data(), bytes.size(), result.data());
    return result;
}

CircuitInputs
buildWithdrawalCircuitInputs(
    DepositNote const& note,
    MerkleProof const& proof,
    AccountId const& recipient,
    std::optional<AccountId> const& relayer,
    std::uint64_t fee,
    std::size_t treeDepth)
{
    auto const nullifierHash = note.nullifierHash();

    if (recipient.isZero())
        badInput("recipient is empty", nullifierHash);

    if (proof.depth() != treeDepth)
        badInput(
            "path length " + std::to_string(proof.depth()) +
                " does not match tree depth " + std::to_string(treeDepth),
            nullifierHash);

    if (fee > note.denomination)
        badInput("fee exceeds denomination", nullifierHash);

    CircuitInputs inputs;
    inputs.nullifier = note.nullifier;
    inputs.secret = note.secret;
    inputs.pathElements = proof.siblings;
    inputs.pathIndices = pathBits(proof.leafIndex, treeDepth);
    inputs.root = proof.root;
    inputs.recipient = recipient;
    inputs.relayer = relayer.value_or(recipient);
    inputs.fee = fee;
    inputs.nullifierHash = nullifierHash;
    inputs.treeId = proof.treeId;

    validateCircuitInputs(inputs, treeDepth);
    return inputs;
}

void
validateCircuitInputs(CircuitInputs const& inputs, std::size_t treeDepth)
{
    auto const& context = inputs.nullifierHash;

    if (treeDepth == 0 || treeDepth > IncrementalMerkleTree::MAX_DEPTH)
        badInput("tree depth out of range", context);

    if (inputs.pathElements.size() != treeDepth)
        badInput("pathElements length does not match tree depth", context);

    if (inputs.pathIndices.size() != inputs.pathElements.size())
        badInput("pathIndices length does not match pathElements", context);

    for (auto const bit : inputs.pathIndices)
    {
        if (bit > 1)
            badInput("path index is not a bit", context);
    }

    if (inputs.nullifier.isZero() || inputs.secret.isZero())
        badInput("note secret material is empty", context);

    if (inputs.root.isZero())
        badInput("merkle root is empty", context);
}

std::vector<std::string>
expectedPublicSignals(CircuitInputs const& inputs)
{
    return inputs.publicSignals().toStrings();
}

} // namespace zkp
} // namespace veil
