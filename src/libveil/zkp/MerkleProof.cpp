#include <libveil/zkp/IncrementalMerkleTree.h>
#include <libveil/zkp/MerkleProof.h>
#include <libveil/zkp/MixerError.h>

#include <xrpl/basics/contract.h>

namespace veil {
namespace zkp {

std::vector<std::uint8_t>
pathBits(std::uint64_t leafIndex, std::size_t depth)
{
    if (depth == 0 || depth > IncrementalMerkleTree::MAX_DEPTH)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidCircuitInput,
            "tree depth " + std::to_string(depth) + " out of range");

    if ((leafIndex >> depth) != 0)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidCircuitInput,
            "leaf index " + std::to_string(leafIndex) +
                " exceeds tree depth " + std::to_string(depth));

    std::vector<std::uint8_t> bits;
    bits.reserve(depth);
    for (std::size_t i = 0; i < depth; ++i)
        bits.push_back(static_cast<std::uint8_t>((leafIndex >> i) & 1));
    return bits;
}

uint256
computeRoot(uint256 const& leaf, MerkleProof const& proof)
{
    auto const bits = pathBits(proof.leafIndex, proof.depth());

    uint256 current = leaf;
    for (std::size_t level = 0; level < bits.size(); ++level)
    {
        if (bits[level])
            current = IncrementalMerkleTree::hash(proof.siblings[level], current);
        else
            current = IncrementalMerkleTree::hash(current, proof.siblings[level]);
    }
    return current;
}

bool
verifyMerkleProof(uint256 const& leaf, MerkleProof const& proof)
{
    if (proof.siblings.empty() ||
        proof.depth() > IncrementalMerkleTree::MAX_DEPTH ||
        (proof.leafIndex >> proof.depth()) != 0)
        return false;
    return computeRoot(leaf, proof) == proof.root;
}

} // namespace zkp
} // namespace veil
