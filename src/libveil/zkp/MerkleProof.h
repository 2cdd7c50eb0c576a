#pragma once

#include <libveil/zkp/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Membership proof for one commitment.
 * Siblings are ordered from the leaf level upward.
 */
struct MerkleProof
{
    AccountId treeId;
    uint256 root;
    std::vector<uint256> siblings;
    std::uint64_t leafIndex = 0;

    std::size_t
    depth() const
    {
        return siblings.size();
    }

    bool
    operator==(MerkleProof const&) const = default;
};

/**
 * Binary expansion of the leaf index, least significant bit first.
 * Bit i is 1 when the node at level i is a right child.
 *
 * @throws MixerError(InvalidCircuitInput) if the index does not fit
 */
std::vector<std::uint8_t>
pathBits(std::uint64_t leafIndex, std::size_t depth);

/** Fold the leaf up through the siblings. */
uint256
computeRoot(uint256 const& leaf, MerkleProof const& proof);

bool
verifyMerkleProof(uint256 const& leaf, MerkleProof const& proof);

} // namespace zkp
} // namespace veil
