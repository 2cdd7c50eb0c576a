#include <libveil/zkp/IncrementalMerkleTree.h>

#include <openssl/sha.h>

#include <cstring>
#include <stdexcept>

namespace veil {
namespace zkp {

IncrementalMerkleTree::IncrementalMerkleTree(std::size_t depth)
    : depth_(depth)
{
    if (depth == 0 || depth > MAX_DEPTH)
        throw std::invalid_argument("Tree depth out of range");

    levels_.resize(depth_ + 1);

    emptyHashes_.resize(depth_ + 1);
    emptyHashes_[0] = uint256{};
    for (std::size_t i = 1; i <= depth_; ++i)
        emptyHashes_[i] = hash(emptyHashes_[i - 1], emptyHashes_[i - 1]);
}

uint256
IncrementalMerkleTree::hash(uint256 const& left, uint256 const& right)
{
    std::uint8_t input[64];
    std::memcpy(input, left.data(), 32);
    std::memcpy(input + 32, right.data(), 32);

    uint256 result;
    SHA256(input, sizeof(input), result.data());
    return result;
}

uint256
IncrementalMerkleTree::node(std::size_t level, std::uint64_t position) const
{
    auto const& row = levels_[level];
    if (position < row.size())
        return row[position];
    return emptyHashes_[level];
}

std::uint64_t
IncrementalMerkleTree::append(uint256 const& leaf)
{
    if (full())
        throw std::overflow_error("Merkle tree is full");

    std::uint64_t const position = size_++;
    levels_[0].push_back(leaf);

    // Recompute the path above the new leaf
    std::uint64_t pos = position;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        std::uint64_t const left = pos & ~std::uint64_t{1};
        uint256 const parent = hash(node(level, left), node(level, left + 1));

        pos >>= 1;
        auto& row = levels_[level + 1];
        if (pos < row.size())
            row[pos] = parent;
        else
            row.push_back(parent);
    }

    return position;
}

uint256
IncrementalMerkleTree::root() const
{
    return node(depth_, 0);
}

uint256
IncrementalMerkleTree::leaf(std::uint64_t position) const
{
    if (position >= size_)
        throw std::out_of_range("Position not in tree");
    return levels_[0][position];
}

std::vector<uint256>
IncrementalMerkleTree::authPath(std::uint64_t position) const
{
    if (position >= size_)
        throw std::out_of_range("Position not in tree");

    std::vector<uint256> path;
    path.reserve(depth_);

    std::uint64_t pos = position;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        path.push_back(node(level, pos ^ 1));
        pos >>= 1;
    }
    return path;
}

bool
IncrementalMerkleTree::verify(
    uint256 const& leaf,
    std::vector<uint256> const& path,
    std::uint64_t position,
    uint256 const& expectedRoot) const
{
    if (path.size() != depth_)
        return false;

    uint256 current = leaf;
    for (std::size_t level = 0; level < depth_; ++level)
    {
        if ((position >> level) & 1)
            current = hash(path[level], current);
        else
            current = hash(current, path[level]);
    }
    return current == expectedRoot;
}

} // namespace zkp
} // namespace veil
