#pragma once

#include <libveil/zkp/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Incremental Merkle Tree
 *
 * Append-only binary tree of fixed depth. Empty positions hold the zero
 * leaf; nodes are SHA256(left || right). Filled nodes are kept per level
 * so that appends and authentication paths touch one node per level.
 */
class IncrementalMerkleTree
{
public:
    static constexpr std::size_t MAX_DEPTH = 32;

    explicit IncrementalMerkleTree(std::size_t depth);

    /** @return the position of the new leaf */
    std::uint64_t
    append(uint256 const& leaf);

    uint256
    root() const;

    /** Siblings from the leaf level up to (not including) the root. */
    std::vector<uint256>
    authPath(std::uint64_t position) const;

    bool
    verify(
        uint256 const& leaf,
        std::vector<uint256> const& path,
        std::uint64_t position,
        uint256 const& expectedRoot) const;

    uint256
    leaf(std::uint64_t position) const;

    std::uint64_t
    size() const
    {
        return size_;
    }

    bool
    empty() const
    {
        return size_ == 0;
    }

    std::uint64_t
    capacity() const
    {
        return std::uint64_t{1} << depth_;
    }

    bool
    full() const
    {
        return size_ >= capacity();
    }

    std::size_t
    depth() const
    {
        return depth_;
    }

    static uint256
    hash(uint256 const& left, uint256 const& right);

private:
    std::size_t depth_;
    std::uint64_t size_ = 0;

    // levels_[0] holds the leaves; levels_[depth_] holds the root once set
    std::vector<std::vector<uint256>> levels_;

    // Root of an empty subtree of height i
    std::vector<uint256> emptyHashes_;

    uint256
    node(std::size_t level, std::uint64_t position) const;
};

} // namespace zkp
} // namespace veil
