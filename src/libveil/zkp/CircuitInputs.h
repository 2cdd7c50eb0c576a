#pragma once

#include <libveil/zkp/MerkleProof.h>
#include <libveil/zkp/Note.h>
#include <libveil/zkp/Types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Ordered public signals of a withdrawal proof:
 * root, nullifierHash, recipient, relayer, fee.
 */
struct PublicSignals
{
    uint256 root;
    uint256 nullifierHash;
    AccountId recipient;
    AccountId relayer;
    std::uint64_t fee = 0;

    /** Decimal field elements in circuit order. */
    std::vector<std::string>
    toStrings() const;

    bool
    operator==(PublicSignals const&) const = default;
};

/**
 * Positional input vector of the withdrawal circuit:
 * nullifier, secret, pathElements, pathIndices, root, recipient, relayer, fee.
 *
 * nullifierHash is carried alongside because it is a public signal the
 * circuit recomputes from nullifier and the pool id.
 */
struct CircuitInputs
{
    uint256 nullifier;
    uint256 secret;
    std::vector<uint256> pathElements;
    std::vector<std::uint8_t> pathIndices;
    uint256 root;
    AccountId recipient;
    AccountId relayer;
    std::uint64_t fee = 0;

    uint256 nullifierHash;
    AccountId treeId;

    PublicSignals
    publicSignals() const;

    /** Canonical byte serialization in circuit order. */
    Blob
    serialize() const;

    /** SHA-256 of serialize(); the proof cache key. */
    uint256
    fingerprint() const;
};

/**
 * Assemble and validate the circuit inputs for spending a note.
 *
 * @param treeDepth depth the proof must have
 * @param relayer defaults to the recipient when absent
 * @throws MixerError(InvalidCircuitInput) on any shape violation
 */
CircuitInputs
buildWithdrawalCircuitInputs(
    DepositNote const& note,
    MerkleProof const& proof,
    AccountId const& recipient,
    std::optional<AccountId> const& relayer,
    std::uint64_t fee,
    std::size_t treeDepth);

/** Re-run the shape checks on an assembled vector. */
void
validateCircuitInputs(CircuitInputs const& inputs, std::size_t treeDepth);

/** The public signals a correct proof for these inputs must carry. */
std::vector<std::string>
expectedPublicSignals(CircuitInputs const& inputs);

} // namespace zkp
} // namespace veil
