#pragma once

#include <libveil/zkp/Keylet.h>
#include <libveil/zkp/MerkleProof.h>
#include <libveil/zkp/Operation.h>
#include <libveil/zkp/Types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {

enum class SubmitCode {
    Success,
    NullifierSpent,
    StaleRoot,
    InvalidProof,
    Rejected
};

std::string
to_string(SubmitCode code);

struct SubmitResult
{
    SubmitCode code = SubmitCode::Rejected;
    std::string signature;
    std::optional<std::uint64_t> leafIndex;
    std::string message;

    bool
    ok() const
    {
        return code == SubmitCode::Success;
    }
};

struct AccountFilter
{
    std::optional<AccountKind> kind;
    std::optional<std::size_t> dataSize;

    bool
    matches(Blob const& data) const
    {
        if (dataSize && data.size() != *dataSize)
            return false;
        if (kind &&
            (data.empty() || data[0] != static_cast<std::uint8_t>(*kind)))
            return false;
        return true;
    }
};

struct AccountRecord
{
    AccountId id;
    Blob data;
};

/**
 * Ledger client handle.
 *
 * The ledger owns the trees and the nullifier set and applies every
 * operation atomically. Implementations report transport failures by
 * throwing MixerError(NetworkError); everything else is a SubmitResult.
 */
class Ledger
{
public:
    virtual ~Ledger() = default;

    /** Sign, submit and wait for the operation to be final. */
    virtual SubmitResult
    submitAndConfirm(Operation const& op) = 0;

    virtual std::optional<Blob>
    readAccount(AccountId const& id) = 0;

    virtual std::vector<AccountRecord>
    readProgramAccounts(AccountFilter const& filter) = 0;

    /** Indexer lookup of the current proof for a commitment. */
    virtual std::optional<MerkleProof>
    fetchMerkleProof(uint256 const& commitment) = 0;
};

} // namespace zkp
} // namespace veil
