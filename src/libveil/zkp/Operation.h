#pragma once

#include <libveil/zkp/Types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace veil {
namespace zkp {

enum class OpCode : std::uint8_t { deposit = 0x01, withdraw = 0x02 };

/**
 * Deposit payload
 *   opcode u8 | pool [32] | tree [32] | commitment [32] | amount u64
 *
 * Transfers the amount into the pool and appends the commitment to the
 * tree in one ledger operation.
 */
struct DepositOperation
{
    static constexpr std::size_t size = 1 + 32 + 32 + 32 + 8;

    AccountId pool;
    AccountId tree;
    uint256 commitment;
    std::uint64_t amount = 0;

    bool
    operator==(DepositOperation const&) const = default;
};

/**
 * Withdraw payload
 *   opcode u8 | pool [32] | tree [32] | proofLen u32 | proof |
 *   root [32] | nullifierHash [32] | recipient [32] | relayer [32] | fee u64
 */
struct WithdrawOperation
{
    static constexpr std::size_t fixedSize =
        1 + 32 + 32 + 4 + 32 + 32 + 32 + 32 + 8;
    static constexpr std::size_t maxProofSize = 10000;

    AccountId pool;
    AccountId tree;
    Blob proof;
    uint256 root;
    uint256 nullifierHash;
    AccountId recipient;
    AccountId relayer;
    std::uint64_t fee = 0;

    bool
    operator==(WithdrawOperation const&) const = default;
};

using OperationBody = std::variant<DepositOperation, WithdrawOperation>;

/** An encoded request as handed to the ledger. */
struct Operation
{
    Blob payload;

    std::optional<OpCode>
    opcode() const;

    /** SHA-256 of the payload, hex. */
    std::string
    id() const;
};

Operation
makeOperation(OperationBody const& body);

/** nullopt on an unknown opcode or a length mismatch. */
std::optional<OperationBody>
parseOperation(Operation const& op);

} // namespace zkp
} // namespace veil
