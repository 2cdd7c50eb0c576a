#pragma once

#include <libveil/zkp/Note.h>
#include <libveil/zkp/Types.h>

#include <cstdint>

namespace veil {
namespace zkp {

/** Single-byte account kinds stored at offset 0 of every program account. */
enum class AccountKind : std::uint8_t {
    pool = 1,
    relayer = 2,
    tree = 3,
    nullifier = 4
};

/** Address derivations for program-owned accounts. */
namespace keylet {

AccountId
pool(std::uint64_t denomination, TokenType token);

AccountId
tree(AccountId const& pool, std::uint32_t sequence);

AccountId
nullifier(uint256 const& nullifierHash);

} // namespace keylet

} // namespace zkp
} // namespace veil
