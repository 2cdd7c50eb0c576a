#include <libveil/zkp/Keylet.h>

#include <openssl/sha.h>

#include <cstring>
#include <vector>

namespace veil {
namespace zkp {

namespace {

// Distinct leading byte per kind keeps the address spaces disjoint
AccountId
indexHash(AccountKind kind, std::uint8_t const* key, std::size_t size)
{
    std::vector<std::uint8_t> input;
    input.reserve(size + 1);
    input.push_back(static_cast<std::uint8_t>(kind));
    input.insert(input.end(), key, key + size);

    AccountId result;
    SHA256(input.data(), input.size(), result.data());
    return result;
}

} // namespace

namespace keylet {

AccountId
pool(std::uint64_t denomination, TokenType token)
{
    std::uint8_t key[9];
    for (int i = 0; i < 8; ++i)
        key[i] = (denomination >> (i * 8)) & 0xFF;
    key[8] = static_cast<std::uint8_t>(token);
    return indexHash(AccountKind::pool, key, sizeof(key));
}

AccountId
tree(AccountId const& pool, std::uint32_t sequence)
{
    std::uint8_t key[36];
    std::memcpy(key, pool.data(), 32);
    for (int i = 0; i < 4; ++i)
        key[32 + i] = (sequence >> (i * 8)) & 0xFF;
    return indexHash(AccountKind::tree, key, sizeof(key));
}

AccountId
nullifier(uint256 const& nullifierHash)
{
    return indexHash(AccountKind::nullifier, nullifierHash.data(), 32);
}

} // namespace keylet

} // namespace zkp
} // namespace veil
