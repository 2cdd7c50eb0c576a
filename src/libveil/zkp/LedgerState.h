#pragma once

#include <libveil/zkp/Keylet.h>
#include <libveil/zkp/Note.h>
#include <libveil/zkp/Types.h>

#include <xrpl/basics/mulDiv.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace veil {
namespace zkp {

/*
    Program account layouts, little-endian, kind byte at offset 0.

    Pool       76 bytes   denomination u64 @8, token u8 @16, tree [32] @17,
                          totalDeposits u64 @49, totalWithdrawals u64 @57,
                          maxFeeBasisPoints u16 @65, minWithdrawal u64 @67,
                          active u8 @75
    Relayer    80 bytes   active u8 @32, feeBasisPoints u16 @34,
                          totalRelayed u64 @36, totalFees u64 @44,
                          successRate u16 @52 (hundredths of a percent),
                          responseTime u16 @54 (milliseconds)
    Tree       84 bytes   root [32] @8, depth u32 @40, leafCount u64 @44,
                          pool [32] @52
    Nullifier  81 bytes   pool [32] @8, hash [32] @40, spent u8 @72,
                          timestamp i64 @73
*/

struct PoolState
{
    static constexpr std::size_t size = 76;
    static constexpr std::uint16_t defaultMaxFeeBasisPoints = 200;

    AccountId id;
    std::uint64_t denomination = 0;
    TokenType tokenType = TokenType::SOL;
    AccountId treeId;
    std::uint64_t totalDeposits = 0;
    std::uint64_t totalWithdrawals = 0;
    std::uint16_t maxFeeBasisPoints = defaultMaxFeeBasisPoints;
    std::uint64_t minWithdrawal = 0;
    bool active = true;

    /** Largest relayer fee the pool accepts, in base units. */
    std::uint64_t
    maxFee() const
    {
        return ripple::mulDiv(denomination, maxFeeBasisPoints, 10000)
            .value_or(denomination);
    }

    bool
    operator==(PoolState const&) const = default;
};

struct RelayerState
{
    static constexpr std::size_t size = 80;

    AccountId address;
    bool active = false;
    std::uint16_t feeBasisPoints = 0;
    std::uint64_t totalRelayed = 0;
    std::uint64_t totalFees = 0;
    std::uint16_t successRate = 0;
    std::uint16_t responseTime = 0;

    bool
    operator==(RelayerState const&) const = default;
};

struct TreeState
{
    static constexpr std::size_t size = 84;

    AccountId id;
    AccountId pool;
    uint256 root;
    std::uint32_t depth = 0;
    std::uint64_t leafCount = 0;

    std::uint64_t
    capacity() const
    {
        return depth >= 64 ? ~std::uint64_t{0} : std::uint64_t{1} << depth;
    }

    bool
    full() const
    {
        return leafCount >= capacity();
    }

    bool
    operator==(TreeState const&) const = default;
};

struct NullifierState
{
    static constexpr std::size_t size = 81;

    AccountId pool;
    uint256 hash;
    bool spent = false;
    std::int64_t timestamp = 0;

    bool
    operator==(NullifierState const&) const = default;
};

Blob
serialize(PoolState const& pool);

Blob
serialize(RelayerState const& relayer);

Blob
serialize(TreeState const& tree);

Blob
serialize(NullifierState const& nullifier);

/** Parsers return nullopt on a wrong kind byte, size or field value. */
std::optional<PoolState>
parsePoolState(AccountId const& id, Blob const& data);

std::optional<RelayerState>
parseRelayerState(AccountId const& address, Blob const& data);

std::optional<TreeState>
parseTreeState(AccountId const& id, Blob const& data);

std::optional<NullifierState>
parseNullifierState(Blob const& data);

} // namespace zkp
} // namespace veil
