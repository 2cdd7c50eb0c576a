#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/LittleEndian.h>

namespace veil {
namespace zkp {

namespace {

bool
hasShape(Blob const& data, AccountKind kind, std::size_t size)
{
    return data.size() == size &&
        data[0] == static_cast<std::uint8_t>(kind);
}

Blob
makeAccount(AccountKind kind, std::size_t size)
{
    Blob data(size, 0);
    data[0] = static_cast<std::uint8_t>(kind);
    return data;
}

} // namespace

Blob
serialize(PoolState const& pool)
{
    auto data = makeAccount(AccountKind::pool, PoolState::size);
    auto* p = data.data();

    putLE(p + 8, pool.denomination);
    p[16] = static_cast<std::uint8_t>(pool.tokenType);
    putHash(p + 17, pool.treeId);
    putLE(p + 49, pool.totalDeposits);
    putLE(p + 57, pool.totalWithdrawals);
    putLE(p + 65, pool.maxFeeBasisPoints);
    putLE(p + 67, pool.minWithdrawal);
    p[75] = pool.active ? 1 : 0;

    return data;
}

Blob
serialize(RelayerState const& relayer)
{
    auto data = makeAccount(AccountKind::relayer, RelayerState::size);
    auto* p = data.data();

    p[32] = relayer.active ? 1 : 0;
    putLE(p + 34, relayer.feeBasisPoints);
    putLE(p + 36, relayer.totalRelayed);
    putLE(p + 44, relayer.totalFees);
    putLE(p + 52, relayer.successRate);
    putLE(p + 54, relayer.responseTime);

    return data;
}

Blob
serialize(TreeState const& tree)
{
    auto data = makeAccount(AccountKind::tree, TreeState::size);
    auto* p = data.data();

    putHash(p + 8, tree.root);
    putLE(p + 40, tree.depth);
    putLE(p + 44, tree.leafCount);
    putHash(p + 52, tree.pool);

    return data;
}

Blob
serialize(NullifierState const& nullifier)
{
    auto data = makeAccount(AccountKind::nullifier, NullifierState::size);
    auto* p = data.data();

    putHash(p + 8, nullifier.pool);
    putHash(p + 40, nullifier.hash);
    p[72] = nullifier.spent ? 1 : 0;
    putLE(p + 73, nullifier.timestamp);

    return data;
}

std::optional<PoolState>
parsePoolState(AccountId const& id, Blob const& data)
{
    if (!hasShape(data, AccountKind::pool, PoolState::size))
        return std::nullopt;

    auto const* p = data.data();
    if (p[16] > static_cast<std::uint8_t>(TokenType::USDC))
        return std::nullopt;

    PoolState pool;
    pool.id = id;
    pool.denomination = getLE<std::uint64_t>(p + 8);
    pool.tokenType = static_cast<TokenType>(p[16]);
    pool.treeId = getHash(p + 17);
    pool.totalDeposits = getLE<std::uint64_t>(p + 49);
    pool.totalWithdrawals = getLE<std::uint64_t>(p + 57);
    pool.maxFeeBasisPoints = getLE<std::uint16_t>(p + 65);
    pool.minWithdrawal = getLE<std::uint64_t>(p + 67);
    pool.active = p[75] != 0;
    return pool;
}

std::optional<RelayerState>
parseRelayerState(AccountId const& address, Blob const& data)
{
    if (!hasShape(data, AccountKind::relayer, RelayerState::size))
        return std::nullopt;

    auto const* p = data.data();

    RelayerState relayer;
    relayer.address = address;
    relayer.active = p[32] != 0;
    relayer.feeBasisPoints = getLE<std::uint16_t>(p + 34);
    relayer.totalRelayed = getLE<std::uint64_t>(p + 36);
    relayer.totalFees = getLE<std::uint64_t>(p + 44);
    relayer.successRate = getLE<std::uint16_t>(p + 52);
    relayer.responseTime = getLE<std::uint16_t>(p + 54);
    return relayer;
}

std::optional<TreeState>
parseTreeState(AccountId const& id, Blob const& data)
{
    if (!hasShape(data, AccountKind::tree, TreeState::size))
        return std::nullopt;

    auto const* p = data.data();

    TreeState tree;
    tree.id = id;
    tree.root = getHash(p + 8);
    tree.depth = getLE<std::uint32_t>(p + 40);
    tree.leafCount = getLE<std::uint64_t>(p + 44);
    tree.pool = getHash(p + 52);
    if (tree.depth == 0 || tree.depth > 32)
        return std::nullopt;
    return tree;
}

std::optional<NullifierState>
parseNullifierState(Blob const& data)
{
    if (!hasShape(data, AccountKind::nullifier, NullifierState::size))
        return std::nullopt;

    auto const* p = data.data();

    NullifierState nullifier;
    nullifier.pool = getHash(p + 8);
    nullifier.hash = getHash(p + 40);
    nullifier.spent = p[72] != 0;
    nullifier.timestamp = getLE<std::int64_t>(p + 73);
    return nullifier;
}

} // namespace zkp
} // namespace veil
