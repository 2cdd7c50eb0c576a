#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/NetworkRetry.h>
#include <libveil/zkp/PoolRegistry.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

namespace veil {
namespace zkp {

PoolRegistry::PoolRegistry(
    Ledger& ledger,
    MixerConfig const& config,
    clock_type& clock,
    beast::Journal journal)
    : ledger_(ledger), config_(config), clock_(clock), j_(journal)
{
}

void
PoolRegistry::refreshLocked(bool forceRefresh)
{
    auto const now = clock_.now();
    if (!forceRefresh && fetched_ && now - *fetched_ < config_.poolCacheTtl)
        return;

    std::vector<AccountRecord> records;
    try
    {
        records = withNetworkRetry(config_, j_, "Pool listing", [&] {
            return ledger_.readProgramAccounts(
                AccountFilter{AccountKind::pool, PoolState::size});
        });
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::NetworkError || !fetched_)
            throw;
        JLOG(j_.warn()) << "Using cached pool list: " << e.what();
        return;
    }

    std::map<Key, PoolState> pools;
    for (auto const& record : records)
    {
        auto pool = parsePoolState(record.id, record.data);
        if (!pool)
        {
            JLOG(j_.warn()) << "Skipping malformed pool account " << record.id;
            continue;
        }
        if (!pool->active)
            continue;

        Key const key{pool->denomination, pool->tokenType};
        auto const [it, inserted] = pools.emplace(key, *pool);
        if (!inserted)
        {
            JLOG(j_.error())
                << "Duplicate pool for " << pool->denomination << " "
                << to_string(pool->tokenType) << ": keeping " << it->second.id
                << ", ignoring " << pool->id;
        }
    }

    pools_ = std::move(pools);
    fetched_ = now;
    JLOG(j_.debug()) << "Loaded " << pools_.size() << " pools";
}

void
PoolRegistry::refresh(bool forceRefresh)
{
    std::lock_guard lock(mutex_);
    refreshLocked(forceRefresh);
}

std::vector<PoolState>
PoolRegistry::getPools(bool forceRefresh)
{
    std::lock_guard lock(mutex_);
    refreshLocked(forceRefresh);

    std::vector<PoolState> result;
    result.reserve(pools_.size());
    for (auto const& [key, pool] : pools_)
        result.push_back(pool);
    return result;
}

PoolState
PoolRegistry::getPool(std::uint64_t denomination, TokenType token)
{
    std::lock_guard lock(mutex_);
    refreshLocked(false);

    auto it = pools_.find(Key{denomination, token});
    if (it == pools_.end())
    {
        // A pool provisioned since the last refresh
        refreshLocked(true);
        it = pools_.find(Key{denomination, token});
    }
    if (it == pools_.end())
        ripple::Throw<MixerError>(
            ErrorKind::PoolNotFound,
            "no pool for " + std::to_string(denomination) + " " +
                to_string(token));
    return it->second;
}

PoolState
PoolRegistry::getPoolById(AccountId const& id)
{
    std::lock_guard lock(mutex_);
    for (bool force : {false, true})
    {
        refreshLocked(force);
        for (auto const& [key, pool] : pools_)
        {
            if (pool.id == id)
                return pool;
        }
    }
    ripple::Throw<MixerError>(
        ErrorKind::PoolNotFound, "unknown pool " + to_string(id));
}

void
PoolRegistry::checkFee(PoolState const& pool, std::uint64_t fee)
{
    if (fee > pool.maxFee())
        ripple::Throw<MixerError>(
            ErrorKind::InvalidFee,
            "fee " + std::to_string(fee) + " exceeds pool maximum " +
                std::to_string(pool.maxFee()));

    if (fee > pool.denomination ||
        pool.denomination - fee < pool.minWithdrawal)
        ripple::Throw<MixerError>(
            ErrorKind::InvalidFee,
            "fee " + std::to_string(fee) +
                " leaves less than the minimum withdrawal");
}

} // namespace zkp
} // namespace veil
