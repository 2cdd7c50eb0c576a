#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/MixerConfig.h>

#include <xrpl/beast/clock/abstract_clock.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace veil {
namespace zkp {

/**
 * Cached view of the provisioned pools, one per (denomination, token).
 *
 * Pool records change only through provisioning, so a stale list is
 * served when the ledger can not be reached.
 */
class PoolRegistry
{
public:
    using clock_type = beast::abstract_clock<std::chrono::steady_clock>;

    PoolRegistry(
        Ledger& ledger,
        MixerConfig const& config,
        clock_type& clock,
        beast::Journal journal);

    void
    refresh(bool forceRefresh = false);

    std::vector<PoolState>
    getPools(bool forceRefresh = false);

    /** @throws MixerError(PoolNotFound) */
    PoolState
    getPool(std::uint64_t denomination, TokenType token);

    /** @throws MixerError(PoolNotFound) */
    PoolState
    getPoolById(AccountId const& id);

    /**
     * Check a relayer fee against the pool's limits.
     * @throws MixerError(InvalidFee)
     */
    static void
    checkFee(PoolState const& pool, std::uint64_t fee);

private:
    using Key = std::pair<std::uint64_t, TokenType>;

    Ledger& ledger_;
    MixerConfig const& config_;
    clock_type& clock_;
    beast::Journal j_;

    std::mutex mutex_;
    std::map<Key, PoolState> pools_;
    std::optional<clock_type::time_point> fetched_;

    void
    refreshLocked(bool forceRefresh);
};

} // namespace zkp
} // namespace veil
