#pragma once

#include <libveil/zkp/Ledger.h>
#include <libveil/zkp/LedgerState.h>
#include <libveil/zkp/MixerConfig.h>

#include <xrpl/beast/clock/abstract_clock.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace veil {
namespace zkp {

/** Decoded relayer record. Unknown metrics are empty. */
struct Relayer
{
    AccountId address;
    bool active = false;
    std::uint16_t feeBasisPoints = 0;
    double feePercent = 0;
    double totalVolume = 0;
    double totalFees = 0;
    std::optional<double> successRate;
    std::optional<std::uint32_t> responseTimeMs;

    static Relayer
    fromState(RelayerState const& state);

    /** Fee charged on a withdrawal of the given size, in base units. */
    std::uint64_t
    feeFor(std::uint64_t denomination) const;
};

/** A relayer with an unknown metric fails that metric's bound. */
struct RelayerFilter
{
    std::optional<double> maxFeePercent;
    std::optional<double> minSuccessRate;
    std::optional<std::uint32_t> maxResponseTimeMs;

    bool
    matches(Relayer const& relayer) const;
};

enum class RelayerOrder { LowestFee, MostReliable, Fastest, HighestVolume };

/**
 * Relayer records read from the ledger, cached for a fixed TTL.
 *
 * Relayers are a convenience path: when the ledger can not be read the
 * last good list is served instead of an error.
 */
class RelayerRegistry
{
public:
    using clock_type = beast::abstract_clock<std::chrono::steady_clock>;

    RelayerRegistry(
        Ledger& ledger,
        MixerConfig const& config,
        clock_type& clock,
        beast::Journal journal);

    void
    refresh(bool forceRefresh = false);

    std::vector<Relayer>
    getActiveRelayers(bool forceRefresh = false);

    std::optional<Relayer>
    getRelayer(AccountId const& address, bool forceRefresh = false);

    std::vector<Relayer>
    getFilteredRelayers(RelayerFilter const& filter);

    /**
     * Active relayers passing the filter, stably sorted by the given
     * order. A limit of zero returns all of them.
     */
    std::vector<Relayer>
    sortedRelayers(
        RelayerOrder order,
        RelayerFilter const& filter = {},
        std::size_t limit = 0);

    /**
     * base - feeWeight * fee% + successRate% - responsePenalty + volumeBonus
     *
     * responsePenalty is min(cap, floor(ms / divisor)) and volumeBonus is
     * min(cap, floor(volume)); unknown metrics use the configured defaults.
     */
    double
    score(Relayer const& relayer) const;

    /** Highest score wins; ties keep the first relayer seen. */
    std::optional<Relayer>
    getBestRelayer(RelayerFilter const& filter = {});

    /** Round trip of a fresh record read; nullopt if it failed. */
    std::optional<std::chrono::milliseconds>
    pingRelayer(AccountId const& address);

private:
    struct CachedRelayer
    {
        Relayer relayer;
        clock_type::time_point fetched;
    };

    Ledger& ledger_;
    MixerConfig const& config_;
    clock_type& clock_;
    beast::Journal j_;

    std::mutex mutex_;
    std::vector<Relayer> relayers_;
    std::optional<clock_type::time_point> fetched_;
    std::map<AccountId, CachedRelayer> byAddress_;

    void
    refreshLocked(bool forceRefresh);

    bool
    fresh(clock_type::time_point fetched) const;
};

} // namespace zkp
} // namespace veil
