#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/NetworkRetry.h>
#include <libveil/zkp/RelayerRegistry.h>

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

namespace veil {
namespace zkp {

namespace {

// Cumulative volume and fees are kept in base units with 9 decimals
double constexpr volumeUnit = 1e9;

using RelayerLess = std::function<bool(Relayer const&, Relayer const&)>;

RelayerLess const&
comparator(RelayerOrder order)
{
    static std::map<RelayerOrder, RelayerLess> const table{
        {RelayerOrder::LowestFee,
         [](Relayer const& a, Relayer const& b) {
             return a.feePercent < b.feePercent;
         }},
        {RelayerOrder::MostReliable,
         [](Relayer const& a, Relayer const& b) {
             return a.successRate.value_or(0) > b.successRate.value_or(0);
         }},
        {RelayerOrder::Fastest,
         [](Relayer const& a, Relayer const& b) {
             auto constexpr unknown = std::numeric_limits<std::uint32_t>::max();
             return a.responseTimeMs.value_or(unknown) <
                 b.responseTimeMs.value_or(unknown);
         }},
        {RelayerOrder::HighestVolume,
         [](Relayer const& a, Relayer const& b) {
             return a.totalVolume > b.totalVolume;
         }},
    };
    return table.at(order);
}

} // namespace

Relayer
Relayer::fromState(RelayerState const& state)
{
    Relayer r;
    r.address = state.address;
    r.active = state.active;
    r.feeBasisPoints = state.feeBasisPoints;
    r.feePercent = state.feeBasisPoints / 100.0;
    r.totalVolume = state.totalRelayed / volumeUnit;
    r.totalFees = state.totalFees / volumeUnit;
    if (state.successRate != 0)
        r.successRate = state.successRate / 100.0;
    if (state.responseTime != 0)
        r.responseTimeMs = state.responseTime;
    return r;
}

std::uint64_t
Relayer::feeFor(std::uint64_t denomination) const
{
    return ripple::mulDiv(denomination, feeBasisPoints, 10000)
        .value_or(denomination);
}

bool
RelayerFilter::matches(Relayer const& relayer) const
{
    if (maxFeePercent && relayer.feePercent > *maxFeePercent)
        return false;
    if (minSuccessRate &&
        (!relayer.successRate || *relayer.successRate < *minSuccessRate))
        return false;
    if (maxResponseTimeMs &&
        (!relayer.responseTimeMs ||
         *relayer.responseTimeMs > *maxResponseTimeMs))
        return false;
    return true;
}

//------------------------------------------------------------------------------

RelayerRegistry::RelayerRegistry(
    Ledger& ledger,
    MixerConfig const& config,
    clock_type& clock,
    beast::Journal journal)
    : ledger_(ledger), config_(config), clock_(clock), j_(journal)
{
}

bool
RelayerRegistry::fresh(clock_type::time_point fetched) const
{
    return clock_.now() - fetched < config_.relayerCacheTtl;
}

void
RelayerRegistry::refreshLocked(bool forceRefresh)
{
    if (!forceRefresh && fetched_ && fresh(*fetched_))
        return;

    std::vector<AccountRecord> records;
    try
    {
        records = withNetworkRetry(config_, j_, "Relayer listing", [&] {
            return ledger_.readProgramAccounts(
                AccountFilter{AccountKind::relayer, RelayerState::size});
        });
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::NetworkError)
            throw;
        JLOG(j_.warn()) << "Relayer fetch failed, serving "
                        << relayers_.size() << " cached relayers: " << e.what();
        return;
    }

    auto const now = clock_.now();
    std::vector<Relayer> relayers;
    for (auto const& record : records)
    {
        auto const state = parseRelayerState(record.id, record.data);
        if (!state)
        {
            JLOG(j_.debug()) << "Skipping malformed relayer " << record.id;
            continue;
        }
        auto relayer = Relayer::fromState(*state);
        byAddress_[relayer.address] = CachedRelayer{relayer, now};
        if (relayer.active)
            relayers.push_back(std::move(relayer));
    }

    relayers_ = std::move(relayers);
    fetched_ = now;
    JLOG(j_.debug()) << "Loaded " << relayers_.size() << " active relayers";
}

void
RelayerRegistry::refresh(bool forceRefresh)
{
    std::lock_guard lock(mutex_);
    refreshLocked(forceRefresh);
}

std::vector<Relayer>
RelayerRegistry::getActiveRelayers(bool forceRefresh)
{
    std::lock_guard lock(mutex_);
    refreshLocked(forceRefresh);
    return relayers_;
}

std::optional<Relayer>
RelayerRegistry::getRelayer(AccountId const& address, bool forceRefresh)
{
    std::lock_guard lock(mutex_);

    auto const cached = byAddress_.find(address);
    if (!forceRefresh && cached != byAddress_.end() &&
        fresh(cached->second.fetched))
        return cached->second.relayer;

    std::optional<Blob> data;
    try
    {
        data = withNetworkRetry(config_, j_, "Relayer read", [&] {
            return ledger_.readAccount(address);
        });
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::NetworkError)
            throw;
        JLOG(j_.warn()) << "Relayer " << address << " read failed: " << e.what();
        if (cached != byAddress_.end())
            return cached->second.relayer;
        return std::nullopt;
    }

    std::optional<RelayerState> state;
    if (data)
        state = parseRelayerState(address, *data);
    if (!state)
    {
        byAddress_.erase(address);
        return std::nullopt;
    }

    auto relayer = Relayer::fromState(*state);
    byAddress_[address] = CachedRelayer{relayer, clock_.now()};
    return relayer;
}

std::vector<Relayer>
RelayerRegistry::getFilteredRelayers(RelayerFilter const& filter)
{
    auto relayers = getActiveRelayers();
    relayers.erase(
        std::remove_if(
            relayers.begin(),
            relayers.end(),
            [&](Relayer const& r) { return !filter.matches(r); }),
        relayers.end());
    return relayers;
}

std::vector<Relayer>
RelayerRegistry::sortedRelayers(
    RelayerOrder order,
    RelayerFilter const& filter,
    std::size_t limit)
{
    auto relayers = getFilteredRelayers(filter);
    std::stable_sort(relayers.begin(), relayers.end(), comparator(order));
    if (limit != 0 && relayers.size() > limit)
        relayers.resize(limit);
    return relayers;
}

double
RelayerRegistry::score(Relayer const& relayer) const
{
    auto const& w = config_.scoring;

    double const responsePenalty = relayer.responseTimeMs
        ? std::min(
              w.responseCap,
              std::floor(*relayer.responseTimeMs / w.responseDivisor))
        : w.defaultResponsePenalty;

    return w.base - w.feeWeight * relayer.feePercent +
        relayer.successRate.value_or(w.defaultSuccessRate) - responsePenalty +
        std::min(w.volumeCap, std::floor(relayer.totalVolume));
}

std::optional<Relayer>
RelayerRegistry::getBestRelayer(RelayerFilter const& filter)
{
    std::optional<Relayer> best;
    double bestScore = 0;

    for (auto const& relayer : getFilteredRelayers(filter))
    {
        auto const s = score(relayer);
        if (!best || s > bestScore)
        {
            best = relayer;
            bestScore = s;
        }
    }

    if (best)
    {
        JLOG(j_.debug()) << "Best relayer " << best->address << " score "
                         << bestScore;
    }
    return best;
}

std::optional<std::chrono::milliseconds>
RelayerRegistry::pingRelayer(AccountId const& address)
{
    auto const start = std::chrono::steady_clock::now();
    try
    {
        if (!ledger_.readAccount(address))
            return std::nullopt;
    }
    catch (MixerError const& e)
    {
        if (e.kind() != ErrorKind::NetworkError)
            throw;
        JLOG(j_.debug()) << "Ping of relayer " << address
                         << " failed: " << e.what();
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace zkp
} // namespace veil
