#include <libveil/zkp/MixerConfig.h>

#include <algorithm>
#include <cstdint>

namespace veil {
namespace zkp {

namespace {

template <class Duration>
Duration
getDuration(
    ripple::Section const& section,
    std::string const& name,
    Duration defaultValue)
{
    auto const count = ripple::get<std::int64_t>(
        section, name, static_cast<std::int64_t>(defaultValue.count()));
    if (count < 0)
        return defaultValue;
    return Duration{count};
}

} // namespace

MixerConfig
setup_MixerConfig(ripple::Section const& section)
{
    MixerConfig config;

    config.relayerCacheTtl =
        getDuration(section, "relayer_cache_ttl", config.relayerCacheTtl);
    config.poolCacheTtl =
        getDuration(section, "pool_cache_ttl", config.poolCacheTtl);
    config.treeCacheTtl =
        getDuration(section, "tree_cache_ttl", config.treeCacheTtl);
    config.networkBackoff =
        getDuration(section, "network_backoff_ms", config.networkBackoff);
    config.proofStallWarning =
        getDuration(section, "proof_stall_warning", config.proofStallWarning);

    config.networkRetries = std::max(
        1, ripple::get<int>(section, "network_retries", config.networkRetries));
    config.staleRootRetries = std::max(
        0,
        ripple::get<int>(section, "stale_root_retries", config.staleRootRetries));
    config.proofCacheSize = ripple::get<std::size_t>(
        section, "proof_cache_size", config.proofCacheSize);

    ripple::set(config.provingArtifact, "proving_artifact", section);

    auto& w = config.scoring;
    w.base = ripple::get<double>(section, "score_base", w.base);
    w.feeWeight = ripple::get<double>(section, "score_fee_weight", w.feeWeight);
    w.defaultSuccessRate = ripple::get<double>(
        section, "score_default_success_rate", w.defaultSuccessRate);
    w.responseDivisor = ripple::get<double>(
        section, "score_response_divisor", w.responseDivisor);
    if (w.responseDivisor <= 0)
        w.responseDivisor = ScoringWeights{}.responseDivisor;
    w.responseCap =
        ripple::get<double>(section, "score_response_cap", w.responseCap);
    w.defaultResponsePenalty = ripple::get<double>(
        section, "score_default_response_penalty", w.defaultResponsePenalty);
    w.volumeCap = ripple::get<double>(section, "score_volume_cap", w.volumeCap);

    return config;
}

} // namespace zkp
} // namespace veil
