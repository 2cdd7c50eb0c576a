#pragma once

#include <xrpl/basics/BasicConfig.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace veil {
namespace zkp {

/** Coefficients of the relayer score; see RelayerRegistry::score. */
struct ScoringWeights
{
    double base = 100;
    double feeWeight = 10;
    double defaultSuccessRate = 90;
    double responseDivisor = 20;
    double responseCap = 50;
    double defaultResponsePenalty = 25;
    double volumeCap = 10;
};

struct MixerConfig
{
    std::chrono::seconds relayerCacheTtl{60};
    std::chrono::seconds poolCacheTtl{60};
    std::chrono::seconds treeCacheTtl{5};

    int networkRetries = 3;
    std::chrono::milliseconds networkBackoff{200};

    int staleRootRetries = 3;
    std::chrono::seconds proofStallWarning{30};
    std::size_t proofCacheSize = 16;
    std::string provingArtifact = "withdraw";

    ScoringWeights scoring;
};

/**
 * Read the [veil] stanza. Absent or malformed keys keep their defaults.
 */
MixerConfig
setup_MixerConfig(ripple::Section const& section);

} // namespace zkp
} // namespace veil
