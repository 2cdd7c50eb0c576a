#include <libveil/zkp/MixerConfig.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/beast/unit_test.h>

namespace veil {
namespace zkp {

class MixerConfig_test : public beast::unit_test::suite
{
public:
    void
    run() override
    {
        testDefaults();
        testOverrides();
        testMalformedValues();
    }

    void
    testDefaults()
    {
        testcase("Defaults");

        auto const config = setup_MixerConfig(ripple::Section("veil"));
        BEAST_EXPECT(config.relayerCacheTtl == std::chrono::seconds{60});
        BEAST_EXPECT(config.poolCacheTtl == std::chrono::seconds{60});
        BEAST_EXPECT(config.treeCacheTtl == std::chrono::seconds{5});
        BEAST_EXPECT(config.networkRetries == 3);
        BEAST_EXPECT(config.networkBackoff == std::chrono::milliseconds{200});
        BEAST_EXPECT(config.staleRootRetries == 3);
        BEAST_EXPECT(config.proofStallWarning == std::chrono::seconds{30});
        BEAST_EXPECT(config.proofCacheSize == 16);
        BEAST_EXPECT(config.provingArtifact == "withdraw");
        BEAST_EXPECT(config.scoring.base == 100);
        BEAST_EXPECT(config.scoring.feeWeight == 10);
        BEAST_EXPECT(config.scoring.volumeCap == 10);
    }

    void
    testOverrides()
    {
        testcase("Overrides");

        ripple::Section section("veil");
        section.set("relayer_cache_ttl", "120");
        section.set("tree_cache_ttl", "0");
        section.set("network_retries", "5");
        section.set("network_backoff_ms", "50");
        section.set("stale_root_retries", "1");
        section.set("proof_cache_size", "0");
        section.set("proving_artifact", "withdraw_depth20");
        section.set("score_fee_weight", "2.5");
        section.set("score_volume_cap", "0");

        auto const config = setup_MixerConfig(section);
        BEAST_EXPECT(config.relayerCacheTtl == std::chrono::seconds{120});
        BEAST_EXPECT(config.poolCacheTtl == std::chrono::seconds{60});
        BEAST_EXPECT(config.treeCacheTtl == std::chrono::seconds{0});
        BEAST_EXPECT(config.networkRetries == 5);
        BEAST_EXPECT(config.networkBackoff == std::chrono::milliseconds{50});
        BEAST_EXPECT(config.staleRootRetries == 1);
        BEAST_EXPECT(config.proofCacheSize == 0);
        BEAST_EXPECT(config.provingArtifact == "withdraw_depth20");
        BEAST_EXPECT(config.scoring.feeWeight == 2.5);
        BEAST_EXPECT(config.scoring.volumeCap == 0);
    }

    void
    testMalformedValues()
    {
        testcase("Malformed Values Keep Defaults");

        ripple::Section section("veil");
        section.set("relayer_cache_ttl", "-4");
        section.set("network_retries", "0");
        section.set("stale_root_retries", "-1");
        section.set("pool_cache_ttl", "soon");
        section.set("score_response_divisor", "0");

        auto const config = setup_MixerConfig(section);
        BEAST_EXPECT(config.relayerCacheTtl == std::chrono::seconds{60});
        BEAST_EXPECT(config.networkRetries == 1);
        BEAST_EXPECT(config.staleRootRetries == 0);
        BEAST_EXPECT(config.poolCacheTtl == std::chrono::seconds{60});
        BEAST_EXPECT(config.scoring.responseDivisor == 20);
    }
};

BEAST_DEFINE_TESTSUITE(MixerConfig, zkp, veil);

} // namespace zkp
} // namespace veil
