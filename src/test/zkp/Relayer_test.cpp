#include <test/zkp/MixerFixtures.h>

#include <libveil/zkp/LocalLedger.h>
#include <libveil/zkp/RelayerRegistry.h>

#include <xrpl/beast/clock/manual_clock.h>
#include <xrpl/beast/unit_test.h>

#include <algorithm>

namespace veil {
namespace zkp {

class Relayer_test : public beast::unit_test::suite
{
    using clock_type = beast::manual_clock<std::chrono::steady_clock>;

    static RelayerState
    relayerState(
        char const* label,
        std::uint16_t feeBp,
        std::uint16_t successRate,
        std::uint16_t responseTime,
        std::uint64_t totalRelayed,
        bool active = true)
    {
        RelayerState r;
        r.address = test::account(label);
        r.active = active;
        r.feeBasisPoints = feeBp;
        r.successRate = successRate;
        r.responseTime = responseTime;
        r.totalRelayed = totalRelayed;
        return r;
    }

    // fee 1%, success 99%, 100ms, volume 5
    static RelayerState
    good(char const* label = "good")
    {
        return relayerState(label, 100, 9900, 100, 5'000'000'000);
    }

    // fee 3%, success 80%, 1000ms, volume 0
    static RelayerState
    poor(char const* label = "poor")
    {
        return relayerState(label, 300, 8000, 1000, 0);
    }

    static std::vector<AccountId>
    addresses(std::vector<Relayer> const& relayers)
    {
        std::vector<AccountId> result;
        for (auto const& r : relayers)
            result.push_back(r.address);
        return result;
    }

public:
    void
    run() override
    {
        testDecode();
        testScore();
        testConfiguredWeights();
        testBestRelayer();
        testFilters();
        testSortOrders();
        testCacheTtl();
        testStaleFallback();
        testGetRelayer();
        testPing();
    }

    void
    testDecode()
    {
        testcase("Relayer Record Decoding");

        auto const r = Relayer::fromState(good());
        BEAST_EXPECT(r.active);
        BEAST_EXPECT(r.feePercent == 1.0);
        BEAST_EXPECT(r.totalVolume == 5.0);
        BEAST_EXPECT(r.successRate && *r.successRate == 99.0);
        BEAST_EXPECT(r.responseTimeMs && *r.responseTimeMs == 100);
        BEAST_EXPECT(r.feeFor(1'000'000'000) == 10'000'000);

        auto const fresh = Relayer::fromState(relayerState("new", 50, 0, 0, 0));
        BEAST_EXPECT(!fresh.successRate);
        BEAST_EXPECT(!fresh.responseTimeMs);
    }

    void
    testScore()
    {
        testcase("Relayer Score");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        RelayerRegistry registry(ledger, config, clock, j);

        auto const a = Relayer::fromState(good());
        auto const b = Relayer::fromState(poor());
        BEAST_EXPECT(registry.score(a) == 189);
        BEAST_EXPECT(registry.score(b) == 100);
        BEAST_EXPECT(registry.score(a) > registry.score(b));

        // Unknown metrics take the defaults: 100 - 0 + 90 - 25 + 0
        auto const unknown = Relayer::fromState(relayerState("new", 0, 0, 0, 0));
        BEAST_EXPECT(registry.score(unknown) == 165);

        // The penalty and the bonus are capped and floored
        auto const slow = Relayer::fromState(
            relayerState("slow", 0, 10000, 60000, 500'000'000'000));
        BEAST_EXPECT(registry.score(slow) == 100 + 100 - 50 + 10);
        auto const odd = Relayer::fromState(
            relayerState("odd", 0, 10000, 39, 2'500'000'000));
        BEAST_EXPECT(registry.score(odd) == 100 + 100 - 1 + 2);
    }

    void
    testConfiguredWeights()
    {
        testcase("Configured Score Weights");

        auto const j = test::nullJournal();
        auto config = test::testConfig();
        config.scoring.feeWeight = 0;
        config.scoring.volumeCap = 0;
        clock_type clock;
        LocalLedger ledger(j);
        RelayerRegistry registry(ledger, config, clock, j);

        // 100 - 0 + 99 - 5 + 0
        BEAST_EXPECT(registry.score(Relayer::fromState(good())) == 194);
    }

    void
    testBestRelayer()
    {
        testcase("Best Relayer Selection");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        RelayerRegistry registry(ledger, config, clock, j);

        BEAST_EXPECT(!registry.getBestRelayer());

        ledger.putRelayer(poor());
        ledger.putRelayer(good());
        ledger.putRelayer(relayerState("idle", 0, 10000, 1, 0, false));
        registry.refresh(true);

        auto const best = registry.getBestRelayer();
        BEAST_EXPECT(best && best->address == test::account("good"));

        // Filtered out entirely
        RelayerFilter cheap;
        cheap.maxFeePercent = 0.5;
        BEAST_EXPECT(!registry.getBestRelayer(cheap));

        // Equal scores keep the first relayer listed
        ledger.putRelayer(good("twin-a"));
        ledger.putRelayer(good("twin-b"));
        ledger.putRelayer(good("twin-c"));
        auto const listed = registry.getActiveRelayers(true);
        auto const tie = registry.getBestRelayer();
        BEAST_EXPECT(!listed.empty());
        std::optional<AccountId> firstGood;
        for (auto const& r : listed)
        {
            if (registry.score(r) == 189 && !firstGood)
                firstGood = r.address;
        }
        BEAST_EXPECT(tie && firstGood && tie->address == *firstGood);
    }

    void
    testFilters()
    {
        testcase("Relayer Filters");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        RelayerRegistry registry(ledger, config, clock, j);

        ledger.putRelayer(good());
        ledger.putRelayer(poor());
        ledger.putRelayer(relayerState("new", 50, 0, 0, 0));

        RelayerFilter filter;
        filter.maxFeePercent = 2;
        BEAST_EXPECT(registry.getFilteredRelayers(filter).size() == 2);

        // Unknown success rate fails a minimum
        filter.minSuccessRate = 90;
        auto const reliable = registry.getFilteredRelayers(filter);
        BEAST_EXPECT(reliable.size() == 1);
        BEAST_EXPECT(
            !reliable.empty() && reliable[0].address == test::account("good"));

        RelayerFilter fast;
        fast.maxResponseTimeMs = 500;
        BEAST_EXPECT(registry.getFilteredRelayers(fast).size() == 1);

        BEAST_EXPECT(registry.getFilteredRelayers({}).size() == 3);
    }

    void
    testSortOrders()
    {
        testcase("Relayer Sort Orders");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        RelayerRegistry registry(ledger, config, clock, j);

        ledger.putRelayer(good());
        ledger.putRelayer(poor());
        ledger.putRelayer(relayerState("new", 50, 0, 0, 0));

        auto const good_ = test::account("good");
        auto const poor_ = test::account("poor");
        auto const new_ = test::account("new");

        BEAST_EXPECT(
            (addresses(registry.sortedRelayers(RelayerOrder::LowestFee)) ==
             std::vector<AccountId>{new_, good_, poor_}));
        BEAST_EXPECT(
            (addresses(registry.sortedRelayers(RelayerOrder::MostReliable)) ==
             std::vector<AccountId>{good_, poor_, new_}));
        BEAST_EXPECT(
            (addresses(registry.sortedRelayers(RelayerOrder::Fastest)) ==
             std::vector<AccountId>{good_, poor_, new_}));
        BEAST_EXPECT(
            addresses(registry.sortedRelayers(
                RelayerOrder::HighestVolume, {}, 1)) ==
            std::vector<AccountId>{good_});

        // Equal keys keep the listing order
        ledger.putRelayer(relayerState("same-1", 75, 0, 0, 0));
        ledger.putRelayer(relayerState("same-2", 75, 0, 0, 0));
        ledger.putRelayer(relayerState("same-3", 75, 0, 0, 0));
        auto const listed = registry.getActiveRelayers(true);

        std::vector<AccountId> expected;
        for (auto const& r : listed)
        {
            if (r.feeBasisPoints == 75)
                expected.push_back(r.address);
        }

        RelayerFilter only75;
        only75.maxFeePercent = 0.75;
        auto sorted = addresses(
            registry.sortedRelayers(RelayerOrder::LowestFee, only75));
        sorted.erase(
            std::remove(sorted.begin(), sorted.end(), new_), sorted.end());
        BEAST_EXPECT(sorted == expected);
    }

    void
    testCacheTtl()
    {
        testcase("Relayer Cache TTL");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        test::ScriptedLedger counting(ledger);
        RelayerRegistry registry(counting, config, clock, j);

        ledger.putRelayer(good());
        BEAST_EXPECT(registry.getActiveRelayers().size() == 1);
        BEAST_EXPECT(counting.reads == 1);

        ledger.putRelayer(poor());
        clock.advance(config.relayerCacheTtl - std::chrono::seconds{1});
        BEAST_EXPECT(registry.getActiveRelayers().size() == 1);
        BEAST_EXPECT(counting.reads == 1);

        clock.advance(std::chrono::seconds{1});
        BEAST_EXPECT(registry.getActiveRelayers().size() == 2);
        BEAST_EXPECT(counting.reads == 2);

        BEAST_EXPECT(registry.getActiveRelayers(true).size() == 2);
        BEAST_EXPECT(counting.reads == 3);
    }

    void
    testStaleFallback()
    {
        testcase("Relayer Stale Fallback");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        test::ScriptedLedger flaky(ledger);
        RelayerRegistry registry(flaky, config, clock, j);

        // No prior fetch: an empty list, never an error
        flaky.readFailures = config.networkRetries;
        BEAST_EXPECT(registry.getActiveRelayers().empty());

        ledger.putRelayer(good());
        ledger.putRelayer(poor());
        BEAST_EXPECT(registry.getActiveRelayers(true).size() == 2);

        flaky.readFailures = config.networkRetries;
        auto const stale = registry.getActiveRelayers(true);
        BEAST_EXPECT(stale.size() == 2);
        BEAST_EXPECT(flaky.readFailures == 0);

        // A single transient failure is retried and sees new data
        ledger.putRelayer(relayerState("late", 10, 0, 0, 0));
        flaky.readFailures = 1;
        BEAST_EXPECT(registry.getActiveRelayers(true).size() == 3);
    }

    void
    testGetRelayer()
    {
        testcase("Relayer Lookup");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        test::ScriptedLedger flaky(ledger);
        RelayerRegistry registry(flaky, config, clock, j);

        auto const address = test::account("good");
        BEAST_EXPECT(!registry.getRelayer(address));

        ledger.putRelayer(good());
        auto const first = registry.getRelayer(address);
        BEAST_EXPECT(first && first->feeBasisPoints == 100);

        auto raised = good();
        raised.feeBasisPoints = 150;
        ledger.putRelayer(raised);
        BEAST_EXPECT(registry.getRelayer(address)->feeBasisPoints == 100);
        BEAST_EXPECT(registry.getRelayer(address, true)->feeBasisPoints == 150);

        // Unreachable ledger serves the last record
        clock.advance(config.relayerCacheTtl);
        flaky.readFailures = config.networkRetries;
        auto const cached = registry.getRelayer(address);
        BEAST_EXPECT(cached && cached->feeBasisPoints == 150);

        // Inactive relayers are still returned by address
        ledger.putRelayer(relayerState("idle", 0, 0, 0, 0, false));
        auto const idle = registry.getRelayer(test::account("idle"));
        BEAST_EXPECT(idle && !idle->active);

        // Non-relayer accounts are not relayers
        BEAST_EXPECT(!registry.getRelayer(
            ledger.createPool(100'000, TokenType::USDC, 3)));
    }

    void
    testPing()
    {
        testcase("Relayer Ping");

        auto const j = test::nullJournal();
        auto const config = test::testConfig();
        clock_type clock;
        LocalLedger ledger(j);
        test::ScriptedLedger flaky(ledger);
        RelayerRegistry registry(flaky, config, clock, j);

        ledger.putRelayer(good());
        auto const rtt = registry.pingRelayer(test::account("good"));
        BEAST_EXPECT(rtt && rtt->count() >= 0);
        BEAST_EXPECT(!registry.pingRelayer(test::account("missing")));

        flaky.readFailures = 1;
        BEAST_EXPECT(!registry.pingRelayer(test::account("good")));
    }
};

BEAST_DEFINE_TESTSUITE(Relayer, zkp, veil);

} // namespace zkp
} // namespace veil
