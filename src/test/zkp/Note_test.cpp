#include <test/zkp/MixerFixtures.h>

#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/Note.h>

#include <xrpl/beast/unit_test.h>

#include <limits>
#include <set>
#include <string>

namespace veil {
namespace zkp {

class Note_test : public beast::unit_test::suite
{
    static DepositNote
    sampleNote()
    {
        return DepositNote::create(
            test::account("pool"),
            TokenType::SOL,
            1'000'000'000,
            std::nullopt,
            1700000000);
    }

public:
    void
    run() override
    {
        testRoundTrip();
        testMalformed();
        testCommitment();
        testCommitmentUniqueness();
        testNullifierHash();
        testDenominations();
        testErrorClassification();
    }

    void
    testRoundTrip()
    {
        testcase("Note Encode/Decode Round Trip");

        auto note = sampleNote();
        auto const v1 = note.encode();
        BEAST_EXPECT(v1.rfind("veil-note-v1-", 0) == 0);
        BEAST_EXPECT(DepositNote::decode(v1) == note);

        note.recipient = test::account("alice");
        BEAST_EXPECT(DepositNote::decode(note.encode()) == note);

        note.leafIndex = 42;
        auto const v2 = note.encode();
        BEAST_EXPECT(v2.rfind("veil-note-v2-", 0) == 0);
        auto const decoded = DepositNote::decode(v2);
        BEAST_EXPECT(decoded == note);
        BEAST_EXPECT(decoded.leafIndex && *decoded.leafIndex == 42);
        BEAST_EXPECT(decoded.commitment() == note.commitment());

        note.recipient.reset();
        BEAST_EXPECT(DepositNote::decode(note.encode()) == note);

        auto usdc = DepositNote::create(
            test::account("usdc"), TokenType::USDC, 100'000, std::nullopt, 0);
        BEAST_EXPECT(DepositNote::decode(usdc.encode()) == usdc);

        // Timestamps never carry a sign that would split the field
        usdc.timestamp = std::numeric_limits<std::uint64_t>::max();
        auto const late = usdc.encode();
        BEAST_EXPECT(
            late.find("-18446744073709551615") != std::string::npos);
        BEAST_EXPECT(DepositNote::decode(late) == usdc);
    }

    void
    testMalformed()
    {
        testcase("Malformed Notes");

        auto const good = sampleNote().encode();

        auto rejected = [&](std::string const& text) {
            return test::errorKindOf([&] { DepositNote::decode(text); }) ==
                ErrorKind::InvalidNoteFormat;
        };

        BEAST_EXPECT(rejected(""));
        BEAST_EXPECT(rejected("veil-note-v1"));
        BEAST_EXPECT(rejected("tornado" + good.substr(4)));
        BEAST_EXPECT(rejected("veil-note-v9" + good.substr(12)));
        BEAST_EXPECT(rejected("veil-note-vx" + good.substr(12)));
        BEAST_EXPECT(rejected(good + "-extra-field"));
        BEAST_EXPECT(rejected(good.substr(0, good.rfind('-'))));

        auto note = sampleNote();
        auto text = note.encode();
        auto const token = text.find("-SOL-");
        BEAST_EXPECT(token != std::string::npos);
        BEAST_EXPECT(rejected(
            text.substr(0, token) + "-DOGE-" + text.substr(token + 5)));

        auto const denom = std::to_string(note.denomination);
        auto const at = text.find("-" + denom + "-");
        BEAST_EXPECT(rejected(
            text.substr(0, at) + "-0-" + text.substr(at + denom.size() + 2)));
        BEAST_EXPECT(rejected(
            text.substr(0, at) + "-12a-" + text.substr(at + denom.size() + 2)));

        // A secret that is not 64 hex digits
        auto const secretHex = to_string(note.secret);
        auto const s = text.find(secretHex);
        BEAST_EXPECT(rejected(
            text.substr(0, s) + "zz" + text.substr(s + 2)));

        // Signed timestamps
        auto const ts = text.find("-1700000000");
        BEAST_EXPECT(ts != std::string::npos);
        BEAST_EXPECT(rejected(
            text.substr(0, ts) + "-+1700000000" + text.substr(ts + 11)));
        BEAST_EXPECT(rejected(
            text.substr(0, ts) + "--1700000000" + text.substr(ts + 11)));

        // v2 requires the leaf index field
        auto v2 = text;
        v2.replace(0, 12, "veil-note-v2");
        BEAST_EXPECT(rejected(v2));
    }

    void
    testCommitment()
    {
        testcase("Commitment Determinism");

        auto const secret = generateSecret();
        auto const nullifier = generateNullifierPreimage();
        BEAST_EXPECT(secret != nullifier);

        auto const cm = computeCommitment(secret, nullifier);
        BEAST_EXPECT(cm == computeCommitment(secret, nullifier));
        BEAST_EXPECT(cm == computeCommitment(secret, nullifier, std::nullopt));

        // Every input takes part
        BEAST_EXPECT(cm != computeCommitment(nullifier, secret));
        BEAST_EXPECT(
            cm != computeCommitment(generateSecret(), nullifier));
        BEAST_EXPECT(
            cm != computeCommitment(secret, generateNullifierPreimage()));

        auto const alice = test::account("alice");
        auto const bound = computeCommitment(secret, nullifier, alice);
        BEAST_EXPECT(bound != cm);
        BEAST_EXPECT(
            bound != computeCommitment(secret, nullifier, test::account("bob")));

        // An all-zero recipient is the same as no recipient
        BEAST_EXPECT(cm == computeCommitment(secret, nullifier, AccountId{}));
    }

    void
    testCommitmentUniqueness()
    {
        testcase("Commitment Uniqueness");

        std::set<uint256> commitments;
        std::set<uint256> nullifiers;
        for (int i = 0; i < 10000; ++i)
        {
            auto const note = sampleNote();
            commitments.insert(note.commitment());
            nullifiers.insert(note.nullifierHash());
        }
        BEAST_EXPECT(commitments.size() == 10000);
        BEAST_EXPECT(nullifiers.size() == 10000);
    }

    void
    testNullifierHash()
    {
        testcase("Nullifier Hash Domain Separation");

        auto const nullifier = generateNullifierPreimage();
        auto const poolA = test::account("pool-a");
        auto const poolB = test::account("pool-b");

        auto const nfA = computeNullifierHash(nullifier, poolA);
        BEAST_EXPECT(nfA == computeNullifierHash(nullifier, poolA));
        BEAST_EXPECT(nfA != computeNullifierHash(nullifier, poolB));
        BEAST_EXPECT(nfA != nullifier);

        auto note = sampleNote();
        BEAST_EXPECT(
            note.nullifierHash() ==
            computeNullifierHash(note.nullifier, note.poolId));

        // The recipient binds the commitment, not the nullifier
        auto const before = note.nullifierHash();
        note.recipient = test::account("carol");
        BEAST_EXPECT(note.nullifierHash() == before);
    }

    void
    testDenominations()
    {
        testcase("Token Denominations");

        BEAST_EXPECT(decimals(TokenType::SOL) == 9);
        BEAST_EXPECT(decimals(TokenType::USDC) == 6);

        BEAST_EXPECT(isStandardDenomination(TokenType::SOL, 100'000'000));
        BEAST_EXPECT(isStandardDenomination(TokenType::SOL, 100'000'000'000));
        BEAST_EXPECT(!isStandardDenomination(TokenType::SOL, 5'000'000'000));
        BEAST_EXPECT(isStandardDenomination(TokenType::USDC, 1'000'000'000));
        BEAST_EXPECT(!isStandardDenomination(TokenType::USDC, 100'000'000'000));
        BEAST_EXPECT(standardDenominations(TokenType::USDC).size() == 5);

        BEAST_EXPECT(parseTokenType("SOL") == TokenType::SOL);
        BEAST_EXPECT(parseTokenType("USDC") == TokenType::USDC);
        BEAST_EXPECT(!parseTokenType("sol"));
        BEAST_EXPECT(to_string(TokenType::USDC) == "USDC");
    }

    void
    testErrorClassification()
    {
        testcase("Error Classification");

        BEAST_EXPECT(isFatal(ErrorKind::AlreadySpent));
        BEAST_EXPECT(isFatal(ErrorKind::InvalidNoteFormat));
        BEAST_EXPECT(isFatal(ErrorKind::InvalidFee));
        BEAST_EXPECT(isTransient(ErrorKind::NetworkError));
        BEAST_EXPECT(isTransient(ErrorKind::StaleRoot));
        BEAST_EXPECT(isTransient(ErrorKind::WithdrawalInFlight));
        BEAST_EXPECT(!isTransient(ErrorKind::StaleProof));

        auto const context = test::account("nf");
        MixerError const e(ErrorKind::AlreadySpent, "spent", context);
        BEAST_EXPECT(e.kind() == ErrorKind::AlreadySpent);
        BEAST_EXPECT(e.context() == context);
        BEAST_EXPECT(!e.transient());
        BEAST_EXPECT(std::string(e.what()).find("spent") != std::string::npos);
        BEAST_EXPECT(to_string(ErrorKind::StaleRoot) == "StaleRoot");
    }
};

BEAST_DEFINE_TESTSUITE(Note, zkp, veil);

} // namespace zkp
} // namespace veil
