#include <libveil/zkp/MixerError.h>
#include <libveil/zkp/Note.h>

#include <xrpl/basics/contract.h>
#include <xrpl/beast/utility/rngfill.h>
#include <xrpl/crypto/csprng.h>

#include <openssl/sha.h>

#include <algorithm>
#include <charconv>
#include <cstring>

namespace veil {
namespace zkp {

namespace {

char const notePrefix[] = "veil";
char const noteTag[] = "note";
char const delimiter = '-';

[[noreturn]] void
badNote(std::string const& what)
{
    ripple::Throw<MixerError>(ErrorKind::InvalidNoteFormat, what);
}

std::vector<std::string>
splitFields(std::string const& text)
{
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true)
    {
        auto const pos = text.find(delimiter, start);
        if (pos == std::string::npos)
        {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

uint256
parseHash(std::string const& field, char const* name)
{
    uint256 value;
    if (!value.parseHex(field))
        badNote(std::string("bad ") + name + " field");
    return value;
}

template <class Integer>
Integer
parseNumber(std::string const& field, char const* name)
{
    Integer value{};
    auto const* first = field.data();
    auto const* last = field.data() + field.size();
    auto const [ptr, ec] = std::from_chars(first, last, value);
    if (field.empty() || ec != std::errc() || ptr != last)
        badNote(std::string("bad ") + name + " field");
    return value;
}

} // namespace

std::string
to_string(TokenType token)
{
    switch (token)
    {
        case TokenType::SOL:
            return "SOL";
        case TokenType::USDC:
            return "USDC";
    }
    return "UNKNOWN";
}

std::optional<TokenType>
parseTokenType(std::string const& text)
{
    if (text == "SOL")
        return TokenType::SOL;
    if (text == "USDC")
        return TokenType::USDC;
    return std::nullopt;
}

unsigned
decimals(TokenType token)
{
    return token == TokenType::USDC ? 6 : 9;
}

std::vector<std::uint64_t> const&
standardDenominations(TokenType token)
{
    // 0.1, 1, 10, 100 SOL
    static std::vector<std::uint64_t> const sol{
        100'000'000ULL,
        1'000'000'000ULL,
        10'000'000'000ULL,
        100'000'000'000ULL};
    // 0.1, 1, 10, 100, 1000 USDC
    static std::vector<std::uint64_t> const usdc{
        100'000ULL,
        1'000'000ULL,
        10'000'000ULL,
        100'000'000ULL,
        1'000'000'000ULL};
    return token == TokenType::USDC ? usdc : sol;
}

bool
isStandardDenomination(TokenType token, std::uint64_t amount)
{
    auto const& all = standardDenominations(token);
    return std::find(all.begin(), all.end(), amount) != all.end();
}

uint256
generateSecret()
{
    uint256 result;
    beast::rngfill(result.data(), uint256::bytes, ripple::crypto_prng());
    return result;
}

uint256
generateNullifierPreimage()
{
    uint256 result;
    beast::rngfill(result.data(), uint256::bytes, ripple::crypto_prng());
    return result;
}

uint256
computeCommitment(
    uint256 const& secret,
    uint256 const& nullifier,
    std::optional<AccountId> const& recipient)
{
    std::uint8_t input[96] = {};

    std::memcpy(input, secret.data(), 32);
    std::memcpy(input + 32, nullifier.data(), 32);
    if (recipient)
        std::memcpy(input + 64, recipient->data(), 32);

    uint256 result;
    SHA256(input, sizeof(input), result.data());
    return result;
}

uint256
computeNullifierHash(uint256 const& nullifier, uint256 const& domainTag)
{
    std::uint8_t input[64];

    std::memcpy(input, nullifier.data(), 32);
    std::memcpy(input + 32, domainTag.data(), 32);

    uint256 result;
    SHA256(input, sizeof(input), result.data());
    return result;
}

DepositNote
DepositNote::create(
    AccountId const& poolId,
    TokenType tokenType,
    std::uint64_t denomination,
    std::optional<AccountId> const& recipient,
    std::uint64_t timestamp)
{
    DepositNote note;
    note.poolId = poolId;
    note.tokenType = tokenType;
    note.denomination = denomination;
    note.secret = generateSecret();
    note.nullifier = generateNullifierPreimage();
    note.timestamp = timestamp;
    note.recipient = recipient;
    return note;
}

uint256
DepositNote::commitment() const
{
    return computeCommitment(secret, nullifier, recipient);
}

uint256
DepositNote::nullifierHash() const
{
    return computeNullifierHash(nullifier, poolId);
}

std::string
DepositNote::encode() const
{
    std::string out;
    out.reserve(300);

    auto append = [&out](std::string const& field) {
        out += delimiter;
        out += field;
    };

    out += notePrefix;
    append(noteTag);
    append("v" + std::to_string(version()));
    append(to_string(poolId));
    append(to_string(tokenType));
    append(std::to_string(denomination));
    append(to_string(secret));
    append(to_string(nullifier));
    append(std::to_string(timestamp));
    if (leafIndex)
        append(std::to_string(*leafIndex));
    if (recipient)
        append(to_string(*recipient));

    return out;
}

DepositNote
DepositNote::decode(std::string const& text)
{
    auto const fields = splitFields(text);

    // prefix, tag, version and the six fixed fields
    if (fields.size() < 9)
        badNote("too few fields");

    if (fields[0] != notePrefix || fields[1] != noteTag)
        badNote("missing note prefix");

    auto const& versionField = fields[2];
    if (versionField.size() < 2 || versionField[0] != 'v')
        badNote("missing version");
    auto const version =
        parseNumber<unsigned>(versionField.substr(1), "version");
    if (version < minVersion || version > maxVersion)
        badNote("unsupported version " + versionField);

    std::size_t const fixedFields = version == 1 ? 9 : 10;
    if (fields.size() != fixedFields && fields.size() != fixedFields + 1)
        badNote("wrong field count for " + versionField);

    DepositNote note;
    note.poolId = parseHash(fields[3], "pool");

    auto const token = parseTokenType(fields[4]);
    if (!token)
        badNote("unknown token type " + fields[4]);
    note.tokenType = *token;

    note.denomination = parseNumber<std::uint64_t>(fields[5], "denomination");
    if (note.denomination == 0)
        badNote("zero denomination");

    note.secret = parseHash(fields[6], "secret");
    note.nullifier = parseHash(fields[7], "nullifier");
    note.timestamp = parseNumber<std::uint64_t>(fields[8], "timestamp");

    if (version >= 2)
        note.leafIndex = parseNumber<std::uint64_t>(fields[9], "leaf index");

    if (fields.size() == fixedFields + 1)
        note.recipient = parseHash(fields[fixedFields], "recipient");

    return note;
}

} // namespace zkp
} // namespace veil
