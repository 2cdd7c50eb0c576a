#pragma once

#include <libveil/zkp/Types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veil {
namespace zkp {

enum class TokenType : std::uint8_t { SOL = 0, USDC = 1 };

std::string
to_string(TokenType token);

std::optional<TokenType>
parseTokenType(std::string const& text);

/** Number of decimals of the token's base unit. */
unsigned
decimals(TokenType token);

/** The fixed deposit sizes pools are provisioned for, in base units. */
std::vector<std::uint64_t> const&
standardDenominations(TokenType token);

bool
isStandardDenomination(TokenType token, std::uint64_t amount);

/**
 * Random 32-byte values drawn from the process CSPRNG.
 */
uint256
generateSecret();

uint256
generateNullifierPreimage();

/**
 * Compute the deposit commitment:
 * cm = SHA256(secret || nullifier || recipient)
 *
 * Without a recipient the last 32 bytes are zero, which keeps the
 * commitment usable for any withdrawal destination.
 */
uint256
computeCommitment(
    uint256 const& secret,
    uint256 const& nullifier,
    std::optional<AccountId> const& recipient = std::nullopt);

/**
 * Compute the public nullifier hash:
 * nf = SHA256(nullifier || domainTag)
 *
 * The domain tag is the pool id, so a nullifier accepted by one pool can
 * not be replayed against another.
 */
uint256
computeNullifierHash(uint256 const& nullifier, uint256 const& domainTag);

/**
 * Deposit note
 * Everything needed to rebuild the withdrawal inputs for one deposit.
 * The note is handed to the user and never stored by the mixer.
 *
 * String form, '-' delimited:
 *   veil-note-v1-<pool>-<token>-<denomination>-<secret>-<nullifier>-<timestamp>[-<recipient>]
 *   veil-note-v2-<pool>-<token>-<denomination>-<secret>-<nullifier>-<timestamp>-<leafIndex>[-<recipient>]
 */
struct DepositNote
{
    static constexpr unsigned minVersion = 1;
    static constexpr unsigned maxVersion = 2;

    AccountId poolId;
    TokenType tokenType = TokenType::SOL;
    std::uint64_t denomination = 0;
    uint256 secret;
    uint256 nullifier;
    // Unix seconds
    std::uint64_t timestamp = 0;
    std::optional<AccountId> recipient;
    std::optional<std::uint64_t> leafIndex;

    /**
     * Create a note with fresh secret material.
     */
    static DepositNote
    create(
        AccountId const& poolId,
        TokenType tokenType,
        std::uint64_t denomination,
        std::optional<AccountId> const& recipient,
        std::uint64_t timestamp);

    uint256
    commitment() const;

    uint256
    nullifierHash() const;

    /** Version 2 when the leaf index is known, version 1 otherwise. */
    unsigned
    version() const
    {
        return leafIndex ? 2 : 1;
    }

    std::string
    encode() const;

    /**
     * Parse a note string of any supported version.
     * @throws MixerError(InvalidNoteFormat) on any malformed field
     */
    static DepositNote
    decode(std::string const& text);

    bool
    operator==(DepositNote const&) const = default;
};

} // namespace zkp
} // namespace veil
